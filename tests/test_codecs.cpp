#include <algorithm>
#include <cassert>
#include <iostream>
#include <vector>

#include "codec_registry.hpp"
#include "codecs.hpp"
#include "errors.hpp"
#include "image_builder.hpp"

// Codecs this build registers and the image builder can produce.
static std::vector<CompressionId> builtCodecs() {
  std::vector<CompressionId> ids = {CompressionId::GZIP, CompressionId::LZMA, CompressionId::XZ};
#ifdef SQUASHDIG_HAVE_LZ4
  ids.push_back(CompressionId::LZ4);
#endif
#ifdef SQUASHDIG_HAVE_ZSTD
  ids.push_back(CompressionId::ZSTD);
#endif
  return ids;
}

static void test_default_registry() {
  auto registry = CodecRegistry::withDefaults();
  assert(registry->supports(static_cast<uint16_t>(CompressionId::GZIP)));
  assert(registry->supports(static_cast<uint16_t>(CompressionId::LZMA)));
  assert(registry->supports(static_cast<uint16_t>(CompressionId::XZ)));
  assert(!registry->supports(static_cast<uint16_t>(CompressionId::LZO)));
  assert(!registry->supports(0));
#ifdef SQUASHDIG_HAVE_LZ4
  assert(registry->supports(static_cast<uint16_t>(CompressionId::LZ4)));
  assert(registry->get(static_cast<uint16_t>(CompressionId::LZ4)).name() == "LZ4");
#endif
#ifdef SQUASHDIG_HAVE_ZSTD
  assert(registry->supports(static_cast<uint16_t>(CompressionId::ZSTD)));
  assert(registry->get(static_cast<uint16_t>(CompressionId::ZSTD)).name() == "ZSTD");
#endif

  auto names = registry->names();
  assert(std::find(names.begin(), names.end(), "GZIP") != names.end());
  assert(std::find(names.begin(), names.end(), "XZ") != names.end());

  bool threw = false;
  try {
    registry->get(static_cast<uint16_t>(CompressionId::LZO));
  } catch (const UnsupportedCodec& e) {
    threw = true;
    assert(e.codecId() == 3);
  }
  assert(threw);
}

static void test_round_trip(CompressionId id) {
  auto registry = CodecRegistry::withDefaults();
  uint16_t raw = static_cast<uint16_t>(id);
  auto plain = textBytes(6000);
  auto packed = compressWith(raw, plain);
  assert(packed.size() < plain.size());

  auto out = registry->decompress(raw, packed, 8192);
  assert(out == plain);

  // Exactly the size of the output still fits.
  out = registry->decompress(raw, packed, plain.size());
  assert(out == plain);
}

static void test_output_limit(CompressionId id) {
  auto registry = CodecRegistry::withDefaults();
  uint16_t raw = static_cast<uint16_t>(id);
  auto packed = compressWith(raw, textBytes(5000));
  bool threw = false;
  try {
    registry->decompress(raw, packed, 4096);
  } catch (const DecompressError&) {
    threw = true;
  }
  assert(threw);
}

static void test_garbage_input() {
  auto registry = CodecRegistry::withDefaults();
  // 0xFF fails the zlib header check, the LZMA properties byte, the XZ and
  // ZSTD magics, and runs an LZ4 literal length past the end of the input.
  std::vector<uint8_t> junk(300, 0xFF);
  for (auto id : builtCodecs()) {
    bool threw = false;
    try {
      registry->decompress(static_cast<uint16_t>(id), junk, 8192);
    } catch (const DecompressError&) {
      threw = true;
    }
    assert(threw);
  }
}

static void test_custom_registry() {
  CodecRegistry registry;
  assert(!registry.supports(1));
  assert(registry.names().empty());
  registry.registerCodec(makeGzipCodec());
  assert(registry.supports(1));
  assert(registry.get(1).name() == "GZIP");

  bool threw = false;
  try {
    registry.decompress(static_cast<uint16_t>(CompressionId::XZ), textBytes(10), 100);
  } catch (const UnsupportedCodec& e) {
    threw = true;
    assert(e.codecId() == 4);
  }
  assert(threw);
}

int main() {
  test_default_registry();
  for (auto id : builtCodecs()) {
    test_round_trip(id);
    test_output_limit(id);
  }
  test_garbage_input();
  test_custom_registry();

  std::cout << "codecs ok" << std::endl;
  return 0;
}
