#include "codec_registry.hpp"
#include "codecs.hpp"
#include "errors.hpp"

std::shared_ptr<CodecRegistry> CodecRegistry::withDefaults() {
    auto registry = std::make_shared<CodecRegistry>();
    registry->registerCodec(makeGzipCodec());
    registry->registerCodec(makeLzmaCodec());
    registry->registerCodec(makeXzCodec());
#ifdef SQUASHDIG_HAVE_LZ4
    registry->registerCodec(makeLz4Codec());
#endif
#ifdef SQUASHDIG_HAVE_ZSTD
    registry->registerCodec(makeZstdCodec());
#endif
    return registry;
}

void CodecRegistry::registerCodec(std::unique_ptr<BaseCodec> codec) {
    uint16_t id = codec->id();
    codecs[id] = std::move(codec);
}

bool CodecRegistry::supports(uint16_t id) const {
    return codecs.count(id) != 0;
}

const BaseCodec& CodecRegistry::get(uint16_t id) const {
    auto it = codecs.find(id);
    if (it == codecs.end()) {
        throw UnsupportedCodec(id);
    }
    return *it->second;
}

std::vector<uint8_t> CodecRegistry::decompress(uint16_t id, const uint8_t* data, size_t len, size_t maxOutput) const {
    return get(id).decompress(data, len, maxOutput);
}

std::vector<std::string> CodecRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& entry : codecs) {
        result.push_back(entry.second->name());
    }
    return result;
}
