#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "errors.hpp"
#include "image_builder.hpp"
#include "superblock.hpp"
#include "tables.hpp"

struct OpenedImage {
  ImageFile image;
  std::shared_ptr<CodecRegistry> codecs = CodecRegistry::withDefaults();
  Superblock sb;
  MetadataBlockStore store;

  explicit OpenedImage(const std::filesystem::path& path)
      : image(path),
        sb(parseSuperblock(image.read(0, SUPERBLOCK_SIZE))),
        store(image, *codecs, sb.compressionId) {}
};

static void test_id_table() {
  ImageBuilder builder;
  TestNode file = makeFile("owned", "data");
  file.uid = 1000;
  file.gid = 100;
  builder.root().children.push_back(file);
  OpenedImage opened(writeTempImage("tables_ids", builder.build()));

  IdTable ids = IdTable::load(opened.image, opened.store, opened.sb);
  assert(ids.size() == 3);
  assert(ids.lookup(0) == 0);
  assert(ids.lookup(1) == 1000);
  assert(ids.lookup(2) == 100);
  assert((ids.ids() == std::vector<uint32_t>{0, 1000, 100}));

  bool threw = false;
  try {
    ids.lookup(3);
  } catch (const CorruptBlock& e) {
    threw = e.offset() == opened.sb.idTableStart;
  }
  assert(threw);
}

// More ids than one metadata block holds.
static void test_id_table_spans_blocks() {
  ImageBuilder builder;
  for (uint32_t i = 0; i < 2100; ++i) {
    TestNode file = makeFile("u" + std::to_string(i), std::vector<uint8_t>());
    file.uid = 5000 + i;
    builder.root().children.push_back(file);
  }
  OpenedImage opened(writeTempImage("tables_many_ids", builder.build()));
  assert(opened.sb.idCount == 2101);

  IdTable ids = IdTable::load(opened.image, opened.store, opened.sb);
  assert(ids.size() == 2101);
  assert(ids.lookup(0) == 0);
  // Root comes first, then the files in the order they were added.
  assert(ids.lookup(1) == 5000);
  assert(ids.lookup(2050) == 5000 + 2049);
  assert(ids.lookup(2100) == 5000 + 2099);
}

static void test_fragment_table() {
  ImageBuilder builder;
  builder.root().children.push_back(makeFile("a", textBytes(100)));
  builder.root().children.push_back(makeFile("b", textBytes(200)));
  builder.root().children.push_back(makeFile("c", textBytes(4096)));
  OpenedImage opened(writeTempImage("tables_fragments", builder.build()));

  FragmentTable fragments = FragmentTable::load(opened.image, opened.store, opened.sb);
  assert(fragments.size() == 1);
  const FragmentEntry& entry = fragments.at(0);
  assert(entry.start >= SUPERBLOCK_SIZE);
  assert(entry.start < opened.sb.inodeTableStart);
  assert(entry.onDiskSize() > 0);
  assert(!entry.uncompressed());

  bool threw = false;
  try {
    fragments.at(1);
  } catch (const CorruptBlock& e) {
    threw = e.offset() == opened.sb.fragmentTableStart;
  }
  assert(threw);
}

static void test_fragment_table_spans_blocks() {
  ImageBuilder builder;
  // Each 3000-byte tail fills most of a fragment block on its own.
  for (int i = 0; i < 600; ++i) {
    builder.root().children.push_back(makeFile("f" + std::to_string(i), textBytes(3000, "frag" + std::to_string(i))));
  }
  OpenedImage opened(writeTempImage("tables_many_fragments", builder.build()));
  assert(opened.sb.fragmentEntryCount == 600);

  FragmentTable fragments = FragmentTable::load(opened.image, opened.store, opened.sb);
  assert(fragments.size() == 600);
  for (size_t i = 1; i < fragments.size(); ++i) {
    assert(fragments.at(static_cast<uint32_t>(i)).start > fragments.at(static_cast<uint32_t>(i - 1)).start);
  }
}

static void test_no_fragments() {
  ImageOptions options;
  options.fragments = false;
  ImageBuilder builder(options);
  builder.root().children.push_back(makeFile("a", textBytes(100)));
  OpenedImage opened(writeTempImage("tables_no_fragments", builder.build()));

  assert(!opened.sb.hasFragmentTable());
  assert(opened.sb.hasFlag(FLAG_NO_FRAGMENTS));
  FragmentTable fragments = FragmentTable::load(opened.image, opened.store, opened.sb);
  assert(fragments.size() == 0);
}

static void test_uncompressed_tables() {
  ImageOptions options;
  options.compress = false;
  ImageBuilder builder(options);
  TestNode file = makeFile("a", textBytes(10));
  file.gid = 42;
  builder.root().children.push_back(file);
  OpenedImage opened(writeTempImage("tables_uncompressed", builder.build()));

  IdTable ids = IdTable::load(opened.image, opened.store, opened.sb);
  assert((ids.ids() == std::vector<uint32_t>{0, 42}));
  FragmentTable fragments = FragmentTable::load(opened.image, opened.store, opened.sb);
  assert(fragments.size() == 1);
  assert(fragments.at(0).uncompressed());
  assert(fragments.at(0).onDiskSize() == 10);
}

int main() {
  test_id_table();
  test_id_table_spans_blocks();
  test_fragment_table();
  test_fragment_table_spans_blocks();
  test_no_fragments();
  test_uncompressed_tables();

  std::cout << "tables ok" << std::endl;
  return 0;
}
