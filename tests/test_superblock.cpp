#include <cassert>
#include <iostream>
#include <vector>

#include "errors.hpp"
#include "image_builder.hpp"
#include "superblock.hpp"

static std::vector<uint8_t> sampleHeader(ImageBuilder& builder) {
  auto image = builder.build();
  return std::vector<uint8_t>(image.begin(), image.begin() + SUPERBLOCK_SIZE);
}

template <typename E>
static bool rejects(const std::vector<uint8_t>& header) {
  try {
    parseSuperblock(header);
  } catch (const E&) {
    return true;
  }
  return false;
}

static void test_fields() {
  ImageBuilder builder;
  builder.root().children.push_back(makeFile("hello.txt", "hello\n"));
  builder.root().children.push_back(makeDir("etc"));
  auto image = builder.build();

  Superblock sb = parseSuperblock(image);
  assert(sb.magic == SQUASHFS_MAGIC);
  assert(sb.versionMajor == 4 && sb.versionMinor == 0);
  assert(sb.blockSize == 4096 && sb.blockLog == 12);
  assert(sb.compressionId == 1);
  assert(sb.inodeCount == 3);
  assert(sb.modificationTime == 1700000000);
  assert(sb.bytesUsed == image.size());
  assert(sb.inodeTableStart == builder.inodeTableStart);
  assert(sb.directoryTableStart == builder.directoryTableStart);
  assert(sb.idTableStart == builder.idTableStart);
  assert(sb.rootInodeRef == builder.rootRef);
  assert(sb.hasFragmentTable());
  assert(sb.fragmentEntryCount == 1);
  assert(!sb.hasXattrTable());
  assert(!sb.hasExportTable());
  assert(sb.hasFlag(FLAG_NO_XATTRS));
  assert(!sb.hasFlag(FLAG_UNCOMPRESSED_DATA));

  // The inode table ends where the directory table starts.
  assert(sb.regionEnd(sb.inodeTableStart) == sb.directoryTableStart);
  assert(sb.regionEnd(sb.idTableStart) == sb.bytesUsed);
}

static void test_magic_rejection() {
  ImageBuilder builder;
  auto header = sampleHeader(builder);

  auto bad = header;
  bad[0] = 'x';
  assert(rejects<NotAnImage>(bad));

  assert(rejects<NotAnImage>(std::vector<uint8_t>{'h', 's'}));
  assert(rejects<NotAnImage>(std::vector<uint8_t>()));

  // Correct magic but cut short.
  std::vector<uint8_t> shortHeader(header.begin(), header.begin() + 50);
  assert(rejects<NotAnImage>(shortHeader));
}

static void test_version() {
  ImageBuilder builder;
  auto header = sampleHeader(builder);
  patchLe16(header, 28, 3);
  patchLe16(header, 30, 1);
  try {
    parseSuperblock(header);
    assert(false);
  } catch (const UnsupportedVersion& e) {
    assert(e.major() == 3);
    assert(e.minor() == 1);
  }
}

static void test_block_size_consistency() {
  ImageBuilder builder;
  auto header = sampleHeader(builder);

  auto mismatch = header;
  patchLe16(mismatch, 22, 12);
  patchLe32(mismatch, 12, 4097);
  assert(rejects<CorruptSuperblock>(mismatch));

  auto tooSmall = header;
  patchLe16(tooSmall, 22, 11);
  patchLe32(tooSmall, 12, 2048);
  assert(rejects<CorruptSuperblock>(tooSmall));

  auto tooLarge = header;
  patchLe16(tooLarge, 22, 21);
  patchLe32(tooLarge, 12, 1u << 21);
  assert(rejects<CorruptSuperblock>(tooLarge));

  auto hugeLog = header;
  patchLe16(hugeLog, 22, 40);
  assert(rejects<CorruptSuperblock>(hugeLog));

  auto largest = header;
  patchLe16(largest, 22, 20);
  patchLe32(largest, 12, 1u << 20);
  assert(parseSuperblock(largest).blockSize == (1u << 20));
}

static void test_table_order() {
  ImageBuilder builder;
  auto header = sampleHeader(builder);
  uint64_t inodeStart = read_le64(header, 64);
  patchLe64(header, 72, inodeStart);
  assert(rejects<CorruptSuperblock>(header));
}

static void test_names() {
  assert(compressionName(1) == "GZIP");
  assert(compressionName(4) == "XZ");
  assert(compressionName(6) == "ZSTD");
  assert(compressionName(99) == "Unknown (99)");
  assert(!compressionDescription(2).empty());
  assert(compressionDescription(99).empty());

  auto flags = flagNames(FLAG_UNCOMPRESSED_INODES | FLAG_NO_FRAGMENTS);
  assert(flags.size() == 2);
  assert(flags[0].first == FLAG_UNCOMPRESSED_INODES);
  assert(flags[0].second == "UNCOMPRESSED_INODES");
  assert(flags[1].second == "NO_FRAGMENTS");
  assert(flagNames(0).empty());
}

int main() {
  test_fields();
  test_magic_rejection();
  test_version();
  test_block_size_consistency();
  test_table_order();
  test_names();

  std::cout << "superblock ok" << std::endl;
  return 0;
}
