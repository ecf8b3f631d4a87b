#include <cassert>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "directory.hpp"
#include "errors.hpp"
#include "image_builder.hpp"
#include "inode.hpp"
#include "path_resolver.hpp"
#include "superblock.hpp"

struct OpenedImage {
  ImageFile image;
  std::shared_ptr<CodecRegistry> codecs = CodecRegistry::withDefaults();
  Superblock sb;
  MetadataBlockStore store;
  InodeDecoder decoder;
  DirectoryReader reader;
  PathResolver resolver;

  explicit OpenedImage(const std::filesystem::path& path)
      : image(path),
        sb(parseSuperblock(image.read(0, SUPERBLOCK_SIZE))),
        store(image, *codecs, sb.compressionId),
        decoder(store, sb),
        reader(store, sb),
        resolver(decoder, reader, sb.rootInodeRef) {}

  Inode root() const { return decoder.decode(sb.rootInodeRef); }
};

static std::filesystem::path sampleTree() {
  ImageBuilder builder;
  auto& root = builder.root().children;
  root.push_back(makeDir("a", {makeDir("b", {makeFile("c", "leaf\n")}), makeFile("note", "n")}));
  root.push_back(makeFile("readme", "hello"));
  root.push_back(makeSymlink("link", "a/b/c"));
  root.push_back(makeDir("empty"));
  return writeTempImage("directory_tree", builder.build());
}

static void test_listing() {
  OpenedImage opened(sampleTree());
  auto entries = opened.reader.entries(opened.root());
  assert(entries.size() == 4);
  assert(entries[0].name == "a" && entries[0].type == InodeType::Directory);
  assert(entries[1].name == "empty" && entries[1].type == InodeType::Directory);
  assert(entries[2].name == "link" && entries[2].type == InodeType::Symlink);
  assert(entries[3].name == "readme" && entries[3].type == InodeType::File);

  for (const auto& entry : entries) {
    Inode inode = opened.decoder.decode(entry.ref);
    assert(inode.inodeNumber == entry.inodeNumber);
    assert(basicType(inode.type) == entry.type);
  }

  auto found = opened.reader.find(opened.root(), "readme");
  assert(found && *found == entries[3]);
  assert(!opened.reader.find(opened.root(), "missing"));
  assert(!opened.reader.find(opened.root(), "READme"));

  Inode empty = opened.decoder.decode(entries[1].ref);
  assert(opened.reader.entries(empty).empty());

  size_t visited = 0;
  opened.reader.forEach(opened.root(), [&visited](const DirEntry&) {
    ++visited;
    return visited < 2;
  });
  assert(visited == 2);

  Inode file = opened.decoder.decode(entries[3].ref);
  bool threw = false;
  try {
    opened.reader.entries(file);
  } catch (const NotADirectory&) {
    threw = true;
  }
  assert(threw);
}

// Long names over a few hundred entries: headers split at 256 entries and
// records cross metadata blocks in both tables.
static void test_large_directory() {
  ImageBuilder builder;
  std::vector<std::string> names;
  for (int i = 0; i < 400; ++i) {
    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "f%03d_", i);
    std::string name = prefix + std::string(200, static_cast<char>('a' + i % 26));
    names.push_back(name);
    builder.root().children.push_back(makeFile(name, textBytes(static_cast<size_t>(i))));
  }
  OpenedImage opened(writeTempImage("directory_large", builder.build()));

  Inode root = opened.root();
  // The listing no longer fits a basic directory inode.
  assert(root.type == InodeType::ExtendedDirectory);
  assert(root.dirIndex.size() >= 2);
  assert(root.dirFileSize > 0xFFFF);

  auto entries = opened.reader.entries(root);
  assert(entries.size() == names.size());
  for (size_t i = 0; i < names.size(); ++i) {
    assert(entries[i].name == names[i]);
    Inode inode = opened.decoder.decode(entries[i].ref);
    assert(inode.fileSize == i);
  }

  auto last = opened.reader.find(root, names.back());
  assert(last && last->name == names.back());
}

// A stored count of 0xFFFFFFFF must not wrap to an empty header.
static void test_bad_header_count() {
  ImageOptions options;
  options.compress = false;
  ImageBuilder builder(options);
  builder.root().children.push_back(makeFile("only", "x"));
  auto image = builder.build();

  size_t headerAt = 0;
  {
    OpenedImage clean(writeTempImage("directory_count_clean", image));
    Inode root = clean.root();
    assert(clean.reader.entries(root).size() == 1);
    // Stored metadata: the block payload follows its 2-byte header.
    headerAt = static_cast<size_t>(clean.sb.directoryTableStart + root.startBlock + 2 + root.dirOffset);
  }
  assert(read_le32(image, headerAt) == 0);
  patchLe32(image, headerAt, 0xFFFFFFFF);

  OpenedImage broken(writeTempImage("directory_count_wrapped", image));
  try {
    broken.reader.entries(broken.root());
    assert(false);
  } catch (const CorruptBlock& e) {
    assert(std::string(e.what()).find("4294967296 entries") != std::string::npos);
  }
}

static void test_resolve() {
  OpenedImage opened(sampleTree());
  Inode c1 = opened.resolver.resolve("/a/b/c");
  Inode c2 = opened.resolver.resolve("a/b/c");
  Inode c3 = opened.resolver.resolve("/a//b/c/");
  Inode c4 = opened.resolver.resolve("/a/./b/../b/c");
  assert(c1.ref == c2.ref && c2.ref == c3.ref && c3.ref == c4.ref);
  assert(c1.isFile() && c1.fileSize == 5);

  Inode root = opened.root();
  assert(opened.resolver.resolve("/").ref == root.ref);
  assert(opened.resolver.resolve("").ref == root.ref);
  assert(opened.resolver.resolve("/..").ref == root.ref);
  assert(opened.resolver.resolve("a/..").ref == root.ref);

  // Symlinks are returned, never followed.
  assert(opened.resolver.resolve("/link").isSymlink());

  try {
    opened.resolver.resolve("/a/missing");
    assert(false);
  } catch (const NotFound& e) {
    assert(e.component() == "/a/missing");
  }

  try {
    opened.resolver.resolve("/a/b/c/d");
    assert(false);
  } catch (const NotADirectory& e) {
    assert(e.component() == "/a/b/c");
  }

  try {
    opened.resolver.resolve("/readme/x");
    assert(false);
  } catch (const NotADirectory& e) {
    assert(e.component() == "/readme");
  }
}

static void test_split_path() {
  assert((PathResolver::splitPath("/a//b/c/") == std::vector<std::string>{"a", "b", "c"}));
  assert(PathResolver::splitPath("/").empty());
  assert(PathResolver::splitPath("").empty());
  assert((PathResolver::splitPath("x") == std::vector<std::string>{"x"}));
}

int main() {
  test_listing();
  test_large_directory();
  test_bad_header_count();
  test_resolve();
  test_split_path();

  std::cout << "directory ok" << std::endl;
  return 0;
}
