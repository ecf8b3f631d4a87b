#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "codec_registry.hpp"
#include "directory.hpp"
#include "errors.hpp"
#include "file_content.hpp"
#include "image_file.hpp"
#include "inode.hpp"
#include "metadata_store.hpp"
#include "path_resolver.hpp"
#include "superblock.hpp"
#include "tables.hpp"

namespace fs = std::filesystem;

struct SessionOptions {
    // Return a session without superblock instead of failing on a bad header.
    bool force = false;
    size_t cacheBlocks = MetadataBlockStore::DEFAULT_CAPACITY;
    // Null means CodecRegistry::withDefaults().
    std::shared_ptr<const CodecRegistry> codecs;
};

struct MetadataStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    size_t cached = 0;
    size_t capacity = 0;
};

// An opened image. Only the superblock is read up front; the id and fragment
// tables load on first use, so an unsupported compressor is reported by the
// first operation that meets a compressed block.
class Session {
public:
    // Return false to stop the walk.
    using WalkVisitor = std::function<bool(const std::string& path, const DirEntry& entry)>;

    // Throws IoError, NotAnImage, UnsupportedVersion or CorruptSuperblock
    // (the last three only without options.force).
    static std::unique_ptr<Session> open(const fs::path& path, const SessionOptions& options = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::optional<Superblock>& superblock() const { return sb; }
    // Why the superblock was rejected, for sessions opened with force.
    const std::string& superblockError() const { return rejection; }

    Inode root() const;
    Inode resolve(const std::string& path) const;
    Inode inodeAt(InodeRef ref) const;
    std::vector<DirEntry> list(const Inode& dir) const;
    // Depth first below `dir`, entries in directory order. Paths are `base`
    // plus the entry names; a directory is visited before its contents and
    // its path ends in '/'. Throws CorruptBlock if a directory contains one
    // of its own ancestors.
    void walk(const Inode& dir, const std::string& base, const WalkVisitor& visit) const;
    std::vector<uint8_t> readFile(const Inode& file) const;
    std::vector<uint8_t> readSymlink(const Inode& inode) const;
    std::vector<uint8_t> readBlock(const Inode& file, size_t index) const;

    // First n bytes of the image (fewer if the file is shorter). Works
    // without a superblock.
    std::vector<uint8_t> rawHeaderBytes(size_t n) const;

    const IdTable& idTable() const;
    const FragmentTable& fragmentTable() const;
    MetadataStats metadataStats() const;

    uint64_t imageSize() const { return image->size(); }
    const fs::path& imagePath() const { return image->path(); }
    const CodecRegistry& codecs() const { return *registry; }

private:
    Session(std::unique_ptr<ImageFile> image, std::shared_ptr<const CodecRegistry> registry);

    void rejectSuperblock(const SquashfsError& error, bool force);
    void requireSuperblock() const;
    void loadTables() const;
    Inode withOwner(Inode inode) const;
    bool walkFrom(const Inode& dir, const std::string& prefix, std::vector<InodeRef>& chain,
                  const WalkVisitor& visit) const;

    std::unique_ptr<ImageFile> image;
    std::shared_ptr<const CodecRegistry> registry;
    std::optional<Superblock> sb;
    std::string rejection;

    std::unique_ptr<MetadataBlockStore> store;
    std::unique_ptr<InodeDecoder> decoder;
    std::unique_ptr<DirectoryReader> directories;
    std::unique_ptr<PathResolver> resolver;
    std::unique_ptr<FileContentReader> files;

    mutable std::mutex tablesMutex;
    mutable bool tablesLoaded = false;
    mutable IdTable ids;
    mutable FragmentTable fragments;
};
