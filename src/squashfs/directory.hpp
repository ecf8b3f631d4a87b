#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "format.hpp"
#include "inode.hpp"
#include "metadata_store.hpp"
#include "superblock.hpp"

struct DirEntry {
    std::string name;      // raw bytes, no terminator
    uint32_t inodeNumber = 0;
    InodeRef ref;          // header start_block + entry offset
    InodeType type = InodeType::File;  // basic tag only

    bool operator==(const DirEntry& other) const {
        return name == other.name && inodeNumber == other.inodeNumber &&
               ref == other.ref && type == other.type;
    }
};

class DirectoryReader {
public:
    // Return false to stop the walk early.
    using Visitor = std::function<bool(const DirEntry&)>;

    DirectoryReader(MetadataBlockStore& store, const Superblock& sb);

    // Walks the entry stream of `dir` from its first header. Each call starts
    // over from the inode.
    void forEach(const Inode& dir, const Visitor& visit) const;

    std::vector<DirEntry> entries(const Inode& dir) const;
    std::optional<DirEntry> find(const Inode& dir, const std::string& name) const;

private:
    MetadataBlockStore& store;
    const Superblock& sb;
};
