#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "image_file.hpp"
#include "metadata_store.hpp"
#include "superblock.hpp"

// uid/gid values referenced by index from every inode.
class IdTable {
public:
    IdTable() = default;
    IdTable(std::vector<uint32_t> ids, uint64_t tableStart)
        : values(std::move(ids)), start(tableStart) {}

    static IdTable load(const ImageFile& image, MetadataBlockStore& store, const Superblock& sb);

    uint32_t lookup(uint16_t index) const;
    size_t size() const { return values.size(); }
    const std::vector<uint32_t>& ids() const { return values; }
    // Index array offset, reported by lookup failures.
    uint64_t tableStart() const { return start; }

private:
    std::vector<uint32_t> values;
    uint64_t start = 0;
};

struct FragmentEntry {
    uint64_t start = 0;   // absolute image offset of the fragment block
    uint32_t size = 0;    // size word, bit 24 set when stored uncompressed
    uint32_t unused = 0;

    bool uncompressed() const { return (size & DATA_UNCOMPRESSED_BIT) != 0; }
    uint32_t onDiskSize() const { return size & DATA_SIZE_MASK; }
};

class FragmentTable {
public:
    FragmentTable() = default;

    static FragmentTable load(const ImageFile& image, MetadataBlockStore& store, const Superblock& sb);

    const FragmentEntry& at(uint32_t index) const;
    size_t size() const { return fragments.size(); }
    const std::vector<FragmentEntry>& entries() const { return fragments; }
    uint64_t tableStart() const { return start; }

private:
    std::vector<FragmentEntry> fragments;
    uint64_t start = 0;
};

// Reads a table stored as metadata blocks behind a u64 index array at
// `indexStart`, returning the first `byteCount` logical bytes.
std::vector<uint8_t> readIndexedTable(const ImageFile& image, MetadataBlockStore& store,
                                      uint64_t indexStart, size_t byteCount);
