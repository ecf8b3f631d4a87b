#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "format.hpp"

struct Superblock {
    uint32_t magic = 0;
    uint32_t inodeCount = 0;
    uint32_t modificationTime = 0;
    uint32_t blockSize = 0;
    uint32_t fragmentEntryCount = 0;
    uint16_t compressionId = 0;
    uint16_t blockLog = 0;
    uint16_t flags = 0;
    uint16_t idCount = 0;
    uint16_t versionMajor = 0;
    uint16_t versionMinor = 0;
    InodeRef rootInodeRef;
    uint64_t bytesUsed = 0;
    uint64_t idTableStart = 0;
    uint64_t xattrIdTableStart = INVALID_TABLE;
    uint64_t inodeTableStart = 0;
    uint64_t directoryTableStart = 0;
    uint64_t fragmentTableStart = INVALID_TABLE;
    uint64_t exportTableStart = INVALID_TABLE;

    bool hasFragmentTable() const { return fragmentTableStart != INVALID_TABLE && fragmentEntryCount > 0; }
    bool hasXattrTable() const { return xattrIdTableStart != INVALID_TABLE; }
    bool hasExportTable() const { return exportTableStart != INVALID_TABLE; }
    bool hasFlag(uint16_t flag) const { return (flags & flag) != 0; }

    // First byte past the table starting at `start`: the closest other table
    // start above it, or bytes_used.
    uint64_t regionEnd(uint64_t start) const;
};

// Parses and validates the 96-byte header. Throws NotAnImage,
// UnsupportedVersion or CorruptSuperblock.
Superblock parseSuperblock(const std::vector<uint8_t>& bytes);

std::string compressionName(uint16_t id);
std::string compressionDescription(uint16_t id);
// (bit, name) for every flag bit set in `flags`.
std::vector<std::pair<uint16_t, std::string>> flagNames(uint16_t flags);
