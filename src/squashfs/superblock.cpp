#include "superblock.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include <algorithm>

uint64_t Superblock::regionEnd(uint64_t start) const {
    uint64_t end = bytesUsed;
    const uint64_t starts[] = {idTableStart, xattrIdTableStart, inodeTableStart,
                               directoryTableStart, fragmentTableStart, exportTableStart};
    for (uint64_t other : starts) {
        if (other != INVALID_TABLE && other > start && other < end) {
            end = other;
        }
    }
    return end;
}

Superblock parseSuperblock(const std::vector<uint8_t>& blob) {
    if (blob.size() < 4) {
        throw NotAnImage("image too small for a superblock (" + std::to_string(blob.size()) + " bytes)");
    }
    uint32_t magic = read_le32(blob, 0);
    if (magic != SQUASHFS_MAGIC) {
        throw NotAnImage("bad magic " + to_hex_padded(magic, 8) + ", expected " +
                         to_hex_padded(SQUASHFS_MAGIC, 8));
    }
    if (blob.size() < SUPERBLOCK_SIZE) {
        throw NotAnImage("superblock incomplete: " + std::to_string(blob.size()) + " of " +
                         std::to_string(SUPERBLOCK_SIZE) + " bytes");
    }

    Superblock sb;
    sb.magic               = magic;
    sb.inodeCount          = read_le32(blob, 4);
    sb.modificationTime    = read_le32(blob, 8);
    sb.blockSize           = read_le32(blob, 12);
    sb.fragmentEntryCount  = read_le32(blob, 16);
    sb.compressionId       = read_le16(blob, 20);
    sb.blockLog            = read_le16(blob, 22);
    sb.flags               = read_le16(blob, 24);
    sb.idCount             = read_le16(blob, 26);
    sb.versionMajor        = read_le16(blob, 28);
    sb.versionMinor        = read_le16(blob, 30);
    sb.rootInodeRef        = InodeRef(read_le64(blob, 32));
    sb.bytesUsed           = read_le64(blob, 40);
    sb.idTableStart        = read_le64(blob, 48);
    sb.xattrIdTableStart   = read_le64(blob, 56);
    sb.inodeTableStart     = read_le64(blob, 64);
    sb.directoryTableStart = read_le64(blob, 72);
    sb.fragmentTableStart  = read_le64(blob, 80);
    sb.exportTableStart    = read_le64(blob, 88);

    if (sb.versionMajor != 4) {
        throw UnsupportedVersion(sb.versionMajor, sb.versionMinor);
    }
    if (sb.blockLog >= 32 || (1u << sb.blockLog) != sb.blockSize) {
        throw CorruptSuperblock("block_log " + std::to_string(sb.blockLog) +
                                " does not match block_size " + std::to_string(sb.blockSize));
    }
    if (sb.blockSize < MIN_BLOCK_SIZE || sb.blockSize > MAX_BLOCK_SIZE) {
        throw CorruptSuperblock("block_size " + std::to_string(sb.blockSize) + " outside 4 KiB..1 MiB");
    }
    if (sb.inodeTableStart >= sb.directoryTableStart) {
        throw CorruptSuperblock("inode table at 0x" + to_hex(sb.inodeTableStart) +
                                " does not precede directory table at 0x" + to_hex(sb.directoryTableStart));
    }
    return sb;
}

std::string compressionName(uint16_t id) {
    switch (static_cast<CompressionId>(id)) {
        case CompressionId::GZIP: return "GZIP";
        case CompressionId::LZMA: return "LZMA";
        case CompressionId::LZO:  return "LZO";
        case CompressionId::XZ:   return "XZ";
        case CompressionId::LZ4:  return "LZ4";
        case CompressionId::ZSTD: return "ZSTD";
    }
    return "Unknown (" + std::to_string(id) + ")";
}

std::string compressionDescription(uint16_t id) {
    switch (static_cast<CompressionId>(id)) {
        case CompressionId::GZIP: return "Standard GZIP compression (zlib)";
        case CompressionId::LZMA: return "LZMA compression, high compression ratio";
        case CompressionId::LZO:  return "LZO compression, optimized for speed";
        case CompressionId::XZ:   return "XZ compression, high compression ratio";
        case CompressionId::LZ4:  return "LZ4 compression, very fast decompression";
        case CompressionId::ZSTD: return "Zstandard compression, good balance of speed and ratio";
    }
    return "";
}

std::vector<std::pair<uint16_t, std::string>> flagNames(uint16_t flags) {
    static const std::pair<uint16_t, const char*> known[] = {
        {FLAG_UNCOMPRESSED_INODES,    "UNCOMPRESSED_INODES"},
        {FLAG_UNCOMPRESSED_DATA,      "UNCOMPRESSED_DATA"},
        {FLAG_CHECK,                  "CHECK"},
        {FLAG_UNCOMPRESSED_FRAGMENTS, "UNCOMPRESSED_FRAGMENTS"},
        {FLAG_NO_FRAGMENTS,           "NO_FRAGMENTS"},
        {FLAG_ALWAYS_FRAGMENTS,       "ALWAYS_FRAGMENTS"},
        {FLAG_DUPLICATES,             "DUPLICATES"},
        {FLAG_EXPORTABLE,             "EXPORTABLE"},
        {FLAG_UNCOMPRESSED_XATTRS,    "UNCOMPRESSED_XATTRS"},
        {FLAG_NO_XATTRS,              "NO_XATTRS"},
        {FLAG_COMPRESSOR_OPTIONS,     "COMPRESSOR_OPTIONS"},
        {FLAG_UNCOMPRESSED_IDS,       "UNCOMPRESSED_IDS"},
    };
    std::vector<std::pair<uint16_t, std::string>> result;
    for (const auto& flag : known) {
        if (flags & flag.first) {
            result.emplace_back(flag.first, flag.second);
        }
    }
    return result;
}
