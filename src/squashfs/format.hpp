#pragma once
#include <cstddef>
#include <cstdint>

// On-disk constants of the SquashFS 4.0 format. All integers are little endian.

constexpr uint32_t SQUASHFS_MAGIC = 0x73717368;           // "hsqs"
constexpr size_t   SUPERBLOCK_SIZE = 96;
constexpr uint32_t MIN_BLOCK_SIZE = 4096;
constexpr uint32_t MAX_BLOCK_SIZE = 1024 * 1024;

constexpr size_t   METADATA_BLOCK_SIZE = 8192;
constexpr uint16_t METADATA_UNCOMPRESSED_BIT = 0x8000;
constexpr uint16_t METADATA_SIZE_MASK = 0x7FFF;

// Data block and fragment size words: bit 24 flags a stored block.
constexpr uint32_t DATA_UNCOMPRESSED_BIT = 1u << 24;
constexpr uint32_t DATA_SIZE_MASK = DATA_UNCOMPRESSED_BIT - 1;

constexpr uint64_t INVALID_TABLE = 0xFFFFFFFFFFFFFFFFull;
constexpr uint32_t INVALID_FRAGMENT = 0xFFFFFFFF;
constexpr uint32_t INVALID_XATTR = 0xFFFFFFFF;

constexpr size_t IDS_PER_BLOCK = METADATA_BLOCK_SIZE / 4;
constexpr size_t FRAGMENT_ENTRY_SIZE = 16;
constexpr size_t FRAGMENTS_PER_BLOCK = METADATA_BLOCK_SIZE / FRAGMENT_ENTRY_SIZE;

constexpr size_t   DIR_HEADER_SIZE = 12;
constexpr size_t   DIR_ENTRY_SIZE = 8;
constexpr uint32_t DIR_MAX_ENTRIES = 256;
// A directory's file_size also counts the implicit "." and ".." entries.
constexpr uint32_t DIR_SIZE_PADDING = 3;

enum class CompressionId : uint16_t {
    GZIP = 1,
    LZMA = 2,
    LZO  = 3,
    XZ   = 4,
    LZ4  = 5,
    ZSTD = 6
};

enum class InodeType : uint16_t {
    Directory         = 1,
    File              = 2,
    Symlink           = 3,
    BlockDevice       = 4,
    CharDevice        = 5,
    Fifo              = 6,
    Socket            = 7,
    ExtendedDirectory = 8,
    ExtendedFile      = 9,
    ExtendedSymlink   = 10,
    ExtendedBlockDevice = 11,
    ExtendedCharDevice  = 12,
    ExtendedFifo      = 13,
    ExtendedSocket    = 14
};

// Maps an extended tag to its basic counterpart; basic tags map to themselves.
constexpr InodeType basicType(InodeType type) {
    return static_cast<uint16_t>(type) >= 8
        ? static_cast<InodeType>(static_cast<uint16_t>(type) - 7)
        : type;
}

enum SuperblockFlags : uint16_t {
    FLAG_UNCOMPRESSED_INODES    = 0x0001,
    FLAG_UNCOMPRESSED_DATA      = 0x0002,
    FLAG_CHECK                  = 0x0004,
    FLAG_UNCOMPRESSED_FRAGMENTS = 0x0008,
    FLAG_NO_FRAGMENTS           = 0x0010,
    FLAG_ALWAYS_FRAGMENTS       = 0x0020,
    FLAG_DUPLICATES             = 0x0040,
    FLAG_EXPORTABLE             = 0x0080,
    FLAG_UNCOMPRESSED_XATTRS    = 0x0100,
    FLAG_NO_XATTRS              = 0x0200,
    FLAG_COMPRESSOR_OPTIONS     = 0x0400,
    FLAG_UNCOMPRESSED_IDS       = 0x0800
};

// Address of an inode: metadata block offset (relative to the inode table
// start) in the upper 48 bits, byte offset inside the decompressed block in
// the lower 16 bits. Every component passes references around as this type.
struct InodeRef {
    uint64_t raw = 0;

    InodeRef() = default;
    explicit InodeRef(uint64_t value) : raw(value) {}

    static InodeRef encode(uint64_t block, uint16_t offset) {
        return InodeRef((block << 16) | offset);
    }

    uint64_t block() const { return raw >> 16; }
    uint16_t offset() const { return static_cast<uint16_t>(raw & 0xFFFF); }

    bool operator==(const InodeRef& other) const { return raw == other.raw; }
    bool operator!=(const InodeRef& other) const { return raw != other.raw; }
};
