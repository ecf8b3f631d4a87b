#pragma once
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "image_file.hpp"
#include "codec_registry.hpp"

struct MetadataBlock {
    std::vector<uint8_t> data;     // decompressed payload, at most 8 KiB
    uint32_t onDiskLength = 0;     // header + stored payload
};

class MetadataBlockStore;

// Sequential reader over a metadata table. Records may straddle blocks; the
// cursor follows on into the next block by itself.
class MetadataCursor {
public:
    MetadataCursor(MetadataBlockStore& store, uint64_t tableStart, uint64_t tableEnd,
                   uint64_t block, uint16_t offset);

    uint8_t readU8();
    uint16_t readU16();
    int16_t readI16();
    uint32_t readU32();
    uint64_t readU64();
    std::vector<uint8_t> readBytes(size_t length);
    std::string readString(size_t length);

    // Block (relative to the table start) and offset of the next byte.
    uint64_t block() const { return blockRel; }
    uint16_t offset() const { return static_cast<uint16_t>(pos); }
    // Absolute image offset of the current block header.
    uint64_t blockPosition() const { return tableStart + blockRel; }
    uint64_t consumed() const { return consumedBytes; }

private:
    void fill(uint8_t* dst, size_t length);
    void advanceBlock();

    MetadataBlockStore* store;
    uint64_t tableStart;
    uint64_t tableEnd;
    uint64_t blockRel;
    size_t pos;
    std::shared_ptr<const MetadataBlock> current;
    uint64_t consumedBytes = 0;
};

// Reads metadata blocks (inode, directory, id and fragment tables) and keeps
// the most recently used ones decompressed. The codec is only consulted on a
// cache miss, so an unsupported compressor surfaces at first use.
class MetadataBlockStore {
public:
    static constexpr size_t DEFAULT_CAPACITY = 32;

    MetadataBlockStore(const ImageFile& image, const CodecRegistry& codecs,
                       uint16_t compressionId, size_t capacity = DEFAULT_CAPACITY);

    std::shared_ptr<const MetadataBlock> readAt(uint64_t byteOffset);

    MetadataCursor cursorAt(uint64_t tableStart, uint64_t tableEnd, uint64_t block, uint16_t offset) {
        return MetadataCursor(*this, tableStart, tableEnd, block, offset);
    }

    size_t capacity() const { return maxBlocks; }
    size_t cached() const;
    uint64_t hits() const;
    uint64_t misses() const;
    void clear();

private:
    std::shared_ptr<const MetadataBlock> load(uint64_t byteOffset) const;

    using LruList = std::list<uint64_t>;
    struct CacheEntry {
        std::shared_ptr<const MetadataBlock> block;
        LruList::iterator position;
    };

    const ImageFile& image;
    const CodecRegistry& codecs;
    uint16_t compressionId;
    size_t maxBlocks;

    mutable std::mutex mutex;
    LruList lru;
    std::unordered_map<uint64_t, CacheEntry> cache;
    uint64_t hitCount = 0;
    uint64_t missCount = 0;
};
