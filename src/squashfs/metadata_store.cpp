#include "metadata_store.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "helpers.hpp"
#include <algorithm>
#include <cstring>

MetadataBlockStore::MetadataBlockStore(const ImageFile& image, const CodecRegistry& codecs,
                                       uint16_t compressionId, size_t capacity)
    : image(image), codecs(codecs), compressionId(compressionId), maxBlocks(capacity) {}

std::shared_ptr<const MetadataBlock> MetadataBlockStore::readAt(uint64_t byteOffset) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = cache.find(byteOffset);
        if (it != cache.end()) {
            ++hitCount;
            lru.splice(lru.begin(), lru, it->second.position);
            return it->second.block;
        }
        ++missCount;
    }

    // Decompress outside the lock; two threads missing on the same block
    // both decode it and the second insert is dropped.
    auto block = load(byteOffset);
    if (maxBlocks == 0) {
        return block;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (cache.count(byteOffset) == 0) {
        lru.push_front(byteOffset);
        cache[byteOffset] = CacheEntry{block, lru.begin()};
        while (cache.size() > maxBlocks) {
            cache.erase(lru.back());
            lru.pop_back();
        }
    }
    return block;
}

std::shared_ptr<const MetadataBlock> MetadataBlockStore::load(uint64_t byteOffset) const {
    auto header = image.read(byteOffset, 2);
    uint16_t word = read_le16(header, 0);
    size_t size = word & METADATA_SIZE_MASK;
    bool stored = (word & METADATA_UNCOMPRESSED_BIT) != 0;

    if (size == 0 || size > METADATA_BLOCK_SIZE) {
        throw CorruptBlock(byteOffset, "metadata block declares " + std::to_string(size) + " bytes");
    }

    auto payload = image.read(byteOffset + 2, size);
    auto block = std::make_shared<MetadataBlock>();
    block->onDiskLength = static_cast<uint32_t>(size + 2);
    if (stored) {
        block->data = std::move(payload);
    } else {
        try {
            block->data = codecs.decompress(compressionId, payload, METADATA_BLOCK_SIZE);
        } catch (const DecompressError& e) {
            throw CorruptBlock(byteOffset, e.what());
        }
    }
    return block;
}

size_t MetadataBlockStore::cached() const {
    std::lock_guard<std::mutex> lock(mutex);
    return cache.size();
}

uint64_t MetadataBlockStore::hits() const {
    std::lock_guard<std::mutex> lock(mutex);
    return hitCount;
}

uint64_t MetadataBlockStore::misses() const {
    std::lock_guard<std::mutex> lock(mutex);
    return missCount;
}

void MetadataBlockStore::clear() {
    std::lock_guard<std::mutex> lock(mutex);
    cache.clear();
    lru.clear();
}

MetadataCursor::MetadataCursor(MetadataBlockStore& store, uint64_t tableStart, uint64_t tableEnd,
                               uint64_t block, uint16_t offset)
    : store(&store), tableStart(tableStart), tableEnd(tableEnd), blockRel(block), pos(offset) {
    if (tableStart + blockRel >= tableEnd) {
        throw CorruptBlock(tableStart + blockRel, "metadata reference outside its table (ends at 0x" +
                           to_hex(tableEnd) + ")");
    }
    current = store.readAt(tableStart + blockRel);
    if (pos > current->data.size()) {
        throw CorruptBlock(tableStart + blockRel, "offset " + std::to_string(offset) +
                           " past end of " + std::to_string(current->data.size()) + "-byte block");
    }
}

void MetadataCursor::advanceBlock() {
    uint64_t next = blockRel + current->onDiskLength;
    if (tableStart + next >= tableEnd) {
        throw CorruptBlock(tableStart + blockRel, "record runs past the end of its table");
    }
    current = store->readAt(tableStart + next);
    blockRel = next;
    pos = 0;
}

void MetadataCursor::fill(uint8_t* dst, size_t length) {
    while (length > 0) {
        if (pos >= current->data.size()) {
            advanceBlock();
            continue;
        }
        size_t chunk = std::min(length, current->data.size() - pos);
        std::memcpy(dst, current->data.data() + pos, chunk);
        dst += chunk;
        pos += chunk;
        length -= chunk;
        consumedBytes += chunk;
    }
}

uint8_t MetadataCursor::readU8() {
    uint8_t value = 0;
    fill(&value, 1);
    return value;
}

uint16_t MetadataCursor::readU16() {
    uint8_t raw[2];
    fill(raw, sizeof(raw));
    return read_le16(raw);
}

int16_t MetadataCursor::readI16() {
    return static_cast<int16_t>(readU16());
}

uint32_t MetadataCursor::readU32() {
    uint8_t raw[4];
    fill(raw, sizeof(raw));
    return read_le32(raw);
}

uint64_t MetadataCursor::readU64() {
    uint8_t raw[8];
    fill(raw, sizeof(raw));
    return read_le64(raw);
}

std::vector<uint8_t> MetadataCursor::readBytes(size_t length) {
    std::vector<uint8_t> out(length);
    fill(out.data(), length);
    return out;
}

std::string MetadataCursor::readString(size_t length) {
    std::string out(length, '\0');
    fill(reinterpret_cast<uint8_t*>(&out[0]), length);
    return out;
}
