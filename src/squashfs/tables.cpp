#include "tables.hpp"
#include "errors.hpp"
#include "helpers.hpp"

std::vector<uint8_t> readIndexedTable(const ImageFile& image, MetadataBlockStore& store,
                                      uint64_t indexStart, size_t byteCount) {
    std::vector<uint8_t> table;
    if (byteCount == 0) {
        return table;
    }
    size_t blockCount = (byteCount + METADATA_BLOCK_SIZE - 1) / METADATA_BLOCK_SIZE;
    auto index = image.read(indexStart, blockCount * 8);

    table.reserve(byteCount);
    for (size_t i = 0; i < blockCount && table.size() < byteCount; ++i) {
        uint64_t blockStart = read_le64(index, i * 8);
        auto block = store.readAt(blockStart);
        table.insert(table.end(), block->data.begin(), block->data.end());
    }
    if (table.size() < byteCount) {
        throw CorruptBlock(indexStart, "table holds " + std::to_string(table.size()) +
                           " bytes, expected " + std::to_string(byteCount));
    }
    table.resize(byteCount);
    return table;
}

IdTable IdTable::load(const ImageFile& image, MetadataBlockStore& store, const Superblock& sb) {
    auto raw = readIndexedTable(image, store, sb.idTableStart, static_cast<size_t>(sb.idCount) * 4);
    std::vector<uint32_t> ids;
    ids.reserve(sb.idCount);
    for (size_t i = 0; i < sb.idCount; ++i) {
        ids.push_back(read_le32(raw, i * 4));
    }
    return IdTable(std::move(ids), sb.idTableStart);
}

uint32_t IdTable::lookup(uint16_t index) const {
    if (index >= values.size()) {
        throw CorruptBlock(start, "id index " + std::to_string(index) + " outside id table of " +
                           std::to_string(values.size()) + " entries");
    }
    return values[index];
}

FragmentTable FragmentTable::load(const ImageFile& image, MetadataBlockStore& store, const Superblock& sb) {
    FragmentTable table;
    if (!sb.hasFragmentTable()) {
        return table;
    }
    table.start = sb.fragmentTableStart;
    auto raw = readIndexedTable(image, store, sb.fragmentTableStart,
                                static_cast<size_t>(sb.fragmentEntryCount) * FRAGMENT_ENTRY_SIZE);
    table.fragments.reserve(sb.fragmentEntryCount);
    for (size_t i = 0; i < sb.fragmentEntryCount; ++i) {
        size_t pos = i * FRAGMENT_ENTRY_SIZE;
        FragmentEntry entry;
        entry.start  = read_le64(raw, pos);
        entry.size   = read_le32(raw, pos + 8);
        entry.unused = read_le32(raw, pos + 12);
        table.fragments.push_back(entry);
    }
    return table;
}

const FragmentEntry& FragmentTable::at(uint32_t index) const {
    if (index >= fragments.size()) {
        throw CorruptBlock(start, "fragment index " + std::to_string(index) + " outside fragment table of " +
                           std::to_string(fragments.size()) + " entries");
    }
    return fragments[index];
}
