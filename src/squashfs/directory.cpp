#include "directory.hpp"
#include "errors.hpp"

DirectoryReader::DirectoryReader(MetadataBlockStore& store, const Superblock& sb)
    : store(store), sb(sb) {}

void DirectoryReader::forEach(const Inode& dir, const Visitor& visit) const {
    if (!dir.isDirectory()) {
        throw NotADirectory("inode " + std::to_string(dir.inodeNumber));
    }
    if (dir.dirFileSize <= DIR_SIZE_PADDING) {
        return;
    }
    uint64_t streamSize = dir.dirFileSize - DIR_SIZE_PADDING;
    uint64_t tableEnd = sb.regionEnd(sb.directoryTableStart);
    auto cur = store.cursorAt(sb.directoryTableStart, tableEnd, dir.startBlock, dir.dirOffset);

    while (cur.consumed() < streamSize) {
        if (streamSize - cur.consumed() < DIR_HEADER_SIZE) {
            throw CorruptBlock(cur.blockPosition(), "directory stream ends inside a header");
        }
        // Stored as count - 1.
        uint32_t rawCount   = cur.readU32();
        uint32_t startBlock = cur.readU32();
        uint32_t baseNumber = cur.readU32();
        if (rawCount >= DIR_MAX_ENTRIES) {
            throw CorruptBlock(cur.blockPosition(), "directory header announces " +
                               std::to_string(static_cast<uint64_t>(rawCount) + 1) + " entries");
        }
        uint32_t count = rawCount + 1;

        for (uint32_t i = 0; i < count; ++i) {
            uint16_t offset   = cur.readU16();
            int16_t delta     = cur.readI16();
            uint16_t type     = cur.readU16();
            uint16_t nameSize = cur.readU16();

            if (type < 1 || type > 7) {
                throw CorruptBlock(cur.blockPosition(), "directory entry type " + std::to_string(type));
            }

            DirEntry entry;
            entry.name = cur.readString(static_cast<size_t>(nameSize) + 1);
            entry.inodeNumber = static_cast<uint32_t>(static_cast<int64_t>(baseNumber) + delta);
            entry.ref = InodeRef::encode(startBlock, offset);
            entry.type = static_cast<InodeType>(type);

            if (cur.consumed() > streamSize) {
                throw CorruptBlock(cur.blockPosition(), "directory entry runs past the declared size");
            }
            if (!visit(entry)) {
                return;
            }
        }
    }
}

std::vector<DirEntry> DirectoryReader::entries(const Inode& dir) const {
    std::vector<DirEntry> result;
    forEach(dir, [&result](const DirEntry& entry) {
        result.push_back(entry);
        return true;
    });
    return result;
}

std::optional<DirEntry> DirectoryReader::find(const Inode& dir, const std::string& name) const {
    std::optional<DirEntry> found;
    forEach(dir, [&](const DirEntry& entry) {
        if (entry.name == name) {
            found = entry;
            return false;
        }
        return true;
    });
    return found;
}
