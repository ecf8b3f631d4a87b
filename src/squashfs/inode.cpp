#include "inode.hpp"
#include "errors.hpp"

uint64_t Inode::size() const {
    if (isFile()) return fileSize;
    if (isDirectory()) return dirFileSize > DIR_SIZE_PADDING ? dirFileSize - DIR_SIZE_PADDING : 0;
    if (isSymlink()) return symlinkTarget.size();
    return 0;
}

std::string Inode::typeName() const {
    return inodeTypeName(type);
}

char Inode::typeChar() const {
    return inodeTypeChar(type);
}

std::string inodeTypeName(InodeType type) {
    switch (type) {
        case InodeType::Directory:           return "directory";
        case InodeType::File:                return "file";
        case InodeType::Symlink:             return "symlink";
        case InodeType::BlockDevice:         return "block device";
        case InodeType::CharDevice:          return "char device";
        case InodeType::Fifo:                return "fifo";
        case InodeType::Socket:              return "socket";
        case InodeType::ExtendedDirectory:   return "extended directory";
        case InodeType::ExtendedFile:        return "extended file";
        case InodeType::ExtendedSymlink:     return "extended symlink";
        case InodeType::ExtendedBlockDevice: return "extended block device";
        case InodeType::ExtendedCharDevice:  return "extended char device";
        case InodeType::ExtendedFifo:        return "extended fifo";
        case InodeType::ExtendedSocket:      return "extended socket";
    }
    return "unknown";
}

char inodeTypeChar(InodeType type) {
    switch (basicType(type)) {
        case InodeType::Directory:   return 'd';
        case InodeType::Symlink:     return 'l';
        case InodeType::BlockDevice: return 'b';
        case InodeType::CharDevice:  return 'c';
        case InodeType::Fifo:        return 'p';
        case InodeType::Socket:      return 's';
        default:                     return '-';
    }
}

InodeDecoder::InodeDecoder(MetadataBlockStore& store, const Superblock& sb)
    : store(store), sb(sb) {}

Inode InodeDecoder::decode(InodeRef ref) const {
    auto cur = store.cursorAt(sb.inodeTableStart, sb.directoryTableStart, ref.block(), ref.offset());

    Inode inode;
    inode.ref = ref;
    uint16_t tag     = cur.readU16();
    inode.mode       = cur.readU16();
    inode.uidIdx     = cur.readU16();
    inode.gidIdx     = cur.readU16();
    inode.mtime      = cur.readU32();
    inode.inodeNumber = cur.readU32();

    if (tag < 1 || tag > 14) {
        throw UnknownInodeType(tag);
    }
    inode.type = static_cast<InodeType>(tag);

    switch (inode.type) {
        case InodeType::Directory:
            decodeDirectory(cur, inode);
            break;
        case InodeType::ExtendedDirectory:
            decodeExtendedDirectory(cur, inode);
            break;
        case InodeType::File:
            decodeFile(cur, inode);
            break;
        case InodeType::ExtendedFile:
            decodeExtendedFile(cur, inode);
            break;
        case InodeType::Symlink:
        case InodeType::ExtendedSymlink: {
            inode.nlink = cur.readU32();
            uint32_t length = cur.readU32();
            if (length > METADATA_BLOCK_SIZE * 2) {
                throw CorruptBlock(cur.blockPosition(), "symlink target of " + std::to_string(length) + " bytes");
            }
            inode.symlinkTarget = cur.readBytes(length);
            if (inode.type == InodeType::ExtendedSymlink) {
                inode.xattrIdx = cur.readU32();
            }
            break;
        }
        case InodeType::BlockDevice:
        case InodeType::CharDevice:
            inode.nlink = cur.readU32();
            inode.rdev = cur.readU32();
            break;
        case InodeType::ExtendedBlockDevice:
        case InodeType::ExtendedCharDevice:
            inode.nlink = cur.readU32();
            inode.rdev = cur.readU32();
            inode.xattrIdx = cur.readU32();
            break;
        case InodeType::Fifo:
        case InodeType::Socket:
            inode.nlink = cur.readU32();
            break;
        case InodeType::ExtendedFifo:
        case InodeType::ExtendedSocket:
            inode.nlink = cur.readU32();
            inode.xattrIdx = cur.readU32();
            break;
    }
    return inode;
}

void InodeDecoder::decodeDirectory(MetadataCursor& cur, Inode& inode) const {
    inode.startBlock  = cur.readU32();
    inode.nlink       = cur.readU32();
    inode.dirFileSize = cur.readU16();
    inode.dirOffset   = cur.readU16();
    inode.parentInode = cur.readU32();
}

void InodeDecoder::decodeExtendedDirectory(MetadataCursor& cur, Inode& inode) const {
    inode.nlink       = cur.readU32();
    inode.dirFileSize = cur.readU32();
    inode.startBlock  = cur.readU32();
    inode.parentInode = cur.readU32();
    uint16_t indexCount = cur.readU16();
    inode.dirOffset   = cur.readU16();
    inode.xattrIdx    = cur.readU32();

    for (uint16_t i = 0; i < indexCount; ++i) {
        DirectoryIndex entry;
        entry.index      = cur.readU32();
        entry.startBlock = cur.readU32();
        uint32_t nameSize = cur.readU32();
        if (nameSize >= 256) {
            throw CorruptBlock(cur.blockPosition(), "directory index name of " +
                               std::to_string(nameSize + 1) + " bytes");
        }
        entry.name = cur.readString(nameSize + 1);
        inode.dirIndex.push_back(std::move(entry));
    }
}

void InodeDecoder::decodeFile(MetadataCursor& cur, Inode& inode) const {
    inode.blocksStart    = cur.readU32();
    inode.fragment       = cur.readU32();
    inode.fragmentOffset = cur.readU32();
    inode.fileSize       = cur.readU32();
    readBlockList(cur, inode);
}

void InodeDecoder::decodeExtendedFile(MetadataCursor& cur, Inode& inode) const {
    inode.blocksStart    = cur.readU64();
    inode.fileSize       = cur.readU64();
    inode.sparse         = cur.readU64();
    inode.nlink          = cur.readU32();
    inode.fragment       = cur.readU32();
    inode.fragmentOffset = cur.readU32();
    inode.xattrIdx       = cur.readU32();
    readBlockList(cur, inode);
}

// Files with a fragment tail list only their full blocks; otherwise the last
// partial block has a size word of its own.
void InodeDecoder::readBlockList(MetadataCursor& cur, Inode& inode) const {
    uint64_t count = inode.fileSize >> sb.blockLog;
    if (!inode.hasFragment() && (inode.fileSize & (sb.blockSize - 1)) != 0) {
        ++count;
    }
    if (count * 4 > sb.directoryTableStart - sb.inodeTableStart) {
        throw CorruptBlock(cur.blockPosition(), "file of " + std::to_string(inode.fileSize) +
                           " bytes needs more block sizes than the inode table holds");
    }
    inode.blockSizes.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        inode.blockSizes.push_back(cur.readU32());
    }
}
