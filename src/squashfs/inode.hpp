#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "format.hpp"
#include "metadata_store.hpp"
#include "superblock.hpp"

struct DirectoryIndex {
    uint32_t index = 0;       // byte offset into the directory's entry stream
    uint32_t startBlock = 0;  // directory table block holding that header
    std::string name;         // first name covered by the header
};

// A decoded inode. Fields that do not apply to the inode's type keep their
// defaults.
struct Inode {
    InodeType type = InodeType::Directory;
    InodeRef ref;
    uint16_t mode = 0;        // permission bits only
    uint16_t uidIdx = 0;
    uint16_t gidIdx = 0;
    uint32_t uid = 0;         // resolved through the id table
    uint32_t gid = 0;
    uint32_t mtime = 0;
    uint32_t inodeNumber = 0;
    uint32_t nlink = 1;
    uint32_t xattrIdx = INVALID_XATTR;

    // Directory
    uint32_t startBlock = 0;  // relative to directory_table_start
    uint16_t dirOffset = 0;
    uint32_t dirFileSize = 0; // entry stream length + 3
    uint32_t parentInode = 0;
    std::vector<DirectoryIndex> dirIndex;

    // Regular file
    uint64_t blocksStart = 0; // absolute offset of the first data block
    uint64_t fileSize = 0;
    uint64_t sparse = 0;
    uint32_t fragment = INVALID_FRAGMENT;
    uint32_t fragmentOffset = 0;
    std::vector<uint32_t> blockSizes;

    // Symlink
    std::vector<uint8_t> symlinkTarget;

    // Block and character devices
    uint32_t rdev = 0;

    bool isDirectory() const { return basicType(type) == InodeType::Directory; }
    bool isFile() const { return basicType(type) == InodeType::File; }
    bool isSymlink() const { return basicType(type) == InodeType::Symlink; }
    bool isDevice() const {
        return basicType(type) == InodeType::BlockDevice || basicType(type) == InodeType::CharDevice;
    }
    bool isExtended() const { return static_cast<uint16_t>(type) >= 8; }
    bool hasFragment() const { return fragment != INVALID_FRAGMENT; }

    // Bytes of content: file size, entry stream length or target length.
    uint64_t size() const;
    std::string typeName() const;
    // Single character used by ls-style listings.
    char typeChar() const;
};

std::string inodeTypeName(InodeType type);
char inodeTypeChar(InodeType type);

class InodeDecoder {
public:
    InodeDecoder(MetadataBlockStore& store, const Superblock& sb);

    // uid/gid are left as raw indices; the session resolves them.
    Inode decode(InodeRef ref) const;

private:
    void decodeDirectory(MetadataCursor& cur, Inode& inode) const;
    void decodeExtendedDirectory(MetadataCursor& cur, Inode& inode) const;
    void decodeFile(MetadataCursor& cur, Inode& inode) const;
    void decodeExtendedFile(MetadataCursor& cur, Inode& inode) const;
    void readBlockList(MetadataCursor& cur, Inode& inode) const;

    MetadataBlockStore& store;
    const Superblock& sb;
};
