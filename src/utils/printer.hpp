#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>
#include "directory.hpp"
#include "inode.hpp"
#include "superblock.hpp"
#include "tables.hpp"

// A directory entry together with its decoded inode, as shown by `ls`.
struct ListingRow {
    DirEntry entry;
    Inode inode;
};

void printSuperblock(std::ostream& out, const Superblock& sb, uint64_t imageSize);
void printVersion(std::ostream& out, const Superblock& sb);
void printDate(std::ostream& out, const Superblock& sb);
void printCompression(std::ostream& out, const Superblock& sb);
void printBlockSize(std::ostream& out, const Superblock& sb);
void printFlags(std::ostream& out, const Superblock& sb);
void printOffsets(std::ostream& out, const Superblock& sb);
void printSize(std::ostream& out, const Superblock& sb, uint64_t imageSize);

// Checks the first four bytes against "hsqs".
void printMagic(std::ostream& out, const std::vector<uint8_t>& header);
// 16 bytes per row: offset, hex, ASCII.
void printHexDump(std::ostream& out, const std::vector<uint8_t>& bytes, uint64_t baseOffset = 0);
// Decimal byte values, 8 per row.
void printRawBytes(std::ostream& out, const std::vector<uint8_t>& bytes);

void printInode(std::ostream& out, const Inode& inode);
void printListing(std::ostream& out, const std::vector<ListingRow>& rows);
void printIdTable(std::ostream& out, const IdTable& ids);
void printFragmentTable(std::ostream& out, const FragmentTable& fragments);

// True when the bytes look like text worth printing as-is.
bool isPrintableText(const std::vector<uint8_t>& bytes);
