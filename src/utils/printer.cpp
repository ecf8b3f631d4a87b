#include "printer.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

void heading(std::ostream& out, const std::string& title) {
    out << ansi::bold << ansi::yellow << title << ansi::reset << "\n";
}

void field(std::ostream& out, const std::string& label, const std::string& value) {
    out << "  " << ansi::cyan << std::left << std::setw(22) << label << ansi::reset << value << "\n";
}

std::string octal(uint16_t mode) {
    std::ostringstream oss;
    oss << "0" << std::oct << std::setw(4) << std::setfill('0') << mode;
    return oss.str();
}

std::string tableOffset(uint64_t start) {
    return start == INVALID_TABLE ? std::string("(none)") : to_hex_padded(start, 8);
}

}

void printSuperblock(std::ostream& out, const Superblock& sb, uint64_t imageSize) {
    heading(out, "SquashFS superblock");
    field(out, "Magic", to_hex_padded(sb.magic, 8) + " (hsqs)");
    field(out, "Version", std::to_string(sb.versionMajor) + "." + std::to_string(sb.versionMinor));
    field(out, "Inodes", std::to_string(sb.inodeCount));
    field(out, "Modified", format_timestamp(sb.modificationTime));
    field(out, "Block size", std::to_string(sb.blockSize) + " (log " + std::to_string(sb.blockLog) + ")");
    field(out, "Fragments", std::to_string(sb.fragmentEntryCount));
    field(out, "Compression", compressionName(sb.compressionId));
    field(out, "Flags", to_hex_padded(sb.flags, 4));
    field(out, "IDs", std::to_string(sb.idCount));
    field(out, "Root inode", to_hex_padded(sb.rootInodeRef.raw, 12) + " (block " +
          std::to_string(sb.rootInodeRef.block()) + ", offset " +
          std::to_string(sb.rootInodeRef.offset()) + ")");
    field(out, "Bytes used", std::to_string(sb.bytesUsed) + " (" + format_size(sb.bytesUsed) + ")");
    field(out, "Image size", std::to_string(imageSize) + " (" + format_size(imageSize) + ")");
    field(out, "ID table", tableOffset(sb.idTableStart));
    field(out, "Xattr ID table", tableOffset(sb.xattrIdTableStart));
    field(out, "Inode table", tableOffset(sb.inodeTableStart));
    field(out, "Directory table", tableOffset(sb.directoryTableStart));
    field(out, "Fragment table", tableOffset(sb.fragmentTableStart));
    field(out, "Export table", tableOffset(sb.exportTableStart));
}

void printVersion(std::ostream& out, const Superblock& sb) {
    out << "SquashFS " << sb.versionMajor << "." << sb.versionMinor << "\n";
}

void printDate(std::ostream& out, const Superblock& sb) {
    out << format_timestamp(sb.modificationTime) << " (" << sb.modificationTime << ")\n";
}

void printCompression(std::ostream& out, const Superblock& sb) {
    out << compressionName(sb.compressionId) << " (id " << sb.compressionId << ")";
    std::string description = compressionDescription(sb.compressionId);
    if (!description.empty()) {
        out << ": " << description;
    }
    out << "\n";
}

void printBlockSize(std::ostream& out, const Superblock& sb) {
    out << sb.blockSize << " bytes (" << format_size(sb.blockSize) << ", log " << sb.blockLog << ")\n";
}

void printFlags(std::ostream& out, const Superblock& sb) {
    out << "Flags: " << to_hex_padded(sb.flags, 4) << "\n";
    for (const auto& flag : flagNames(sb.flags)) {
        out << "  " << to_hex_padded(flag.first, 4) << " " << flag.second << "\n";
    }
}

void printOffsets(std::ostream& out, const Superblock& sb) {
    heading(out, "Table offsets");
    field(out, "Inode table", tableOffset(sb.inodeTableStart));
    field(out, "Directory table", tableOffset(sb.directoryTableStart));
    field(out, "Fragment table", tableOffset(sb.fragmentTableStart));
    field(out, "Export table", tableOffset(sb.exportTableStart));
    field(out, "ID table", tableOffset(sb.idTableStart));
    field(out, "Xattr ID table", tableOffset(sb.xattrIdTableStart));
}

void printSize(std::ostream& out, const Superblock& sb, uint64_t imageSize) {
    out << "Bytes used: " << sb.bytesUsed << " (" << format_size(sb.bytesUsed) << ")\n";
    out << "Image size: " << imageSize << " (" << format_size(imageSize) << ")\n";
    if (imageSize < sb.bytesUsed) {
        out << ansi::red << "Image is shorter than bytes_used" << ansi::reset << "\n";
    }
}

void printMagic(std::ostream& out, const std::vector<uint8_t>& header) {
    if (header.size() < 4) {
        out << "Magic: (image shorter than 4 bytes)\n";
        return;
    }
    uint32_t magic = read_le32(header, 0);
    out << "Magic: " << to_hex_padded(magic, 8) << " \"" << printable_ascii(header.data(), 4) << "\" ";
    if (magic == SQUASHFS_MAGIC) {
        out << ansi::green << "valid" << ansi::reset << "\n";
    } else {
        out << ansi::red << "invalid" << ansi::reset << " (expected 0x73717368 \"hsqs\")\n";
    }
}

void printHexDump(std::ostream& out, const std::vector<uint8_t>& bytes, uint64_t baseOffset) {
    for (size_t row = 0; row < bytes.size(); row += 16) {
        size_t count = std::min<size_t>(16, bytes.size() - row);
        std::ostringstream line;
        line << std::hex << std::setfill('0') << std::setw(8) << (baseOffset + row) << "  ";
        for (size_t i = 0; i < 16; ++i) {
            if (i < count) {
                line << std::setw(2) << static_cast<int>(bytes[row + i]) << " ";
            } else {
                line << "   ";
            }
            if (i == 7) line << " ";
        }
        line << " |" << printable_ascii(bytes.data() + row, count) << "|";
        out << line.str() << "\n";
    }
}

void printRawBytes(std::ostream& out, const std::vector<uint8_t>& bytes) {
    for (size_t row = 0; row < bytes.size(); row += 8) {
        size_t count = std::min<size_t>(8, bytes.size() - row);
        std::ostringstream line;
        line << std::hex << std::setfill('0') << std::setw(4) << row << ":" << std::dec << std::setfill(' ');
        for (size_t i = 0; i < count; ++i) {
            line << " " << std::setw(3) << static_cast<int>(bytes[row + i]);
        }
        out << line.str() << "\n";
    }
}

void printInode(std::ostream& out, const Inode& inode) {
    heading(out, "Inode " + std::to_string(inode.inodeNumber));
    field(out, "Type", inode.typeName() + (inode.isExtended() ? " (extended)" : ""));
    field(out, "Mode", format_mode(inode.mode, inode.typeChar()) + " (" + octal(inode.mode) + ")");
    field(out, "Owner", std::to_string(inode.uid) + ":" + std::to_string(inode.gid));
    field(out, "Links", std::to_string(inode.nlink));
    field(out, "Modified", format_timestamp(inode.mtime));
    field(out, "Reference", to_hex_padded(inode.ref.raw, 12));

    if (inode.isDirectory()) {
        field(out, "Entries size", std::to_string(inode.size()));
        field(out, "Parent inode", std::to_string(inode.parentInode));
        field(out, "Listing at", "block " + std::to_string(inode.startBlock) +
              ", offset " + std::to_string(inode.dirOffset));
        if (!inode.dirIndex.empty()) {
            field(out, "Index entries", std::to_string(inode.dirIndex.size()));
        }
    } else if (inode.isFile()) {
        field(out, "Size", std::to_string(inode.fileSize) + " (" + format_size(inode.fileSize) + ")");
        field(out, "Blocks", std::to_string(inode.blockSizes.size()) + " starting at " +
              to_hex_padded(inode.blocksStart, 8));
        if (inode.hasFragment()) {
            field(out, "Fragment", std::to_string(inode.fragment) + " at offset " +
                  std::to_string(inode.fragmentOffset));
        }
        if (inode.sparse) {
            field(out, "Sparse bytes", std::to_string(inode.sparse));
        }
    } else if (inode.isSymlink()) {
        field(out, "Target", std::string(inode.symlinkTarget.begin(), inode.symlinkTarget.end()));
    } else if (inode.isDevice()) {
        field(out, "Device", std::to_string((inode.rdev >> 8) & 0xFFF) + "," +
              std::to_string((inode.rdev & 0xFF) | ((inode.rdev >> 12) & 0xFFF00)));
    }
    if (inode.xattrIdx != INVALID_XATTR) {
        field(out, "Xattr index", std::to_string(inode.xattrIdx));
    }
}

void printListing(std::ostream& out, const std::vector<ListingRow>& rows) {
    for (const auto& row : rows) {
        const Inode& inode = row.inode;
        out << format_mode(inode.mode, inode.typeChar()) << " "
            << std::right << std::setw(5) << inode.uid << " "
            << std::setw(5) << inode.gid << " "
            << std::setw(12) << inode.size() << " "
            << format_timestamp(inode.mtime) << " ";
        if (inode.isDirectory()) {
            out << ansi::bold << ansi::cyan << row.entry.name << ansi::reset;
        } else if (inode.isSymlink()) {
            out << ansi::magenta << row.entry.name << ansi::reset << " -> "
                << std::string(inode.symlinkTarget.begin(), inode.symlinkTarget.end());
        } else {
            out << row.entry.name;
        }
        out << "\n";
    }
    out << rows.size() << " entries\n";
}

void printIdTable(std::ostream& out, const IdTable& ids) {
    heading(out, "ID table (" + std::to_string(ids.size()) + " entries)");
    for (size_t i = 0; i < ids.size(); ++i) {
        out << "  [" << i << "] " << ids.ids()[i] << "\n";
    }
}

void printFragmentTable(std::ostream& out, const FragmentTable& fragments) {
    heading(out, "Fragment table (" + std::to_string(fragments.size()) + " entries)");
    for (size_t i = 0; i < fragments.size(); ++i) {
        const FragmentEntry& entry = fragments.entries()[i];
        out << "  [" << i << "] start " << to_hex_padded(entry.start, 8)
            << " size " << entry.onDiskSize()
            << (entry.uncompressed() ? " (stored)" : " (compressed)") << "\n";
    }
}

bool isPrintableText(const std::vector<uint8_t>& bytes) {
    for (uint8_t c : bytes) {
        if (c == '\n' || c == '\r' || c == '\t') continue;
        if (c < 32 || c == 127) return false;
    }
    return true;
}
