#include "file_content.hpp"
#include "errors.hpp"
#include <algorithm>

FileContentReader::FileContentReader(const ImageFile& image, const CodecRegistry& codecs,
                                     const Superblock& sb, const FragmentTable& fragments)
    : image(image), codecs(codecs), sb(sb), fragments(fragments) {}

std::vector<uint8_t> FileContentReader::loadBlock(uint64_t offset, uint32_t sizeWord) const {
    uint32_t onDisk = sizeWord & DATA_SIZE_MASK;
    bool stored = (sizeWord & DATA_UNCOMPRESSED_BIT) != 0;
    if (onDisk == 0 || onDisk > sb.blockSize) {
        throw CorruptBlock(offset, "data block declares " + std::to_string(onDisk) + " bytes on disk");
    }

    auto raw = image.read(offset, onDisk);
    if (stored) {
        return raw;
    }
    try {
        return codecs.decompress(sb.compressionId, raw, sb.blockSize);
    } catch (const DecompressError& e) {
        throw CorruptBlock(offset, e.what());
    }
}

uint64_t FileContentReader::blockOffset(const Inode& file, size_t index) const {
    uint64_t offset = file.blocksStart;
    for (size_t i = 0; i < index; ++i) {
        offset += file.blockSizes[i] & DATA_SIZE_MASK;
    }
    return offset;
}

std::vector<uint8_t> FileContentReader::read(const Inode& file) const {
    if (!file.isFile()) {
        throw NotAFile("inode " + std::to_string(file.inodeNumber) + " is a " + file.typeName());
    }

    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(std::min<uint64_t>(file.fileSize, sb.bytesUsed)));

    uint64_t position = file.blocksStart;
    uint64_t remaining = file.fileSize;
    for (uint32_t word : file.blockSizes) {
        size_t expected = static_cast<size_t>(std::min<uint64_t>(sb.blockSize, remaining));
        if (word == 0) {
            // Sparse: a hole of zeros, nothing stored on disk.
            out.insert(out.end(), expected, 0);
            remaining -= expected;
            continue;
        }
        auto block = loadBlock(position, word);
        position += word & DATA_SIZE_MASK;

        size_t take = std::min(block.size(), expected);
        out.insert(out.end(), block.begin(), block.begin() + take);
        remaining -= take;
        if (take < expected) {
            throw TruncatedFile(file.fileSize, out.size());
        }
    }

    if (file.hasFragment() && remaining > 0) {
        auto tail = readFragmentTail(file);
        out.insert(out.end(), tail.begin(), tail.end());
    }

    if (out.size() != file.fileSize) {
        throw TruncatedFile(file.fileSize, out.size());
    }
    return out;
}

std::vector<uint8_t> FileContentReader::readBlock(const Inode& file, size_t index) const {
    if (!file.isFile()) {
        throw NotAFile("inode " + std::to_string(file.inodeNumber) + " is a " + file.typeName());
    }
    if (index >= file.blockSizes.size()) {
        throw CorruptBlock(file.blocksStart, "block " + std::to_string(index) + " of a file with " +
                           std::to_string(file.blockSizes.size()) + " blocks");
    }
    uint32_t word = file.blockSizes[index];
    if (word == 0) {
        uint64_t before = static_cast<uint64_t>(index) * sb.blockSize;
        return std::vector<uint8_t>(static_cast<size_t>(std::min<uint64_t>(sb.blockSize, file.fileSize - before)), 0);
    }
    return loadBlock(blockOffset(file, index), word);
}

std::vector<uint8_t> FileContentReader::readFragmentTail(const Inode& file) const {
    if (!file.hasFragment()) {
        return {};
    }
    uint64_t tailSize = file.fileSize & (sb.blockSize - 1);
    const FragmentEntry& entry = fragments.at(file.fragment);
    auto block = loadBlock(entry.start, entry.size);

    if (file.fragmentOffset > block.size() || tailSize > block.size() - file.fragmentOffset) {
        // Keep what the fragment actually holds; read() reports the shortfall.
        size_t available = file.fragmentOffset < block.size() ? block.size() - file.fragmentOffset : 0;
        return std::vector<uint8_t>(block.begin() + (block.size() - available), block.end());
    }
    return std::vector<uint8_t>(block.begin() + file.fragmentOffset,
                                block.begin() + file.fragmentOffset + tailSize);
}
