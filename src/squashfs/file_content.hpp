#pragma once
#include <cstdint>
#include <vector>
#include "codec_registry.hpp"
#include "image_file.hpp"
#include "inode.hpp"
#include "superblock.hpp"
#include "tables.hpp"

// Rebuilds regular file contents from data blocks and the fragment tail.
class FileContentReader {
public:
    FileContentReader(const ImageFile& image, const CodecRegistry& codecs,
                      const Superblock& sb, const FragmentTable& fragments);

    // Exactly file.fileSize bytes, or TruncatedFile / CorruptBlock.
    std::vector<uint8_t> read(const Inode& file) const;

    // Decompressed block `index` of the file's block list (zeros for a
    // sparse block).
    std::vector<uint8_t> readBlock(const Inode& file, size_t index) const;

    // The slice of the shared fragment block that belongs to `file`.
    std::vector<uint8_t> readFragmentTail(const Inode& file) const;

private:
    std::vector<uint8_t> loadBlock(uint64_t offset, uint32_t sizeWord) const;
    uint64_t blockOffset(const Inode& file, size_t index) const;

    const ImageFile& image;
    const CodecRegistry& codecs;
    const Superblock& sb;
    const FragmentTable& fragments;
};
