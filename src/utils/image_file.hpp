#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

// Random access reader over an image on disk. Reads are serialised so one
// instance can be shared by concurrent lookups.
class ImageFile {
public:
    explicit ImageFile(const fs::path& path);

    // Exactly `length` bytes at `offset`, or TruncatedImage.
    std::vector<uint8_t> read(uint64_t offset, size_t length) const;
    // Up to `length` bytes at `offset`, clamped to the end of the file.
    std::vector<uint8_t> readUpTo(uint64_t offset, size_t length) const;

    uint64_t size() const { return fileSize; }
    const fs::path& path() const { return filePath; }

private:
    void readInto(uint64_t offset, uint8_t* dst, size_t length) const;

    fs::path filePath;
    uint64_t fileSize = 0;
    mutable std::ifstream stream;
    mutable std::mutex mutex;
};
