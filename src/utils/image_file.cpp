#include "image_file.hpp"
#include "errors.hpp"
#include <system_error>

ImageFile::ImageFile(const fs::path& path) : filePath(path) {
    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec)) {
        throw IoError("not a regular file: " + filePath.string());
    }
    fileSize = fs::file_size(filePath, ec);
    if (ec) {
        throw IoError("cannot stat " + filePath.string() + ": " + ec.message());
    }
    stream.open(filePath, std::ios::binary);
    if (!stream) {
        throw IoError("cannot open " + filePath.string());
    }
}

std::vector<uint8_t> ImageFile::read(uint64_t offset, size_t length) const {
    if (offset > fileSize || length > fileSize - offset) {
        throw TruncatedImage(offset, length);
    }
    std::vector<uint8_t> out(length);
    readInto(offset, out.data(), length);
    return out;
}

std::vector<uint8_t> ImageFile::readUpTo(uint64_t offset, size_t length) const {
    if (offset >= fileSize) {
        return {};
    }
    uint64_t available = fileSize - offset;
    if (length > available) {
        length = static_cast<size_t>(available);
    }
    std::vector<uint8_t> out(length);
    readInto(offset, out.data(), length);
    return out;
}

void ImageFile::readInto(uint64_t offset, uint8_t* dst, size_t length) const {
    if (length == 0) return;
    std::lock_guard<std::mutex> lock(mutex);
    stream.clear();
    stream.seekg(static_cast<std::streamoff>(offset));
    stream.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(length));
    if (static_cast<size_t>(stream.gcount()) != length) {
        throw IoError("short read of " + std::to_string(length) + " bytes at 0x" +
                      to_hex(offset) + " in " + filePath.string());
    }
}
