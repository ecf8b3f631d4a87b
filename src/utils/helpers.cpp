#include "helpers.hpp"
#include <cstdint>
#include <vector>
#include <string>
#include <charconv>
#include <array>

//
// Little-endian readers
//
uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>((p[1] << 8) | p[0]);
}

uint32_t read_le32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[3]) << 24) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[0]));
}

uint64_t read_le64(const uint8_t* p) {
    return (static_cast<uint64_t>(p[7]) << 56) |
           (static_cast<uint64_t>(p[6]) << 48) |
           (static_cast<uint64_t>(p[5]) << 40) |
           (static_cast<uint64_t>(p[4]) << 32) |
           (static_cast<uint64_t>(p[3]) << 24) |
           (static_cast<uint64_t>(p[2]) << 16) |
           (static_cast<uint64_t>(p[1]) << 8)  |
           (static_cast<uint64_t>(p[0]));
}

uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset) {
    return read_le16(&blob[offset]);
}

uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset) {
    return read_le32(&blob[offset]);
}

uint64_t read_le64(const std::vector<uint8_t>& blob, size_t offset) {
    return read_le64(&blob[offset]);
}

std::string format_timestamp(uint32_t ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm gmt{};
    gmtime_r(&t, &gmt);
    std::ostringstream oss;
    oss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S UTC");
    return oss.str();
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

// ls-style "drwxr-xr-x" rendering of the permission bits.
std::string format_mode(uint16_t mode, char typeChar) {
    std::string out(10, '-');
    out[0] = typeChar;
    const char* rwx = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (0400 >> i)) out[1 + i] = rwx[i];
    }
    if (mode & 04000) out[3] = (mode & 0100) ? 's' : 'S';
    if (mode & 02000) out[6] = (mode & 0010) ? 's' : 'S';
    if (mode & 01000) out[9] = (mode & 0001) ? 't' : 'T';
    return out;
}

std::string to_hex(uint64_t value)
{
   std::array<char, 32> buffer;
   auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(),
                              value, 16);  // base 16

   std::string hex(buffer.data(), result.ptr);
   return hex;
}

std::string to_hex_padded(uint64_t value, int width)
{
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

std::string printable_ascii(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        out += (data[i] >= 32 && data[i] <= 126) ? static_cast<char>(data[i]) : '.';
    }
    return out;
}
