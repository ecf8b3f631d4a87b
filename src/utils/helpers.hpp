#pragma once
#include <cstdint>
#include <vector>
#include <string>
#include <ctime>
#include <iomanip>
#include <sstream>

//
// Little-endian readers
//
uint16_t read_le16(const uint8_t* p);
uint32_t read_le32(const uint8_t* p);
uint64_t read_le64(const uint8_t* p);

uint16_t read_le16(const std::vector<uint8_t>& blob, size_t offset);
uint32_t read_le32(const std::vector<uint8_t>& blob, size_t offset);
uint64_t read_le64(const std::vector<uint8_t>& blob, size_t offset);

//
// Formatting
//
std::string format_timestamp(uint32_t ts);
std::string format_size(uint64_t bytes);
std::string format_mode(uint16_t mode, char typeChar);
std::string to_hex(uint64_t value);
std::string to_hex_padded(uint64_t value, int width);
std::string printable_ascii(const uint8_t* data, size_t len);
