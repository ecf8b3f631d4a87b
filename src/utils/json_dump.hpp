#pragma once
#include <cstdint>
#include <string>
#include "superblock.hpp"

// Writes the superblock as a JSON object. Returns false if the file could
// not be written.
bool dumpSuperblockJson(const Superblock& sb, uint64_t imageSize, const std::string& filename);
