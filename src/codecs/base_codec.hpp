#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

class BaseCodec {
public:
    virtual ~BaseCodec() = default;
    virtual std::string name() const = 0;
    virtual uint16_t id() const = 0;
    // Throws DecompressError on malformed input or when the output would
    // exceed maxOutput bytes.
    virtual std::vector<uint8_t> decompress(const uint8_t* data, size_t len, size_t maxOutput) const = 0;
};
