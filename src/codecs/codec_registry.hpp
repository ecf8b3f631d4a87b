// codec_registry.hpp
#pragma once
#include "base_codec.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

// Compression id -> decompressor. Built explicitly and owned by whoever opens
// an image; there is no process-wide instance.
class CodecRegistry {
public:
    // GZIP, LZMA and XZ, plus LZ4/ZSTD when the build found those libraries.
    static std::shared_ptr<CodecRegistry> withDefaults();

    void registerCodec(std::unique_ptr<BaseCodec> codec);

    bool supports(uint16_t id) const;
    const BaseCodec& get(uint16_t id) const;

    std::vector<uint8_t> decompress(uint16_t id, const uint8_t* data, size_t len, size_t maxOutput) const;
    std::vector<uint8_t> decompress(uint16_t id, const std::vector<uint8_t>& data, size_t maxOutput) const {
        return decompress(id, data.data(), data.size(), maxOutput);
    }

    std::vector<std::string> names() const;

private:
    std::map<uint16_t, std::unique_ptr<BaseCodec>> codecs;
};
