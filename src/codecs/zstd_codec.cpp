#include "codecs.hpp"
#include "errors.hpp"
#include "format.hpp"
#include <zstd.h>

class ZstdCodec : public BaseCodec {
public:
    std::string name() const override { return "ZSTD"; }
    uint16_t id() const override { return static_cast<uint16_t>(CompressionId::ZSTD); }

    std::vector<uint8_t> decompress(const uint8_t* data, size_t len, size_t maxOutput) const override {
        std::vector<uint8_t> out(maxOutput);
        size_t produced = ZSTD_decompress(out.data(), out.size(), data, len);
        if (ZSTD_isError(produced)) {
            throw DecompressError(std::string("zstd: ") + ZSTD_getErrorName(produced));
        }
        out.resize(produced);
        return out;
    }
};

std::unique_ptr<BaseCodec> makeZstdCodec() {
    return std::make_unique<ZstdCodec>();
}
