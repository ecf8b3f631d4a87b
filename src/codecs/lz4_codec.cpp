#include "codecs.hpp"
#include "errors.hpp"
#include "format.hpp"
#include <lz4.h>

// Raw LZ4 blocks (no frame), as written by mksquashfs.
class Lz4Codec : public BaseCodec {
public:
    std::string name() const override { return "LZ4"; }
    uint16_t id() const override { return static_cast<uint16_t>(CompressionId::LZ4); }

    std::vector<uint8_t> decompress(const uint8_t* data, size_t len, size_t maxOutput) const override {
        std::vector<uint8_t> out(maxOutput);
        int produced = LZ4_decompress_safe(reinterpret_cast<const char*>(data),
                                           reinterpret_cast<char*>(out.data()),
                                           static_cast<int>(len),
                                           static_cast<int>(maxOutput));
        if (produced < 0) {
            throw DecompressError("lz4: malformed block");
        }
        out.resize(static_cast<size_t>(produced));
        return out;
    }
};

std::unique_ptr<BaseCodec> makeLz4Codec() {
    return std::make_unique<Lz4Codec>();
}
