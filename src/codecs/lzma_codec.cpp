#include "codecs.hpp"
#include "errors.hpp"
#include "format.hpp"
#include <lzma.h>  // Requires liblzma (xz-utils)

namespace {

std::vector<uint8_t> runDecoder(lzma_stream& strm, const char* label,
                                const uint8_t* data, size_t len, size_t maxOutput) {
    std::vector<uint8_t> out(maxOutput + 1);
    strm.next_in = data;
    strm.avail_in = len;
    strm.next_out = out.data();
    strm.avail_out = out.size();

    lzma_ret ret = lzma_code(&strm, LZMA_FINISH);
    size_t produced = out.size() - strm.avail_out;
    lzma_end(&strm);

    if (ret != LZMA_STREAM_END) {
        throw DecompressError(std::string(label) + ": decoder returned " + std::to_string(ret));
    }
    if (produced > maxOutput) {
        throw DecompressError(std::string(label) + ": output exceeds " + std::to_string(maxOutput) + " bytes");
    }
    out.resize(produced);
    return out;
}

}

// Legacy LZMA blocks carry the 13-byte lzma_alone header.
class LzmaCodec : public BaseCodec {
public:
    std::string name() const override { return "LZMA"; }
    uint16_t id() const override { return static_cast<uint16_t>(CompressionId::LZMA); }

    std::vector<uint8_t> decompress(const uint8_t* data, size_t len, size_t maxOutput) const override {
        lzma_stream strm = LZMA_STREAM_INIT;
        if (lzma_alone_decoder(&strm, UINT64_MAX) != LZMA_OK) {
            throw DecompressError("lzma: failed to init decoder");
        }
        return runDecoder(strm, "lzma", data, len, maxOutput);
    }
};

class XzCodec : public BaseCodec {
public:
    std::string name() const override { return "XZ"; }
    uint16_t id() const override { return static_cast<uint16_t>(CompressionId::XZ); }

    std::vector<uint8_t> decompress(const uint8_t* data, size_t len, size_t maxOutput) const override {
        lzma_stream strm = LZMA_STREAM_INIT;
        if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
            throw DecompressError("xz: failed to init decoder");
        }
        return runDecoder(strm, "xz", data, len, maxOutput);
    }
};

std::unique_ptr<BaseCodec> makeLzmaCodec() {
    return std::make_unique<LzmaCodec>();
}

std::unique_ptr<BaseCodec> makeXzCodec() {
    return std::make_unique<XzCodec>();
}
