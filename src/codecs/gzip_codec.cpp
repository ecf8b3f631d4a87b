#include "codecs.hpp"
#include "errors.hpp"
#include "format.hpp"
#include <zlib.h>

// SquashFS "gzip" blocks are plain zlib streams (deflate with a zlib header).
class GzipCodec : public BaseCodec {
public:
    std::string name() const override { return "GZIP"; }
    uint16_t id() const override { return static_cast<uint16_t>(CompressionId::GZIP); }

    std::vector<uint8_t> decompress(const uint8_t* data, size_t len, size_t maxOutput) const override {
        // One spare byte tells "fits exactly" apart from "ran out of room".
        std::vector<uint8_t> out(maxOutput + 1);
        z_stream strm{};
        strm.next_in = const_cast<Bytef*>(data);
        strm.avail_in = static_cast<uInt>(len);
        strm.next_out = out.data();
        strm.avail_out = static_cast<uInt>(out.size());

        if (inflateInit(&strm) != Z_OK) {
            throw DecompressError("zlib: inflateInit failed");
        }
        int ret = inflate(&strm, Z_FINISH);
        size_t produced = out.size() - strm.avail_out;
        inflateEnd(&strm);

        if (ret != Z_STREAM_END) {
            throw DecompressError("zlib: inflate returned " + std::to_string(ret));
        }
        if (produced > maxOutput) {
            throw DecompressError("zlib: output exceeds " + std::to_string(maxOutput) + " bytes");
        }
        out.resize(produced);
        return out;
    }
};

std::unique_ptr<BaseCodec> makeGzipCodec() {
    return std::make_unique<GzipCodec>();
}
