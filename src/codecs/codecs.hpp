#pragma once
#include "base_codec.hpp"
#include <memory>

std::unique_ptr<BaseCodec> makeGzipCodec();
std::unique_ptr<BaseCodec> makeLzmaCodec();
std::unique_ptr<BaseCodec> makeXzCodec();
#ifdef SQUASHDIG_HAVE_LZ4
std::unique_ptr<BaseCodec> makeLz4Codec();
#endif
#ifdef SQUASHDIG_HAVE_ZSTD
std::unique_ptr<BaseCodec> makeZstdCodec();
#endif
