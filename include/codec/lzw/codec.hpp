#pragma once

#include "codec/diagnostics.hpp"
#include "codec/lzw/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifrgb::codec::lzw {

// Decodes a framed code stream up to EndCode. A non-zero `pixelLimit`
// reserves the output up front and raises ConsistencyError as soon as a
// code would expand past it.
DecodeResult decodeCodeStream(std::uint8_t minimumCodeSize,
                              const std::uint8_t* data,
                              std::size_t size,
                              Diagnostics& diagnostics,
                              std::size_t pixelLimit = 0);

EncodeResult encodeIndexStream(std::uint8_t minimumCodeSize,
                               const std::vector<std::uint8_t>& indices,
                               DictionaryFullPolicy policy,
                               Diagnostics& diagnostics);

} // namespace gifrgb::codec::lzw
