#pragma once

#include "codec/diagnostics.hpp"
#include "codec/lzw/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifrgb::codec::lzw {

struct DecodeRequest {
    std::uint8_t minimumCodeSize {kMinMinimumCodeSize};
    std::vector<std::uint8_t> framed;
    std::size_t width {0};
    std::size_t height {0};
    bool interlaced {false};
};

struct EncodeRequest {
    std::vector<std::uint8_t> indices;
    std::size_t width {0};
    std::size_t height {0};
    std::uint8_t minimumCodeSize {kMinMinimumCodeSize};
    DictionaryFullPolicy policy {DictionaryFullPolicy::Reset};
};

// Returns width*height palette indices in logical row-major order.
std::vector<std::uint8_t> decode(const DecodeRequest& request, Diagnostics& diagnostics);

// Returns the sub-block framed code stream, terminator included.
std::vector<std::uint8_t> encode(const EncodeRequest& request, Diagnostics& diagnostics);

std::uint8_t minimumCodeSize(std::size_t colorCount);

} // namespace gifrgb::codec::lzw
