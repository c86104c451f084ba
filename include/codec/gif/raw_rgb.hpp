#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifrgb::codec::gif {

inline constexpr std::size_t kMaxDimension = 0xFFFF;
inline constexpr std::size_t kBytesPerPixel = 3;

// Packed RGB triples, row-major, no header.
struct RawImage {
    std::size_t width {0};
    std::size_t height {0};
    std::vector<std::uint8_t> rgb;
};

RawImage parseRawImage(std::vector<std::uint8_t> bytes, std::size_t width);

} // namespace gifrgb::codec::gif
