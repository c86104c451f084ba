#pragma once

#include "codec/gif/raw_rgb.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifrgb::codec::gif {

inline constexpr std::size_t kMaxPaletteSize = 256;

struct Color {
    std::uint8_t red {0};
    std::uint8_t green {0};
    std::uint8_t blue {0};
};

bool operator==(const Color& lhs, const Color& rhs) noexcept;
bool operator<(const Color& lhs, const Color& rhs) noexcept;

using Palette = std::vector<Color>;

// Distinct colours of the image in ascending RGB byte order.
Palette buildPalette(const RawImage& image);

std::vector<std::uint8_t> indexImage(const RawImage& image, const Palette& palette);
std::vector<std::uint8_t> applyPalette(const std::vector<std::uint8_t>& indices, const Palette& palette);

// Bits needed for a colour table holding `colorCount` entries (1..8).
std::uint8_t paletteBitDepth(std::size_t colorCount);

Palette parsePalette(const std::uint8_t* data, std::size_t colorCount);

// Serialised colour table padded with black to 2^bitDepth entries.
std::vector<std::uint8_t> serializePalette(const Palette& palette, std::uint8_t bitDepth);

} // namespace gifrgb::codec::gif
