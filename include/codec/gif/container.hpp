#pragma once

#include "codec/diagnostics.hpp"
#include "codec/gif/palette.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gifrgb::codec::gif {

inline constexpr std::uint8_t kImageSeparator = 0x2C;       // ','
inline constexpr std::uint8_t kExtensionIntroducer = 0x21;  // '!'
inline constexpr std::uint8_t kTrailer = 0x3B;              // ';'

inline constexpr std::uint8_t kPlainTextLabel = 0x01;
inline constexpr std::uint8_t kGraphicControlLabel = 0xF9;
inline constexpr std::uint8_t kCommentLabel = 0xFE;
inline constexpr std::uint8_t kApplicationLabel = 0xFF;

inline constexpr std::uint8_t kColorTableFlag = 0x80;
inline constexpr std::uint8_t kInterlaceFlag = 0x40;
inline constexpr std::uint8_t kColorTableSizeMask = 0x07;

// Bounds-checked little-endian cursor over an in-memory GIF file.
class ByteReader {
public:
    explicit ByteReader(const std::vector<std::uint8_t>& data);

    std::uint8_t readByte();
    std::uint16_t readWord();
    std::string readText(std::size_t length);
    const std::uint8_t* take(std::size_t length);
    void skip(std::size_t length);

    // Skips a sub-block chain including its terminator; returns the payload size.
    std::size_t skipSubBlocks();

    std::size_t position() const noexcept;

private:
    void require(std::size_t length) const;

    const std::vector<std::uint8_t>& data_;
    std::size_t position_ {0};
};

// First image of a GIF file with the colour table that applies to it.
struct GifImage {
    std::size_t width {0};
    std::size_t height {0};
    bool interlaced {false};
    Palette palette;
    std::uint8_t minimumCodeSize {0};
    std::vector<std::uint8_t> framed;
};

GifImage readGif(const std::vector<std::uint8_t>& data, Diagnostics& diagnostics);

// GIF87a with a global colour table and one non-interlaced image.
std::vector<std::uint8_t> writeGif(std::size_t width,
                                   std::size_t height,
                                   const Palette& palette,
                                   std::uint8_t minimumCodeSize,
                                   const std::vector<std::uint8_t>& framed);

} // namespace gifrgb::codec::gif
