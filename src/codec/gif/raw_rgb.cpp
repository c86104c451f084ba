#include "codec/gif/raw_rgb.hpp"

#include "codec/errors.hpp"

#include <utility>

namespace gifrgb::codec::gif {

RawImage parseRawImage(std::vector<std::uint8_t> bytes, std::size_t width)
{
    if (width == 0U || width > kMaxDimension) {
        throw CapacityError("Invalid width: must be between 1 and 65535 pixels");
    }

    const auto rowSize = width * kBytesPerPixel;
    if (bytes.empty() || bytes.size() % rowSize != 0U) {
        throw InputFormatError("Invalid file size");
    }

    const auto height = bytes.size() / rowSize;
    if (height > kMaxDimension) {
        throw InputFormatError("Invalid file size: image is taller than 65535 pixels");
    }

    RawImage image {};
    image.width = width;
    image.height = height;
    image.rgb = std::move(bytes);
    return image;
}

} // namespace gifrgb::codec::gif
