#include "codec/gif/palette.hpp"

#include "codec/errors.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <omp.h>
#include <set>
#include <stdexcept>
#include <tuple>

namespace gifrgb::codec::gif {
namespace {

Color pixelAt(const RawImage& image, std::size_t pixel)
{
    const auto offset = pixel * kBytesPerPixel;
    return Color {image.rgb[offset], image.rgb[offset + 1], image.rgb[offset + 2]};
}

} // namespace

bool operator==(const Color& lhs, const Color& rhs) noexcept
{
    return lhs.red == rhs.red && lhs.green == rhs.green && lhs.blue == rhs.blue;
}

bool operator<(const Color& lhs, const Color& rhs) noexcept
{
    return std::tie(lhs.red, lhs.green, lhs.blue) < std::tie(rhs.red, rhs.green, rhs.blue);
}

Palette buildPalette(const RawImage& image)
{
    const auto pixelCount = static_cast<std::int64_t>(image.rgb.size() / kBytesPerPixel);
    const int threadCount = omp_get_max_threads();
    std::vector<std::set<Color>> threadColors(static_cast<std::size_t>(threadCount));
    std::atomic<bool> overflow {false};

    #pragma omp parallel num_threads(threadCount)
    {
        auto& local = threadColors[static_cast<std::size_t>(omp_get_thread_num())];

        #pragma omp for
        for (std::int64_t pixel = 0; pixel < pixelCount; ++pixel) {
            if (overflow.load(std::memory_order_relaxed)) {
                continue;
            }
            local.insert(pixelAt(image, static_cast<std::size_t>(pixel)));
            if (local.size() > kMaxPaletteSize) {
                overflow.store(true, std::memory_order_relaxed);
            }
        }
    }

    // Merge all per-thread sets; the merged set stays sorted.
    std::set<Color> distinct;
    for (const auto& local : threadColors) {
        distinct.insert(local.begin(), local.end());
    }

    if (overflow.load() || distinct.size() > kMaxPaletteSize) {
        throw CapacityError("Too many colors: GIF images hold at most 256");
    }

    return Palette(distinct.begin(), distinct.end());
}

std::vector<std::uint8_t> indexImage(const RawImage& image, const Palette& palette)
{
    const auto pixelCount = image.rgb.size() / kBytesPerPixel;

    std::vector<std::uint8_t> indices;
    indices.reserve(pixelCount);

    for (std::size_t pixel = 0; pixel < pixelCount; ++pixel) {
        const auto color = pixelAt(image, pixel);
        const auto iterator = std::lower_bound(palette.begin(), palette.end(), color);
        if (iterator == palette.end() || !(*iterator == color)) {
            throw std::invalid_argument("Pixel color is missing from the palette");
        }
        indices.push_back(static_cast<std::uint8_t>(iterator - palette.begin()));
    }

    return indices;
}

std::vector<std::uint8_t> applyPalette(const std::vector<std::uint8_t>& indices, const Palette& palette)
{
    std::vector<std::uint8_t> rgb;
    rgb.reserve(indices.size() * kBytesPerPixel);

    for (auto index : indices) {
        if (index >= palette.size()) {
            throw InputFormatError("Invalid index in image data");
        }
        const auto& color = palette[index];
        rgb.push_back(color.red);
        rgb.push_back(color.green);
        rgb.push_back(color.blue);
    }

    return rgb;
}

std::uint8_t paletteBitDepth(std::size_t colorCount)
{
    if (colorCount == 0U || colorCount > kMaxPaletteSize) {
        throw CapacityError("Palette must hold between 1 and 256 colors");
    }

    std::uint8_t bits = 1;
    while ((std::size_t {1} << bits) < colorCount) {
        ++bits;
    }
    return bits;
}

Palette parsePalette(const std::uint8_t* data, std::size_t colorCount)
{
    Palette palette;
    palette.reserve(colorCount);

    for (std::size_t entry = 0; entry < colorCount; ++entry) {
        const auto offset = entry * kBytesPerPixel;
        palette.push_back(Color {data[offset], data[offset + 1], data[offset + 2]});
    }

    return palette;
}

std::vector<std::uint8_t> serializePalette(const Palette& palette, std::uint8_t bitDepth)
{
    const std::size_t entries = std::size_t {1} << bitDepth;
    if (palette.size() > entries) {
        throw CapacityError("Palette does not fit the requested color table size");
    }

    std::vector<std::uint8_t> table(entries * kBytesPerPixel, 0);
    for (std::size_t entry = 0; entry < palette.size(); ++entry) {
        const auto offset = entry * kBytesPerPixel;
        table[offset] = palette[entry].red;
        table[offset + 1] = palette[entry].green;
        table[offset + 2] = palette[entry].blue;
    }

    return table;
}

} // namespace gifrgb::codec::gif
