#include "codec/interlace.hpp"

#include "codec/errors.hpp"

#include <algorithm>
#include <array>

namespace gifrgb::codec {
namespace {

struct InterlacePass {
    std::size_t start;
    std::size_t step;
};

constexpr std::array<InterlacePass, 4> kPasses {{
    {0, 8},
    {4, 8},
    {2, 4},
    {1, 2},
}};

} // namespace

std::vector<std::size_t> interlacedRowOrder(std::size_t height)
{
    std::vector<std::size_t> order;
    order.reserve(height);

    for (const auto& pass : kPasses) {
        for (std::size_t row = pass.start; row < height; row += pass.step) {
            order.push_back(row);
        }
    }

    return order;
}

std::vector<std::uint8_t> deinterlace(const std::vector<std::uint8_t>& indices,
                                      std::size_t width,
                                      std::size_t height)
{
    if (indices.size() != width * height) {
        throw ConsistencyError("Interlaced image data does not match its dimensions");
    }

    std::vector<std::uint8_t> logical(indices.size());
    const auto order = interlacedRowOrder(height);

    for (std::size_t physical = 0; physical < order.size(); ++physical) {
        const auto source = indices.begin() + static_cast<std::ptrdiff_t>(physical * width);
        std::copy(source,
                  source + static_cast<std::ptrdiff_t>(width),
                  logical.begin() + static_cast<std::ptrdiff_t>(order[physical] * width));
    }

    return logical;
}

} // namespace gifrgb::codec
