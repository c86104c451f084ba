#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifrgb::codec {

// Logical row index for each physical row of an interlaced image, in the
// order the rows are stored (passes start at 0, 4, 2, 1 with steps 8, 8, 4, 2).
std::vector<std::size_t> interlacedRowOrder(std::size_t height);

std::vector<std::uint8_t> deinterlace(const std::vector<std::uint8_t>& indices,
                                      std::size_t width,
                                      std::size_t height);

} // namespace gifrgb::codec
