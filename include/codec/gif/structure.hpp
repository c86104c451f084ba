#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

namespace gifrgb::codec::gif {

// Prints every block of a GIF file with its offset. Throws InputFormatError
// at the first block that cannot be parsed, after printing the ones before it.
void printStructure(const std::vector<std::uint8_t>& data, std::ostream& output);

} // namespace gifrgb::codec::gif
