#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace gifrgb::utils {

std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path);

// Writes next to the destination first and renames into place, so a failed
// write never leaves a truncated file behind.
void writeBinaryFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

} // namespace gifrgb::utils
