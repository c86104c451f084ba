#pragma once

#include "codec/diagnostics.hpp"
#include "codec/gif/raw_rgb.hpp"
#include "codec/lzw/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gifrgb::codec::gif {

RawImage decodeGif(const std::vector<std::uint8_t>& data, Diagnostics& diagnostics);

std::vector<std::uint8_t> encodeGif(const RawImage& image,
                                    lzw::DictionaryFullPolicy policy,
                                    Diagnostics& diagnostics);

void decodeFile(const std::filesystem::path& source,
                const std::filesystem::path& destination,
                Diagnostics& diagnostics);

void encodeFile(const std::filesystem::path& source,
                const std::filesystem::path& destination,
                std::size_t width,
                lzw::DictionaryFullPolicy policy,
                Diagnostics& diagnostics);

struct BatchFailure {
    std::filesystem::path relativePath;
    std::string message;
};

struct BatchReport {
    std::size_t converted {0};
    std::vector<BatchFailure> failures;
};

// Decodes every .gif file below `sourceDirectory` into a .data file at the
// same relative location under `destinationDirectory`.
BatchReport decodeDirectory(const std::filesystem::path& sourceDirectory,
                            const std::filesystem::path& destinationDirectory,
                            std::size_t threadCount,
                            Diagnostics& diagnostics);

} // namespace gifrgb::codec::gif
