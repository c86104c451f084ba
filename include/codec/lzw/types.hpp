#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifrgb::codec::lzw {

inline constexpr std::uint8_t kMinMinimumCodeSize = 2;
inline constexpr std::uint8_t kMaxMinimumCodeSize = 8;
inline constexpr std::uint8_t kMaxCodeWidth = 12;
inline constexpr std::uint16_t kMaxDictionarySize = 4096; // 12-bit codes
inline constexpr std::size_t kMaxSubBlockSize = 255;

enum class DictionaryFullPolicy {
    Reset,  // emit ClearCode and start over
    Freeze  // keep matching against the full table
};

struct CodeLayout {
    std::uint8_t minimumCodeSize {kMinMinimumCodeSize};
    std::uint16_t clearCode {0};
    std::uint16_t endCode {0};
    std::uint8_t initialWidth {0};
};

CodeLayout makeLayout(std::uint8_t minimumCodeSize);

struct CodecStatistics {
    std::uint64_t codeCount {0};
    std::uint64_t bitCount {0};
    std::uint64_t pixelCount {0};
};

struct DecodeResult {
    std::vector<std::uint8_t> indices;
    CodecStatistics statistics;
};

struct EncodeResult {
    std::vector<std::uint8_t> framed;
    CodecStatistics statistics;
};

} // namespace gifrgb::codec::lzw
