#pragma once

#include "codec/lzw/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gifrgb::codec::lzw {

// Pending bits that have not yet formed a whole byte, least significant first.
struct BitCursor {
    std::uint32_t accumulator {0};
    std::uint8_t bitCount {0};
};

class SubBlockWriter {
public:
    explicit SubBlockWriter(BitCursor cursor = {});

    void writeCode(std::uint16_t code, std::uint8_t width);

    // Flushes the partial byte and the open block, appends the terminator.
    std::vector<std::uint8_t> finish();

    const BitCursor& cursor() const noexcept;

private:
    void pushByte(std::uint8_t byte);
    void flushBlock();

    BitCursor cursor_;
    std::vector<std::uint8_t> output_;
    std::array<std::uint8_t, kMaxSubBlockSize> block_ {};
    std::size_t blockSize_ {0};
};

class SubBlockReader {
public:
    SubBlockReader(const std::uint8_t* data, std::size_t size, BitCursor cursor = {});

    std::uint16_t readCode(std::uint8_t width);

    // Drops buffered bits and walks the remaining blocks up to the terminator.
    void skipToTerminator();

    const BitCursor& cursor() const noexcept;
    std::size_t position() const noexcept;
    bool terminated() const noexcept;

private:
    void enterBlock();
    bool nextByte(std::uint8_t& byte);

    const std::uint8_t* data_ {nullptr};
    std::size_t size_ {0};
    std::size_t position_ {0};
    std::size_t blockRemaining_ {0};
    bool terminated_ {false};
    BitCursor cursor_;
};

} // namespace gifrgb::codec::lzw
