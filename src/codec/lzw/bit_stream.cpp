#include "codec/lzw/bit_stream.hpp"

#include "codec/errors.hpp"

#include <stdexcept>
#include <utility>

namespace gifrgb::codec::lzw {
namespace {

void checkWidth(std::uint8_t width)
{
    if (width == 0U || width > kMaxCodeWidth) {
        throw std::invalid_argument("LZW code width must be between 1 and 12 bits");
    }
}

constexpr std::uint32_t maskFor(std::uint8_t width) noexcept
{
    return (std::uint32_t {1} << width) - 1U;
}

} // namespace

SubBlockWriter::SubBlockWriter(BitCursor cursor)
    : cursor_(cursor)
{
}

void SubBlockWriter::writeCode(std::uint16_t code, std::uint8_t width)
{
    checkWidth(width);

    cursor_.accumulator |= (static_cast<std::uint32_t>(code) & maskFor(width)) << cursor_.bitCount;
    cursor_.bitCount = static_cast<std::uint8_t>(cursor_.bitCount + width);

    while (cursor_.bitCount >= 8U) {
        pushByte(static_cast<std::uint8_t>(cursor_.accumulator & 0xFFU));
        cursor_.accumulator >>= 8U;
        cursor_.bitCount = static_cast<std::uint8_t>(cursor_.bitCount - 8U);
    }
}

std::vector<std::uint8_t> SubBlockWriter::finish()
{
    if (cursor_.bitCount > 0U) {
        pushByte(static_cast<std::uint8_t>(cursor_.accumulator & 0xFFU));
        cursor_ = BitCursor {};
    }

    if (blockSize_ > 0U) {
        flushBlock();
    }

    output_.push_back(0);
    return std::move(output_);
}

const BitCursor& SubBlockWriter::cursor() const noexcept
{
    return cursor_;
}

void SubBlockWriter::pushByte(std::uint8_t byte)
{
    block_[blockSize_++] = byte;
    if (blockSize_ == kMaxSubBlockSize) {
        flushBlock();
    }
}

void SubBlockWriter::flushBlock()
{
    output_.push_back(static_cast<std::uint8_t>(blockSize_));
    output_.insert(output_.end(), block_.begin(), block_.begin() + static_cast<std::ptrdiff_t>(blockSize_));
    blockSize_ = 0;
}

SubBlockReader::SubBlockReader(const std::uint8_t* data, std::size_t size, BitCursor cursor)
    : data_(data)
    , size_(size)
    , cursor_(cursor)
{
}

std::uint16_t SubBlockReader::readCode(std::uint8_t width)
{
    checkWidth(width);

    while (cursor_.bitCount < width) {
        std::uint8_t byte = 0;
        if (!nextByte(byte)) {
            throw InputFormatError("Unexpected end of LZW data");
        }
        cursor_.accumulator |= static_cast<std::uint32_t>(byte) << cursor_.bitCount;
        cursor_.bitCount = static_cast<std::uint8_t>(cursor_.bitCount + 8U);
    }

    const auto code = static_cast<std::uint16_t>(cursor_.accumulator & maskFor(width));
    cursor_.accumulator >>= width;
    cursor_.bitCount = static_cast<std::uint8_t>(cursor_.bitCount - width);
    return code;
}

void SubBlockReader::skipToTerminator()
{
    cursor_ = BitCursor {};
    position_ += blockRemaining_;
    blockRemaining_ = 0;

    while (!terminated_) {
        enterBlock();
        position_ += blockRemaining_;
        blockRemaining_ = 0;
    }
}

const BitCursor& SubBlockReader::cursor() const noexcept
{
    return cursor_;
}

std::size_t SubBlockReader::position() const noexcept
{
    return position_;
}

bool SubBlockReader::terminated() const noexcept
{
    return terminated_;
}

void SubBlockReader::enterBlock()
{
    if (position_ >= size_) {
        throw InputFormatError("Unexpected end of LZW data: missing block terminator");
    }

    const std::size_t length = data_[position_++];
    if (length == 0U) {
        terminated_ = true;
        return;
    }

    if (length > size_ - position_) {
        throw InputFormatError("Sub-block length exceeds the available data");
    }
    blockRemaining_ = length;
}

bool SubBlockReader::nextByte(std::uint8_t& byte)
{
    while (blockRemaining_ == 0U) {
        if (terminated_) {
            return false;
        }
        enterBlock();
    }

    byte = data_[position_++];
    --blockRemaining_;
    return true;
}

} // namespace gifrgb::codec::lzw
