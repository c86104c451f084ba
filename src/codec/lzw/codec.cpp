#include "codec/lzw/codec.hpp"

#include "codec/errors.hpp"
#include "codec/lzw/bit_stream.hpp"
#include "codec/lzw/dictionary.hpp"

#include <string>

namespace gifrgb::codec::lzw {

CodeLayout makeLayout(std::uint8_t minimumCodeSize)
{
    if (minimumCodeSize < kMinMinimumCodeSize || minimumCodeSize > kMaxMinimumCodeSize) {
        throw InputFormatError("Invalid LZW minimum code size: " + std::to_string(minimumCodeSize));
    }

    CodeLayout layout {};
    layout.minimumCodeSize = minimumCodeSize;
    layout.clearCode = static_cast<std::uint16_t>(1U << minimumCodeSize);
    layout.endCode = static_cast<std::uint16_t>(layout.clearCode + 1U);
    layout.initialWidth = static_cast<std::uint8_t>(minimumCodeSize + 1U);
    return layout;
}

DecodeResult decodeCodeStream(std::uint8_t minimumCodeSize,
                              const std::uint8_t* data,
                              std::size_t size,
                              Diagnostics& diagnostics,
                              std::size_t pixelLimit)
{
    const auto layout = makeLayout(minimumCodeSize);

    Dictionary dictionary(layout);
    SubBlockReader reader(data, size);

    DecodeResult result {};
    result.indices.reserve(pixelLimit);

    std::uint8_t width = layout.initialWidth;
    std::uint16_t previous = 0;
    bool hasPrevious = false;

    while (true) {
        const auto code = reader.readCode(width);
        diagnostics.traceCode(code, width);
        ++result.statistics.codeCount;
        result.statistics.bitCount += width;

        if (code == layout.clearCode) {
            dictionary.reset();
            width = layout.initialWidth;
            hasPrevious = false;
            continue;
        }

        if (code == layout.endCode) {
            break;
        }

        const auto nextCode = dictionary.size();
        if (code > nextCode || (code == nextCode && !hasPrevious)) {
            throw InputFormatError("Invalid LZW code encountered during decoding");
        }

        if (hasPrevious) {
            // A code equal to the next free slot stands for previous + previous[0].
            const auto source = code < nextCode ? code : previous;
            dictionary.add(previous, dictionary.firstSymbol(source));
        }

        if (pixelLimit != 0U && dictionary.length(code) > pixelLimit - result.indices.size()) {
            throw ConsistencyError("Decoded data exceeds the expected " + std::to_string(pixelLimit) + " pixels");
        }
        dictionary.expand(code, result.indices);

        previous = code;
        hasPrevious = !dictionary.full();

        if (dictionary.size() == (1U << width) && width < kMaxCodeWidth) {
            ++width;
        }
    }

    reader.skipToTerminator();

    result.statistics.pixelCount = result.indices.size();
    return result;
}

EncodeResult encodeIndexStream(std::uint8_t minimumCodeSize,
                               const std::vector<std::uint8_t>& indices,
                               DictionaryFullPolicy policy,
                               Diagnostics& diagnostics)
{
    const auto layout = makeLayout(minimumCodeSize);

    for (auto index : indices) {
        if (index >= layout.clearCode) {
            throw InputFormatError("Index " + std::to_string(index) + " does not fit the LZW alphabet");
        }
    }

    Dictionary dictionary(layout, true);
    SubBlockWriter writer;
    EncodeResult result {};

    std::uint8_t width = layout.initialWidth;

    const auto emit = [&](std::uint16_t code) {
        writer.writeCode(code, width);
        diagnostics.traceCode(code, width);
        ++result.statistics.codeCount;
        result.statistics.bitCount += width;
    };

    emit(layout.clearCode);

    std::size_t position = 0;
    while (position < indices.size()) {
        // longest run already in the table
        std::uint16_t code = indices[position++];
        while (position < indices.size()) {
            const auto extended = dictionary.find(code, indices[position]);
            if (!extended) {
                break;
            }
            code = *extended;
            ++position;
        }

        emit(code);

        if (position >= indices.size()) {
            break;
        }

        if (!dictionary.full()) {
            dictionary.add(code, indices[position]);
            if (dictionary.size() > (1U << width)) {
                ++width;
            }
        } else if (policy == DictionaryFullPolicy::Reset) {
            emit(layout.clearCode);
            dictionary.reset();
            width = layout.initialWidth;
        }
    }

    emit(layout.endCode);

    result.framed = writer.finish();
    result.statistics.pixelCount = indices.size();
    return result;
}

} // namespace gifrgb::codec::lzw
