#include "codec/lzw.hpp"

#include "codec/errors.hpp"
#include "codec/interlace.hpp"
#include "codec/lzw/codec.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace gifrgb::codec::lzw {
namespace {

std::string describe(const CodecStatistics& statistics)
{
    return "pixels=" + std::to_string(statistics.pixelCount)
        + ", lzwCodes=" + std::to_string(statistics.codeCount)
        + ", lzwBits=" + std::to_string(statistics.bitCount);
}

} // namespace

std::vector<std::uint8_t> decode(const DecodeRequest& request, Diagnostics& diagnostics)
{
    if (request.width == 0U || request.height == 0U) {
        throw CapacityError("Image area is zero");
    }

    const auto expected = request.width * request.height;
    auto result = decodeCodeStream(
        request.minimumCodeSize, request.framed.data(), request.framed.size(), diagnostics, expected);

    if (result.indices.size() != expected) {
        throw ConsistencyError("Decoded " + std::to_string(result.indices.size()) + " pixels, expected "
                               + std::to_string(expected));
    }

    diagnostics.info(describe(result.statistics));

    if (request.interlaced) {
        return deinterlace(result.indices, request.width, request.height);
    }
    return std::move(result.indices);
}

std::vector<std::uint8_t> encode(const EncodeRequest& request, Diagnostics& diagnostics)
{
    if (request.width == 0U) {
        throw CapacityError("Image width must be positive");
    }

    if (request.indices.size() != request.width * request.height) {
        throw ConsistencyError("Index count does not match the image dimensions");
    }

    auto result = encodeIndexStream(request.minimumCodeSize, request.indices, request.policy, diagnostics);
    diagnostics.info(describe(result.statistics));
    return std::move(result.framed);
}

std::uint8_t minimumCodeSize(std::size_t colorCount)
{
    if (colorCount == 0U || colorCount > 256U) {
        throw CapacityError("Palette must hold between 1 and 256 colors");
    }

    std::uint8_t bits = 1;
    while ((std::size_t {1} << bits) < colorCount) {
        ++bits;
    }
    return std::max(bits, kMinMinimumCodeSize);
}

} // namespace gifrgb::codec::lzw
