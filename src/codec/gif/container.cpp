#include "codec/gif/container.hpp"

#include "codec/errors.hpp"
#include "codec/lzw/types.hpp"

#include <string>
#include <utility>

namespace gifrgb::codec::gif {
namespace {

void appendWord(std::vector<std::uint8_t>& output, std::size_t value)
{
    output.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    output.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
}

Palette readColorTable(ByteReader& reader, std::uint8_t packedFields)
{
    const auto bits = static_cast<std::uint8_t>((packedFields & kColorTableSizeMask) + 1U);
    const std::size_t colorCount = std::size_t {1} << bits;
    return parsePalette(reader.take(colorCount * kBytesPerPixel), colorCount);
}

void skipExtension(ByteReader& reader)
{
    const auto label = reader.readByte();
    switch (label) {
    case kPlainTextLabel:
    case kGraphicControlLabel:
    case kApplicationLabel:
        reader.skip(reader.readByte());
        reader.skipSubBlocks();
        break;
    case kCommentLabel:
        reader.skipSubBlocks();
        break;
    default:
        throw InputFormatError("Invalid extension label");
    }
}

} // namespace

ByteReader::ByteReader(const std::vector<std::uint8_t>& data)
    : data_(data)
{
}

std::uint8_t ByteReader::readByte()
{
    require(1);
    return data_[position_++];
}

std::uint16_t ByteReader::readWord()
{
    require(2);
    const auto value = static_cast<std::uint16_t>(data_[position_] | (data_[position_ + 1] << 8U));
    position_ += 2;
    return value;
}

std::string ByteReader::readText(std::size_t length)
{
    const auto* begin = take(length);
    return std::string(reinterpret_cast<const char*>(begin), length);
}

const std::uint8_t* ByteReader::take(std::size_t length)
{
    require(length);
    const auto* begin = data_.data() + position_;
    position_ += length;
    return begin;
}

void ByteReader::skip(std::size_t length)
{
    require(length);
    position_ += length;
}

std::size_t ByteReader::skipSubBlocks()
{
    std::size_t payload = 0;
    for (auto length = readByte(); length != 0U; length = readByte()) {
        skip(length);
        payload += length;
    }
    return payload;
}

std::size_t ByteReader::position() const noexcept
{
    return position_;
}

void ByteReader::require(std::size_t length) const
{
    if (length > data_.size() - position_) {
        throw InputFormatError("Unexpected end of file");
    }
}

GifImage readGif(const std::vector<std::uint8_t>& data, Diagnostics& diagnostics)
{
    ByteReader reader(data);

    if (reader.readText(3) != "GIF") {
        throw InputFormatError("Not a GIF file");
    }

    const auto version = reader.readText(3);
    if (version != "87a" && version != "89a") {
        diagnostics.warning("Unknown GIF version");
    }

    GifImage image {};

    // logical screen size is not needed, only the first image's
    reader.skip(4);
    const auto screenFields = reader.readByte();
    reader.skip(2);

    Palette globalTable;
    const bool hasGlobalTable = (screenFields & kColorTableFlag) != 0U;
    if (hasGlobalTable) {
        globalTable = readColorTable(reader, screenFields);
    }

    while (true) {
        const auto blockType = reader.readByte();
        if (blockType == kImageSeparator) {
            break;
        }
        if (blockType == kExtensionIntroducer) {
            skipExtension(reader);
        } else if (blockType == kTrailer) {
            throw InputFormatError("No images in file");
        } else {
            throw InputFormatError("Invalid block type");
        }
    }

    reader.skip(4);
    image.width = reader.readWord();
    image.height = reader.readWord();
    const auto imageFields = reader.readByte();

    if (image.width == 0U || image.height == 0U) {
        throw InputFormatError("Image area is zero");
    }

    image.interlaced = (imageFields & kInterlaceFlag) != 0U;
    if ((imageFields & kColorTableFlag) != 0U) {
        image.palette = readColorTable(reader, imageFields);
    } else if (hasGlobalTable) {
        image.palette = std::move(globalTable);
    } else {
        throw InputFormatError("No palette");
    }

    image.minimumCodeSize = reader.readByte();
    if (image.minimumCodeSize < lzw::kMinMinimumCodeSize || image.minimumCodeSize > lzw::kMaxMinimumCodeSize) {
        throw InputFormatError("Invalid LZW minimum code size: " + std::to_string(image.minimumCodeSize));
    }

    const auto start = reader.position();
    reader.skipSubBlocks();
    image.framed.assign(data.begin() + static_cast<std::ptrdiff_t>(start),
                        data.begin() + static_cast<std::ptrdiff_t>(reader.position()));

    return image;
}

std::vector<std::uint8_t> writeGif(std::size_t width,
                                   std::size_t height,
                                   const Palette& palette,
                                   std::uint8_t minimumCodeSize,
                                   const std::vector<std::uint8_t>& framed)
{
    if (width == 0U || width > kMaxDimension || height == 0U || height > kMaxDimension) {
        throw CapacityError("GIF dimensions must be between 1 and 65535 pixels");
    }

    const auto bits = paletteBitDepth(palette.size());
    const auto table = serializePalette(palette, bits);

    std::vector<std::uint8_t> output;
    output.reserve(13 + table.size() + 11 + framed.size() + 1);

    const std::string signature = "GIF87a";
    output.insert(output.end(), signature.begin(), signature.end());

    // Logical Screen Descriptor
    appendWord(output, width);
    appendWord(output, height);
    output.push_back(static_cast<std::uint8_t>(kColorTableFlag | (bits - 1U)));
    output.push_back(0); // background colour index
    output.push_back(0); // pixel aspect ratio

    output.insert(output.end(), table.begin(), table.end());

    // Image Descriptor
    output.push_back(kImageSeparator);
    appendWord(output, 0);
    appendWord(output, 0);
    appendWord(output, width);
    appendWord(output, height);
    output.push_back(0);

    output.push_back(minimumCodeSize);
    output.insert(output.end(), framed.begin(), framed.end());
    output.push_back(kTrailer);

    return output;
}

} // namespace gifrgb::codec::gif
