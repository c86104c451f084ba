#include "codec/gif/structure.hpp"

#include "codec/errors.hpp"
#include "codec/gif/container.hpp"

#include <array>
#include <ostream>
#include <string>

namespace gifrgb::codec::gif {
namespace {

constexpr std::array<const char*, 4> kDisposalMethods {
    "unspecified",
    "leave in place",
    "restore to background color",
    "restore to previous",
};

class StructurePrinter {
public:
    StructurePrinter(const std::vector<std::uint8_t>& data, std::ostream& output)
        : reader_(data)
        , output_(output)
    {
    }

    void run()
    {
        printHeader();
        const auto screenFields = printScreenDescriptor();

        if ((screenFields & kColorTableFlag) != 0U) {
            section("Global Color Table");
            offset();
            const auto bits = (screenFields & kColorTableSizeMask) + 1U;
            value("colors", std::to_string(1U << bits));
            value("sorted", yesNo((screenFields & 0x08U) != 0U));
            value("background color index", std::to_string(backgroundIndex_));
            reader_.skip((std::size_t {1} << bits) * kBytesPerPixel);
        }

        while (true) {
            const auto blockType = reader_.readByte();
            if (blockType == kImageSeparator) {
                printImage();
            } else if (blockType == kExtensionIntroducer) {
                section("Extension");
                offset(-1);
                printExtension();
            } else if (blockType == kTrailer) {
                section("Trailer");
                offset(-1);
                return;
            } else {
                throw InputFormatError("Unknown block type");
            }
        }
    }

private:
    void printHeader()
    {
        section("Header");
        offset();
        if (reader_.readText(3) != "GIF") {
            throw InputFormatError("Not a GIF file");
        }
        value("version", reader_.readText(3));
    }

    std::uint8_t printScreenDescriptor()
    {
        section("Logical Screen Descriptor");
        offset();
        const auto width = reader_.readWord();
        const auto height = reader_.readWord();
        const auto fields = reader_.readByte();
        backgroundIndex_ = reader_.readByte();
        const auto aspectRatio = reader_.readByte();

        value("width", std::to_string(width));
        value("height", std::to_string(height));
        value("original color resolution in bits per RGB channel", std::to_string(((fields >> 4U) & 0x07U) + 1U));
        value("pixel aspect ratio in 1/64ths", aspectRatio != 0U ? std::to_string(aspectRatio + 15U) : "unknown");
        value("has Global Color Table", yesNo((fields & kColorTableFlag) != 0U));
        return fields;
    }

    void printImage()
    {
        section("Image Descriptor");
        offset(-1);
        const auto left = reader_.readWord();
        const auto top = reader_.readWord();
        const auto width = reader_.readWord();
        const auto height = reader_.readWord();
        const auto fields = reader_.readByte();

        value("x position", std::to_string(left));
        value("y position", std::to_string(top));
        value("width", std::to_string(width));
        value("height", std::to_string(height));
        value("interlaced", yesNo((fields & kInterlaceFlag) != 0U));
        value("has Local Color Table", yesNo((fields & kColorTableFlag) != 0U));

        if ((fields & kColorTableFlag) != 0U) {
            section("Local Color Table");
            offset();
            const auto bits = (fields & kColorTableSizeMask) + 1U;
            value("colors", std::to_string(1U << bits));
            value("sorted", yesNo((fields & 0x20U) != 0U));
            reader_.skip((std::size_t {1} << bits) * kBytesPerPixel);
        }

        section("LZW data");
        offset();
        const auto minimumCodeSize = reader_.readByte();
        const auto dataSize = reader_.skipSubBlocks();
        value("palette bit depth", std::to_string(minimumCodeSize));
        value("data size", std::to_string(dataSize));
    }

    void printExtension()
    {
        const auto label = reader_.readByte();
        switch (label) {
        case kPlainTextLabel:
            value("type", "Plain Text");
            reader_.skip(reader_.readByte());
            reader_.skipSubBlocks();
            break;
        case kGraphicControlLabel: {
            value("type", "Graphic Control");
            reader_.skip(1);
            const auto fields = reader_.readByte();
            const auto delay = reader_.readWord();
            const auto transparentIndex = reader_.readByte();
            reader_.skip(1);

            const auto disposal = static_cast<std::size_t>((fields >> 2U) & 0x07U);
            value("delay time in 1/100ths of a second", delay != 0U ? std::to_string(delay) : "none");
            value("wait for user input", yesNo((fields & 0x02U) != 0U));
            value("transparent color index", (fields & 0x01U) != 0U ? std::to_string(transparentIndex) : "none");
            value("disposal method", disposal < kDisposalMethods.size() ? kDisposalMethods[disposal] : "?");
            break;
        }
        case kCommentLabel:
            value("type", "Comment");
            value("data", readSubBlockText());
            break;
        case kApplicationLabel: {
            value("type", "Application");
            reader_.skip(1);
            const auto identifier = reader_.readText(8);
            const auto authentication = reader_.readText(3);
            value("identifier", identifier);
            value("authentication code", authentication);
            reader_.skipSubBlocks();
            break;
        }
        default:
            throw InputFormatError("Unknown extension type");
        }
    }

    std::string readSubBlockText()
    {
        std::string text;
        for (auto length = reader_.readByte(); length != 0U; length = reader_.readByte()) {
            text += reader_.readText(length);
        }
        return text;
    }

    void section(const char* name) { output_ << name << ":\n"; }

    void offset(int adjust = 0)
    {
        value("file offset", std::to_string(static_cast<long long>(reader_.position()) + adjust));
    }

    void value(const std::string& description, const std::string& text)
    {
        output_ << "    " << description << ": " << text << "\n";
    }

    static const char* yesNo(bool flag) { return flag ? "yes" : "no"; }

    ByteReader reader_;
    std::ostream& output_;
    std::uint8_t backgroundIndex_ {0};
};

} // namespace

void printStructure(const std::vector<std::uint8_t>& data, std::ostream& output)
{
    StructurePrinter printer(data, output);
    printer.run();
}

} // namespace gifrgb::codec::gif
