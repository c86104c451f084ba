#include "codec/errors.hpp"
#include "codec/gif.hpp"
#include "codec/gif/container.hpp"
#include "codec/gif/palette.hpp"
#include "codec/gif/raw_rgb.hpp"
#include "codec/interlace.hpp"
#include "codec/lzw.hpp"
#include "gif_fixtures.hpp"
#include "utils/file_io.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
namespace gif = gifrgb::codec::gif;
namespace lzw = gifrgb::codec::lzw;

using gifrgb::codec::CapacityError;
using gifrgb::codec::InputFormatError;
using gifrgb::codec::NullDiagnostics;
using gifrgb::fixtures::RecordingDiagnostics;

class ScopedTempDir {
public:
    ScopedTempDir()
    {
        const auto base = fs::temp_directory_path();
        const auto uniqueName = "gifrgb_gif_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        path_ = base / uniqueName;
        fs::create_directories(path_);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

// Diagonal bands over `colors` shades of grey with a red marker column.
gif::RawImage makeImage(std::size_t width, std::size_t height, std::size_t colors)
{
    gif::RawImage image {};
    image.width = width;
    image.height = height;
    image.rgb.reserve(width * height * gif::kBytesPerPixel);
    for (std::size_t y = 0; y < height; ++y) {
        for (std::size_t x = 0; x < width; ++x) {
            const auto shade = static_cast<std::uint8_t>(((x + y) % colors) * 255U / colors);
            image.rgb.push_back(x == 0U ? 0xFFU : shade);
            image.rgb.push_back(shade);
            image.rgb.push_back(shade);
        }
    }
    return image;
}

std::vector<std::uint8_t> blackRunGif()
{
    std::vector<std::uint8_t> expected;
    gifrgb::fixtures::appendText(expected, "GIF87a");
    expected.insert(expected.end(), {
        0x0A, 0x00, 0x01, 0x00, 0x80, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x2C, 0x00, 0x00, 0x00, 0x00, 0x0A, 0x00, 0x01, 0x00, 0x00,
        0x02, 0x03, 0x84, 0x8F, 0x05, 0x00,
        0x3B,
    });
    return expected;
}

TEST(GifEncodeTest, WritesMinimalGif87a)
{
    NullDiagnostics diagnostics;
    gif::RawImage image {};
    image.width = 10;
    image.height = 1;
    image.rgb.assign(30, 0);

    EXPECT_EQ(gif::encodeGif(image, lzw::DictionaryFullPolicy::Reset, diagnostics), blackRunGif());
}

TEST(GifEncodeTest, ReportsImageSummary)
{
    RecordingDiagnostics diagnostics;
    gif::encodeGif(makeImage(12, 5, 6), lzw::DictionaryFullPolicy::Reset, diagnostics);

    ASSERT_FALSE(diagnostics.messages.empty());
    EXPECT_EQ(diagnostics.messages.front(), "width=12, height=5, uniqueColors=11");
}

TEST(GifEncodeTest, PaletteIsSortedByRgbBytes)
{
    gif::RawImage image {};
    image.width = 3;
    image.height = 1;
    image.rgb = {0xFF, 0x00, 0x00, 0x00, 0x00, 0xFF, 0x00, 0xFF, 0x00};

    const auto palette = gif::buildPalette(image);
    ASSERT_EQ(palette.size(), 3U);
    EXPECT_EQ(palette[0], (gif::Color {0x00, 0x00, 0xFF}));
    EXPECT_EQ(palette[1], (gif::Color {0x00, 0xFF, 0x00}));
    EXPECT_EQ(palette[2], (gif::Color {0xFF, 0x00, 0x00}));
    EXPECT_EQ(gif::indexImage(image, palette), (std::vector<std::uint8_t> {2, 0, 1}));
}

TEST(GifEncodeTest, PaletteOfLargeImageIsSortedAndUnique)
{
    const auto image = makeImage(256, 256, 120);
    const auto palette = gif::buildPalette(image);

    EXPECT_EQ(palette.size(), 240U);
    EXPECT_TRUE(std::is_sorted(palette.begin(), palette.end()));
    EXPECT_EQ(std::adjacent_find(palette.begin(), palette.end()), palette.end());
}

TEST(GifEncodeTest, ColorTableIsPaddedToPowerOfTwo)
{
    EXPECT_EQ(gif::paletteBitDepth(1), 1U);
    EXPECT_EQ(gif::paletteBitDepth(2), 1U);
    EXPECT_EQ(gif::paletteBitDepth(3), 2U);
    EXPECT_EQ(gif::paletteBitDepth(129), 8U);

    const gif::Palette palette {{1, 2, 3}, {4, 5, 6}, {7, 8, 9}};
    const auto table = gif::serializePalette(palette, 2);
    ASSERT_EQ(table.size(), 12U);
    EXPECT_EQ(table[8], 9U);
    EXPECT_EQ(table[9], 0U);
    EXPECT_EQ(table[11], 0U);
}

TEST(GifEncodeTest, RejectsMoreThan256Colors)
{
    gif::RawImage image {};
    image.width = 257;
    image.height = 1;
    for (std::size_t pixel = 0; pixel < 257; ++pixel) {
        image.rgb.push_back(static_cast<std::uint8_t>(pixel & 0xFFU));
        image.rgb.push_back(static_cast<std::uint8_t>(pixel >> 8U));
        image.rgb.push_back(0);
    }

    EXPECT_THROW(gif::buildPalette(image), CapacityError);
}

TEST(RawImageTest, ValidatesWidthAndSize)
{
    EXPECT_THROW(gif::parseRawImage(std::vector<std::uint8_t>(6, 0), 0), CapacityError);
    EXPECT_THROW(gif::parseRawImage(std::vector<std::uint8_t>(6, 0), 70000), CapacityError);
    EXPECT_THROW(gif::parseRawImage({}, 2), InputFormatError);
    EXPECT_THROW(gif::parseRawImage(std::vector<std::uint8_t>(9, 0), 2), InputFormatError);

    const auto image = gif::parseRawImage(std::vector<std::uint8_t>(18, 0), 2);
    EXPECT_EQ(image.width, 2U);
    EXPECT_EQ(image.height, 3U);
}

TEST(GifDecodeTest, RoundTripsThroughEncoder)
{
    NullDiagnostics diagnostics;
    const auto image = makeImage(37, 23, 40);
    const auto data = gif::encodeGif(image, lzw::DictionaryFullPolicy::Reset, diagnostics);

    const auto decoded = gif::decodeGif(data, diagnostics);
    EXPECT_EQ(decoded.width, image.width);
    EXPECT_EQ(decoded.height, image.height);
    EXPECT_EQ(decoded.rgb, image.rgb);
}

TEST(GifDecodeTest, InterlacedAndProgressiveDecodeIdentically)
{
    NullDiagnostics diagnostics;
    const std::size_t width = 7;
    const std::size_t height = 13;
    const auto image = makeImage(width, height, 5);
    const auto progressive = gif::encodeGif(image, lzw::DictionaryFullPolicy::Reset, diagnostics);

    const auto palette = gif::buildPalette(image);
    const auto logical = gif::indexImage(image, palette);
    lzw::EncodeRequest request {};
    request.width = width;
    request.height = height;
    request.minimumCodeSize = lzw::minimumCodeSize(palette.size());
    for (auto row : gifrgb::codec::interlacedRowOrder(height)) {
        const auto begin = logical.begin() + static_cast<std::ptrdiff_t>(row * width);
        request.indices.insert(request.indices.end(), begin, begin + static_cast<std::ptrdiff_t>(width));
    }

    auto interlaced = gif::writeGif(width, height, palette, request.minimumCodeSize,
                                    lzw::encode(request, diagnostics));
    const auto tableSize = (std::size_t {1} << gif::paletteBitDepth(palette.size())) * gif::kBytesPerPixel;
    interlaced[13 + tableSize + 9] |= gif::kInterlaceFlag;

    EXPECT_TRUE(gif::readGif(interlaced, diagnostics).interlaced);
    EXPECT_FALSE(gif::readGif(progressive, diagnostics).interlaced);
    EXPECT_EQ(gif::decodeGif(interlaced, diagnostics).rgb, image.rgb);
    EXPECT_EQ(gif::decodeGif(progressive, diagnostics).rgb, image.rgb);
}

TEST(GifDecodeTest, SkipsExtensionsAndUsesLocalColorTable)
{
    RecordingDiagnostics diagnostics;
    const auto decoded = gif::decodeGif(gifrgb::fixtures::extensionRichGif(), diagnostics);

    EXPECT_EQ(decoded.width, 4U);
    EXPECT_EQ(decoded.height, 2U);
    EXPECT_EQ(decoded.rgb, gifrgb::fixtures::extensionRichGifPixels());
    EXPECT_TRUE(diagnostics.warnings.empty());
}

TEST(GifDecodeTest, WarnsAboutUnknownVersion)
{
    RecordingDiagnostics diagnostics;
    auto data = blackRunGif();
    data[3] = '9';
    data[4] = '0';

    const auto decoded = gif::decodeGif(data, diagnostics);
    EXPECT_EQ(decoded.rgb, std::vector<std::uint8_t>(30, 0));
    ASSERT_EQ(diagnostics.warnings.size(), 1U);
}

TEST(GifDecodeTest, RejectsMalformedContainers)
{
    NullDiagnostics diagnostics;

    std::vector<std::uint8_t> notGif {'P', 'N', 'G', '8', '9', 'a', 0, 0, 0, 0, 0, 0, 0};
    EXPECT_THROW(gif::decodeGif(notGif, diagnostics), InputFormatError);

    auto truncated = blackRunGif();
    truncated.resize(25);
    EXPECT_THROW(gif::decodeGif(truncated, diagnostics), InputFormatError);

    auto oversizedBlock = blackRunGif();
    oversizedBlock[30] = 200;
    EXPECT_THROW(gif::decodeGif(oversizedBlock, diagnostics), InputFormatError);

    auto badBlock = blackRunGif();
    badBlock[19] = 0x42;
    EXPECT_THROW(gif::decodeGif(badBlock, diagnostics), InputFormatError);

    auto badCodeSize = blackRunGif();
    badCodeSize[29] = 12;
    EXPECT_THROW(gif::decodeGif(badCodeSize, diagnostics), InputFormatError);
}

TEST(GifDecodeTest, RejectsFileWithoutImage)
{
    NullDiagnostics diagnostics;
    auto data = blackRunGif();
    data.resize(19);
    data.push_back(gif::kTrailer);
    EXPECT_THROW(gif::decodeGif(data, diagnostics), InputFormatError);
}

TEST(GifDecodeTest, RejectsImageWithoutPalette)
{
    NullDiagnostics diagnostics;
    std::vector<std::uint8_t> data;
    gifrgb::fixtures::appendText(data, "GIF89a");
    data.insert(data.end(), {0x0A, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    data.insert(data.end(), {0x2C, 0x00, 0x00, 0x00, 0x00, 0x0A, 0x00, 0x01, 0x00, 0x00});
    data.insert(data.end(), {0x02, 0x03, 0x84, 0x8F, 0x05, 0x00, 0x3B});
    EXPECT_THROW(gif::decodeGif(data, diagnostics), InputFormatError);
}

TEST(GifDecodeTest, RejectsIndexOutsidePalette)
{
    NullDiagnostics diagnostics;
    lzw::EncodeRequest request {};
    request.indices = {0, 3};
    request.width = 2;
    request.height = 1;
    request.minimumCodeSize = 2;

    const gif::Palette palette {{0, 0, 0}, {255, 255, 255}};
    const auto data = gif::writeGif(2, 1, palette, 2, lzw::encode(request, diagnostics));
    EXPECT_THROW(gif::decodeGif(data, diagnostics), InputFormatError);
}

TEST(GifFileTest, EncodesAndDecodesRawFiles)
{
    ScopedTempDir temp;
    NullDiagnostics diagnostics;
    const auto image = makeImage(64, 40, 200);
    const auto rawPath = temp.path() / "input.data";
    const auto gifPath = temp.path() / "out" / "image.gif";
    const auto decodedPath = temp.path() / "out" / "image.data";

    gifrgb::utils::writeBinaryFile(rawPath, image.rgb);
    gif::encodeFile(rawPath, gifPath, 64, lzw::DictionaryFullPolicy::Freeze, diagnostics);
    gif::decodeFile(gifPath, decodedPath, diagnostics);

    EXPECT_EQ(gifrgb::utils::readBinaryFile(decodedPath), image.rgb);
}

TEST(GifFileTest, FailedEncodeLeavesNoOutput)
{
    ScopedTempDir temp;
    NullDiagnostics diagnostics;
    std::vector<std::uint8_t> rgb;
    for (std::size_t pixel = 0; pixel < 300; ++pixel) {
        rgb.push_back(static_cast<std::uint8_t>(pixel & 0xFFU));
        rgb.push_back(static_cast<std::uint8_t>(pixel >> 8U));
        rgb.push_back(0x10);
    }
    const auto rawPath = temp.path() / "colors.data";
    const auto gifPath = temp.path() / "colors.gif";
    gifrgb::utils::writeBinaryFile(rawPath, rgb);

    EXPECT_THROW(gif::encodeFile(rawPath, gifPath, 30, lzw::DictionaryFullPolicy::Reset, diagnostics),
                 CapacityError);
    EXPECT_FALSE(fs::exists(gifPath));

    EXPECT_THROW(gif::encodeFile(rawPath, gifPath, 7, lzw::DictionaryFullPolicy::Reset, diagnostics),
                 InputFormatError);
    EXPECT_FALSE(fs::exists(gifPath));
}

TEST(GifFileTest, DecodesDirectoryTree)
{
    ScopedTempDir temp;
    NullDiagnostics diagnostics;
    const auto source = temp.path() / "gifs";
    const auto destination = temp.path() / "raw";

    const auto first = makeImage(9, 4, 3);
    const auto second = makeImage(16, 16, 20);
    gifrgb::utils::writeBinaryFile(source / "first.gif",
                                   gif::encodeGif(first, lzw::DictionaryFullPolicy::Reset, diagnostics));
    gifrgb::utils::writeBinaryFile(source / "nested" / "second.GIF",
                                   gif::encodeGif(second, lzw::DictionaryFullPolicy::Reset, diagnostics));
    gifrgb::utils::writeBinaryFile(source / "broken.gif", {'G', 'I', 'F'});
    gifrgb::utils::writeBinaryFile(source / "notes.txt", {'h', 'i'});

    const auto report = gif::decodeDirectory(source, destination, 2, diagnostics);

    EXPECT_EQ(report.converted, 2U);
    ASSERT_EQ(report.failures.size(), 1U);
    EXPECT_EQ(report.failures.front().relativePath.generic_string(), "broken.gif");
    EXPECT_EQ(gifrgb::utils::readBinaryFile(destination / "first.data"), first.rgb);
    EXPECT_EQ(gifrgb::utils::readBinaryFile(destination / "nested" / "second.data"), second.rgb);
    EXPECT_FALSE(fs::exists(destination / "broken.data"));
    EXPECT_FALSE(fs::exists(destination / "notes.data"));
}

TEST(GifFileTest, SymlinkedFilesStayInsideDestination)
{
    ScopedTempDir temp;
    NullDiagnostics diagnostics;
    const auto source = temp.path() / "in";
    const auto destination = temp.path() / "out";
    const auto elsewhere = temp.path() / "elsewhere";

    const auto image = makeImage(5, 3, 4);
    gifrgb::utils::writeBinaryFile(elsewhere / "pic.gif",
                                   gif::encodeGif(image, lzw::DictionaryFullPolicy::Reset, diagnostics));
    fs::create_directories(source);
    fs::create_symlink(elsewhere / "pic.gif", source / "link.gif");

    const auto report = gif::decodeDirectory(source, destination, 1, diagnostics);

    EXPECT_EQ(report.converted, 1U);
    EXPECT_TRUE(report.failures.empty());
    EXPECT_EQ(gifrgb::utils::readBinaryFile(destination / "link.data"), image.rgb);
    EXPECT_FALSE(fs::exists(elsewhere / "pic.data"));
}

} // namespace
