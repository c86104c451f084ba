#include "codec/gif.hpp"

#include "codec/gif/container.hpp"
#include "codec/gif/palette.hpp"
#include "codec/lzw.hpp"
#include "concurrency/thread_pool.hpp"
#include "filesystem/resource_context.hpp"
#include "utils/file_io.hpp"

#include <exception>
#include <future>
#include <string>
#include <utility>

namespace gifrgb::codec::gif {

RawImage decodeGif(const std::vector<std::uint8_t>& data, Diagnostics& diagnostics)
{
    auto image = readGif(data, diagnostics);

    lzw::DecodeRequest request {};
    request.minimumCodeSize = image.minimumCodeSize;
    request.framed = std::move(image.framed);
    request.width = image.width;
    request.height = image.height;
    request.interlaced = image.interlaced;

    const auto indices = lzw::decode(request, diagnostics);

    RawImage raw {};
    raw.width = image.width;
    raw.height = image.height;
    raw.rgb = applyPalette(indices, image.palette);
    return raw;
}

std::vector<std::uint8_t> encodeGif(const RawImage& image,
                                    lzw::DictionaryFullPolicy policy,
                                    Diagnostics& diagnostics)
{
    const auto palette = buildPalette(image);
    diagnostics.info("width=" + std::to_string(image.width) + ", height=" + std::to_string(image.height)
                     + ", uniqueColors=" + std::to_string(palette.size()));

    lzw::EncodeRequest request {};
    request.indices = indexImage(image, palette);
    request.width = image.width;
    request.height = image.height;
    request.minimumCodeSize = lzw::minimumCodeSize(palette.size());
    request.policy = policy;

    const auto framed = lzw::encode(request, diagnostics);
    return writeGif(image.width, image.height, palette, request.minimumCodeSize, framed);
}

void decodeFile(const std::filesystem::path& source,
                const std::filesystem::path& destination,
                Diagnostics& diagnostics)
{
    const auto raw = decodeGif(utils::readBinaryFile(source), diagnostics);
    utils::writeBinaryFile(destination, raw.rgb);
}

void encodeFile(const std::filesystem::path& source,
                const std::filesystem::path& destination,
                std::size_t width,
                lzw::DictionaryFullPolicy policy,
                Diagnostics& diagnostics)
{
    const auto image = parseRawImage(utils::readBinaryFile(source), width);
    utils::writeBinaryFile(destination, encodeGif(image, policy, diagnostics));
}

BatchReport decodeDirectory(const std::filesystem::path& sourceDirectory,
                            const std::filesystem::path& destinationDirectory,
                            std::size_t threadCount,
                            Diagnostics& diagnostics)
{
    gifrgb::filesystem::DirectoryContext directory(sourceDirectory);
    const auto entries = directory.listFiles(".gif");

    BatchReport report {};
    if (entries.empty()) {
        return report;
    }

    gifrgb::concurrency::ThreadPool pool(threadCount, entries.size());
    std::vector<std::future<void>> futures;
    futures.reserve(entries.size());

    for (const auto& entry : entries) {
        auto outputPath = destinationDirectory / entry.relativePath;
        outputPath.replace_extension(".data");
        futures.emplace_back(pool.enqueue([source = entry.absolutePath, outputPath, &diagnostics]() {
            decodeFile(source, outputPath, diagnostics);
        }));
    }

    for (std::size_t index = 0; index < futures.size(); ++index) {
        try {
            futures[index].get();
            ++report.converted;
        } catch (const std::exception& error) {
            report.failures.push_back(BatchFailure {entries[index].relativePath, error.what()});
        }
    }

    return report;
}

} // namespace gifrgb::codec::gif
