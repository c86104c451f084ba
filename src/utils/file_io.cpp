#include "utils/file_io.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace gifrgb::utils {
namespace {

void ensureParentDirectory(const std::filesystem::path& path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("create_directories", parent, ec);
    }
}

} // namespace

std::vector<std::uint8_t> readBinaryFile(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }

    input.seekg(0, std::ios::end);
    const auto endPosition = input.tellg();
    if (endPosition < 0) {
        throw std::runtime_error("Failed to determine file size: " + path.string());
    }
    input.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(endPosition));
    if (!buffer.empty()) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        if (input.gcount() != static_cast<std::streamsize>(buffer.size())) {
            throw std::runtime_error("Failed to read entire file: " + path.string());
        }
    }

    return buffer;
}

void writeBinaryFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data)
{
    ensureParentDirectory(path);

    auto staging = path;
    staging += ".partial";

    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Failed to open file for writing: " + staging.string());
        }

        if (!data.empty()) {
            output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        }
        output.close();

        if (!output) {
            std::error_code ignored;
            std::filesystem::remove(staging, ignored);
            throw std::runtime_error("Failed to write file contents: " + path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        throw std::filesystem::filesystem_error("rename", staging, path, ec);
    }
}

} // namespace gifrgb::utils
