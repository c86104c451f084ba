#include "filesystem/resource_context.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace gifrgb::filesystem {

namespace {

std::filesystem::path makeAbsolute(const std::filesystem::path& path)
{
    std::error_code ec;
    auto absolute = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return absolute;
    }

    absolute = std::filesystem::absolute(path, ec);
    if (!ec) {
        return absolute;
    }

    return path;
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace

DirectoryContext::DirectoryContext(std::filesystem::path rootPath)
    : rootPath_(makeAbsolute(rootPath))
{
    std::error_code ec;
    if (!std::filesystem::is_directory(rootPath_, ec)) {
        throw std::invalid_argument("DirectoryContext requires an existing directory: " + rootPath_.string());
    }
}

std::vector<FileDescriptor> DirectoryContext::listFiles(const std::string& extension) const
{
    const auto wanted = toLower(extension);

    std::error_code ec;
    std::filesystem::recursive_directory_iterator iterator(rootPath_, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("recursive_directory_iterator", rootPath_, ec);
    }

    std::vector<FileDescriptor> entries;
    for (const auto& entry : iterator) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (!wanted.empty() && toLower(entry.path().extension().string()) != wanted) {
            continue;
        }
        auto descriptor = buildDescriptor(entry);
        if (descriptor.relativePath.empty() || descriptor.relativePath.begin()->string() == "..") {
            continue;
        }
        entries.push_back(std::move(descriptor));
    }

    std::sort(entries.begin(), entries.end(), [](const FileDescriptor& lhs, const FileDescriptor& rhs) {
        return lhs.relativePath < rhs.relativePath;
    });
    return entries;
}

FileDescriptor DirectoryContext::buildDescriptor(const std::filesystem::directory_entry& entry) const
{
    // The iterator yields paths under rootPath_; resolving links here would
    // move a symlinked file outside the tree.
    FileDescriptor descriptor {};
    descriptor.absolutePath = entry.path();
    descriptor.relativePath = entry.path().lexically_relative(rootPath_);

    std::error_code ec;
    const auto size = entry.file_size(ec);
    descriptor.size = ec ? 0 : size;
    return descriptor;
}

} // namespace gifrgb::filesystem
