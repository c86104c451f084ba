#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gifrgb::filesystem {

struct FileDescriptor {
    std::filesystem::path absolutePath;
    std::filesystem::path relativePath;
    std::uintmax_t size {0};
};

class DirectoryContext {
public:
    explicit DirectoryContext(std::filesystem::path rootPath);

    // Regular files below the root, sorted by relative path. An empty
    // extension matches every file; otherwise matching ignores case.
    // Symlinked files are listed under their own name, never their target's.
    std::vector<FileDescriptor> listFiles(const std::string& extension = {}) const;

private:
    FileDescriptor buildDescriptor(const std::filesystem::directory_entry& entry) const;

    std::filesystem::path rootPath_;
};

} // namespace gifrgb::filesystem
