#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace test_utils {

// In-memory zip archive with the given entries (stored, not compressed)
std::string makeZip(const std::vector<std::pair<std::string, std::string>>& entries);

// Single-entry zip padded so the archive is exactly total_size bytes
std::string makeZipOfSize(std::size_t total_size);

// Unique directory removed on destruction
class ScratchDir {
public:
    ScratchDir();
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::size_t fileCount() const;

private:
    std::filesystem::path path_;
};

}  // namespace test_utils
