#pragma once

#include "download/TempFile.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace package
{

class PackageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Downloaded archive opened with miniz. Owns the backing file: it is deleted with the
// package unless persistTo() moved it to a final location first.
class ZipPackage
{
public:
    // Throws PackageError if the file is not a readable zip archive
    static std::unique_ptr<ZipPackage> open(download::TempFile file);

    ~ZipPackage();

    ZipPackage(const ZipPackage&) = delete;
    ZipPackage& operator=(const ZipPackage&) = delete;

    const std::filesystem::path& path() const;
    std::uint64_t sizeBytes() const { return size_; }
    std::size_t entryCount() const { return entries_.size(); }
    const std::vector<std::string>& entryNames() const { return entries_; }

    // Move the archive to destination and stop treating it as temporary.
    // Throws std::filesystem::filesystem_error on failure.
    void persistTo(const std::filesystem::path& destination);

    bool isPersisted() const { return !persistedPath_.empty(); }

private:
    ZipPackage() = default;

    download::TempFile file_;
    std::filesystem::path persistedPath_;
    std::uint64_t size_ = 0;
    std::vector<std::string> entries_;
};

} // namespace package
