#pragma once

#include <filesystem>

namespace download
{

// Uniquely named file removed on destruction unless released.
class TempFile
{
public:
    // Allocates an empty file in directory (platform temp dir when empty).
    // Throws std::system_error if the file cannot be created.
    static TempFile create(const std::filesystem::path& directory = {});

    TempFile() = default;
    ~TempFile();

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    // Give up ownership; the file stays on disk
    std::filesystem::path release();

    // Delete now (no-op if already released)
    void remove();

private:
    explicit TempFile(std::filesystem::path path)
        : path_(std::move(path))
    {
    }

    std::filesystem::path path_;
};

} // namespace download
