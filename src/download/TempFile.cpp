#include "TempFile.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <unistd.h>
#include <stdlib.h>
#endif

namespace fs = std::filesystem;

namespace download
{

TempFile TempFile::create(const fs::path& directory)
{
    fs::path dir = directory.empty() ? fs::temp_directory_path() : directory;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        throw std::system_error(ec, "Failed to prepare temp directory " + dir.string());
    }

#ifdef _WIN32
    wchar_t buffer[MAX_PATH];
    if (GetTempFileNameW(dir.wstring().c_str(), L"pkg", 0, buffer) == 0)
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to create temp file in " + dir.string());
    }
    fs::path path(buffer);
#else
    std::string pattern = (dir / "pkgdl-XXXXXX.tmp").string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = mkstemps(name.data(), 4);
    if (fd == -1)
    {
        throw std::system_error(errno, std::generic_category(), "Failed to create temp file in " + dir.string());
    }
    ::close(fd);
    fs::path path(name.data());
#endif

    PLOG_DEBUG << "Created temp file " << path.string();
    return TempFile(std::move(path));
}

TempFile::~TempFile() { remove(); }

TempFile::TempFile(TempFile&& other) noexcept
    : path_(std::move(other.path_))
{
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept
{
    if (this != &other)
    {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

fs::path TempFile::release()
{
    fs::path released = std::move(path_);
    path_.clear();
    return released;
}

void TempFile::remove()
{
    if (path_.empty())
        return;

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec)
    {
        PLOG_WARNING << "Failed to remove temp file " << path_.string() << ": " << ec.message();
    }
    else
    {
        PLOG_DEBUG << "Removed temp file " << path_.string();
    }
    path_.clear();
}

} // namespace download
