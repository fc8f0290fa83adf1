#include "ZipPackage.hpp"

#include <plog/Log.h>

#define MINIZ_NO_ZLIB_APIS
#define MINIZ_NO_ARCHIVE_WRITING_APIS
#include <miniz.h>

#include <system_error>

namespace fs = std::filesystem;

namespace package
{

std::unique_ptr<ZipPackage> ZipPackage::open(download::TempFile file)
{
    const std::string zipPath = file.path().string();

    std::error_code ec;
    auto size = fs::file_size(file.path(), ec);
    if (ec)
    {
        throw PackageError("Cannot read package file " + zipPath + ": " + ec.message());
    }

    mz_zip_archive zip{};
    if (!mz_zip_reader_init_file(&zip, zipPath.c_str(), 0))
    {
        std::string reason = mz_zip_get_error_string(mz_zip_get_last_error(&zip));
        throw PackageError("Downloaded file is not a valid package archive (" + reason + ")");
    }

    std::unique_ptr<ZipPackage> package(new ZipPackage());
    package->size_ = size;

    mz_uint fileCount = mz_zip_reader_get_num_files(&zip);
    package->entries_.reserve(fileCount);
    for (mz_uint i = 0; i < fileCount; ++i)
    {
        mz_zip_archive_file_stat fileStat{};
        if (!mz_zip_reader_file_stat(&zip, i, &fileStat))
        {
            mz_zip_reader_end(&zip);
            throw PackageError("Corrupt central directory entry " + std::to_string(i) + " in " + zipPath);
        }
        package->entries_.emplace_back(fileStat.m_filename);
    }

    mz_zip_reader_end(&zip);

    package->file_ = std::move(file);
    PLOG_INFO << "Opened package " << zipPath << " (" << fileCount << " entries, " << size << " bytes)";
    return package;
}

ZipPackage::~ZipPackage() = default;

const fs::path& ZipPackage::path() const { return isPersisted() ? persistedPath_ : file_.path(); }

void ZipPackage::persistTo(const fs::path& destination)
{
    const fs::path source = path();
    if (destination.has_parent_path())
    {
        fs::create_directories(destination.parent_path());
    }

    std::error_code ec;
    fs::rename(source, destination, ec);
    if (ec)
    {
        // rename fails across file systems
        PLOG_DEBUG << "rename failed (" << ec.message() << "), copying " << source.string();
        fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
        fs::remove(source);
    }

    file_.release();
    persistedPath_ = destination;
    PLOG_INFO << "Package saved to " << destination.string();
}

} // namespace package
