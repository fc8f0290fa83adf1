#include "fixtures.hpp"

#include <miniz.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

namespace fs = std::filesystem;

namespace test_utils {

std::string makeZip(const std::vector<std::pair<std::string, std::string>>& entries) {
    mz_zip_archive zip{};
    if (!mz_zip_writer_init_heap(&zip, 0, 0)) {
        throw std::runtime_error("mz_zip_writer_init_heap failed");
    }

    for (const auto& [name, data] : entries) {
        if (!mz_zip_writer_add_mem(&zip, name.c_str(), data.data(), data.size(), MZ_NO_COMPRESSION)) {
            mz_zip_writer_end(&zip);
            throw std::runtime_error("mz_zip_writer_add_mem failed for " + name);
        }
    }

    void* buffer = nullptr;
    size_t size = 0;
    if (!mz_zip_writer_finalize_heap_archive(&zip, &buffer, &size)) {
        mz_zip_writer_end(&zip);
        throw std::runtime_error("mz_zip_writer_finalize_heap_archive failed");
    }

    std::string archive(static_cast<const char*>(buffer), size);
    mz_free(buffer);
    mz_zip_writer_end(&zip);
    return archive;
}

std::string makeZipOfSize(std::size_t total_size) {
    // Stored entries have a fixed overhead, so measure it once and pad the payload
    const std::string name = "content.bin";
    const std::size_t probe = 64;
    std::size_t overhead = makeZip({{name, std::string(probe, 'x')}}).size() - probe;
    if (total_size <= overhead) {
        throw std::invalid_argument("archive size too small");
    }

    std::string archive = makeZip({{name, std::string(total_size - overhead, 'x')}});
    if (archive.size() != total_size) {
        throw std::runtime_error("unexpected zip size " + std::to_string(archive.size()));
    }
    return archive;
}

ScratchDir::ScratchDir() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            ("pkgdl-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
    fs::create_directories(path_);
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::size_t ScratchDir::fileCount() const {
    std::size_t count = 0;
    for (const auto& entry : fs::directory_iterator(path_)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

}  // namespace test_utils
