#include <catch2/catch_test_macros.hpp>

#include "download/TempFile.hpp"
#include "../utils/fixtures.hpp"

#include <filesystem>
#include <system_error>

using download::TempFile;
namespace fs = std::filesystem;

TEST_CASE("TempFile - lifetime", "[download][tempfile]") {
    test_utils::ScratchDir dir;

    SECTION("Creates a unique empty file and removes it") {
        fs::path first_path;
        {
            TempFile first = TempFile::create(dir.path());
            TempFile second = TempFile::create(dir.path());
            first_path = first.path();

            CHECK(first.valid());
            CHECK(fs::exists(first.path()));
            CHECK(fs::file_size(first.path()) == 0);
            CHECK(first.path() != second.path());
            CHECK(first.path().parent_path() == dir.path());
            CHECK(dir.fileCount() == 2);
        }
        CHECK_FALSE(fs::exists(first_path));
        CHECK(dir.fileCount() == 0);
    }

    SECTION("Move transfers ownership") {
        TempFile original = TempFile::create(dir.path());
        fs::path path = original.path();

        TempFile moved = std::move(original);
        CHECK_FALSE(original.valid());
        CHECK(moved.path() == path);

        moved = TempFile();
        CHECK_FALSE(fs::exists(path));
    }

    SECTION("Released file stays on disk") {
        fs::path path;
        {
            TempFile file = TempFile::create(dir.path());
            path = file.release();
            CHECK_FALSE(file.valid());
        }
        CHECK(fs::exists(path));
    }

    SECTION("Unusable directory throws") {
        fs::path blocker = dir.path() / "not-a-dir";
        TempFile blocking = TempFile::create(dir.path());
        fs::rename(blocking.release(), blocker);

        REQUIRE_THROWS_AS(TempFile::create(blocker / "sub"), std::system_error);
    }
}
