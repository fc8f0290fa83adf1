#include <catch2/catch_test_macros.hpp>

#include "download/TempFile.hpp"
#include "package/ZipPackage.hpp"
#include "../utils/fixtures.hpp"

#include <filesystem>
#include <fstream>

using download::TempFile;
using package::PackageError;
using package::ZipPackage;

namespace fs = std::filesystem;

namespace {

TempFile writeTemp(const test_utils::ScratchDir& dir, const std::string& contents) {
    TempFile file = TempFile::create(dir.path());
    std::ofstream out(file.path(), std::ios::binary);
    out << contents;
    return file;
}

}  // namespace

TEST_CASE("ZipPackage - open", "[package]") {
    test_utils::ScratchDir dir;

    SECTION("Lists archive entries") {
        std::string zip = test_utils::makeZip({{"Foo.nuspec", "<package/>"}, {"lib/net45/Foo.dll", "MZ"}});
        auto package = ZipPackage::open(writeTemp(dir, zip));

        REQUIRE(package != nullptr);
        CHECK(package->entryCount() == 2);
        CHECK(package->entryNames()[0] == "Foo.nuspec");
        CHECK(package->entryNames()[1] == "lib/net45/Foo.dll");
        CHECK(package->sizeBytes() == zip.size());
        CHECK(fs::exists(package->path()));
        CHECK_FALSE(package->isPersisted());
    }

    SECTION("Rejects a file that is not a zip archive") {
        REQUIRE_THROWS_AS(ZipPackage::open(writeTemp(dir, "<html>Service Unavailable</html>")), PackageError);
        CHECK(dir.fileCount() == 0);
    }

    SECTION("Rejects an empty file") {
        REQUIRE_THROWS_AS(ZipPackage::open(writeTemp(dir, "")), PackageError);
        CHECK(dir.fileCount() == 0);
    }
}

TEST_CASE("ZipPackage - ownership of the backing file", "[package]") {
    test_utils::ScratchDir dir;
    std::string zip = test_utils::makeZip({{"a.txt", "a"}});

    SECTION("Temp file is deleted with the package") {
        fs::path path;
        {
            auto package = ZipPackage::open(writeTemp(dir, zip));
            path = package->path();
            CHECK(fs::exists(path));
        }
        CHECK_FALSE(fs::exists(path));
    }

    SECTION("Persisted file outlives the package") {
        fs::path destination = dir.path() / "out" / "Foo.1.2.3.nupkg";
        {
            auto package = ZipPackage::open(writeTemp(dir, zip));
            fs::path temp_path = package->path();
            package->persistTo(destination);

            CHECK(package->isPersisted());
            CHECK(package->path() == destination);
            CHECK_FALSE(fs::exists(temp_path));
        }
        CHECK(fs::exists(destination));
        CHECK(fs::file_size(destination) == zip.size());
    }
}
