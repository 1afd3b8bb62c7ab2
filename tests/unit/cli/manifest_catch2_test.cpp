#include <catch2/catch_test_macros.hpp>

#include "../../common/test_helpers_catch2.h"

#include <hoard/cli/manifest.h>

#include <sstream>

using namespace hoard::cli;

TEST_CASE("Manifest: one item per line with optional filename", "[cli][manifest]") {
    std::istringstream in("# album 7\n"
                          "https://cdn1.example.net/a/01.jpg\n"
                          "\n"
                          "  https://cdn1.example.net/a/raw?id=2\tsecond shot.png  \n"
                          "https://cdn2.example.net/b/bonus%20track.flac\n");

    auto items = parseManifest(in, "album-7");

    REQUIRE(items.size() == 3);
    CHECK(items[0].link == "https://cdn1.example.net/a/01.jpg");
    CHECK(items[0].filename == "01.jpg");
    CHECK(items[0].ordinal == 1);
    CHECK(items[0].albumId == "album-7");

    CHECK(items[1].link == "https://cdn1.example.net/a/raw?id=2");
    CHECK(items[1].filename == "second shot.png");
    CHECK(items[1].ordinal == 2);

    CHECK(items[2].filename == "bonus track.flac");
    CHECK(items[2].ordinal == 3);
}

TEST_CASE("Manifest: lines without a link are dropped", "[cli][manifest]") {
    std::istringstream in("\tname-only.jpg\nhttps://cdn1.example.net/a/x.jpg\n");
    auto items = parseManifest(in, "a");
    REQUIRE(items.size() == 1);
    CHECK(items[0].ordinal == 1);
}

TEST_CASE("Manifest: missing file is an error", "[cli][manifest]") {
    hoard::test::TempDir dir{"hoard_manifest_"};
    auto r = loadManifest(dir / "missing.txt", "a");
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == hoard::downloader::ErrorCode::InvalidArgument);

    hoard::test::write_file(dir / "album.txt", "https://cdn1.example.net/a/1.jpg\n");
    auto ok = loadManifest(dir / "album.txt", "album");
    REQUIRE(ok.ok());
    CHECK(ok.value().size() == 1);
}
