#include <catch2/catch_test_macros.hpp>

#include <hoard/downloader/filename_utils.hpp>

#include <string>

using namespace hoard::downloader;

TEST_CASE("sanitizeFilename: strips characters illegal on common filesystems",
          "[downloader][filenames]") {
    CHECK(sanitizeFilename("cover.jpg") == "cover.jpg");
    CHECK(sanitizeFilename("a<b>c:d\"e|f?g*h.png") == "abcdefgh.png");
    CHECK(sanitizeFilename("dir/sub\\name.gif") == "dirsubname.gif");
    CHECK(sanitizeFilename(std::string("tab\there\x01.mp4")) == "tabhere.mp4");
    CHECK(sanitizeFilename("") == "download");
    CHECK(sanitizeFilename("???") == "download");
    CHECK(sanitizeFilename("name with spaces.webm") == "name with spaces.webm");
}

TEST_CASE("sanitizeFilename: long names keep their extension", "[downloader][filenames]") {
    const std::string stem(300, 'x');

    auto out = sanitizeFilename(stem + ".jpeg");
    CHECK(out.size() == kMaxFilenameLength);
    CHECK(out.substr(out.size() - 5) == ".jpeg");

    auto bare = sanitizeFilename(stem);
    CHECK(bare.size() == kMaxFilenameLength);

    // Exactly at the limit is left alone.
    const std::string atLimit(kMaxFilenameLength, 'y');
    CHECK(sanitizeFilename(atLimit) == atLimit);
}

TEST_CASE("sanitizeFilename: truncation keeps UTF-8 sequences whole", "[downloader][filenames]") {
    std::string stem;
    for (int i = 0; i < 70; ++i)
        stem += "\xC3\xA9"; // é

    auto out = sanitizeFilename(stem + ".jpeg");

    CHECK(out.size() == 119);
    CHECK(out.substr(out.size() - 5) == ".jpeg");
    const auto kept = out.substr(0, out.size() - 5);
    CHECK(kept.size() % 2 == 0);
    CHECK(static_cast<unsigned char>(kept.back()) == 0xA9);
}

TEST_CASE("sanitizeDirectoryName: no path separators", "[downloader][filenames]") {
    CHECK(sanitizeDirectoryName("album-7") == "album-7");
    CHECK(sanitizeDirectoryName("../etc/passwd") == ".._etc_passwd");
    CHECK(sanitizeDirectoryName("a:b") == "a_b");
    CHECK(sanitizeDirectoryName("..") == "album");
    CHECK(sanitizeDirectoryName(".") == "album");
}

TEST_CASE("filenameFromLink: last path segment, decoded", "[downloader][filenames]") {
    CHECK(filenameFromLink("https://cdn.example.net/albums/7/01.jpg") == "01.jpg");
    CHECK(filenameFromLink("https://cdn.example.net/a/bonus%20track.flac?sig=abc#x") ==
          "bonus track.flac");
    CHECK(filenameFromLink("https://cdn.example.net/a/b/") == "b");
    CHECK(filenameFromLink("https://cdn.example.net/") == "download");
}
