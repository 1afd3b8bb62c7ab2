#include <hoard/downloader/filename_utils.hpp>

#include <curl/curl.h>

#include <memory>

namespace hoard::downloader {

namespace {

bool isInvalidFilenameChar(unsigned char c) {
    if (c < 0x20 || c == 0x7F)
        return true;
    switch (c) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '/':
        case '\\':
        case '|':
        case '?':
        case '*':
            return true;
        default:
            return false;
    }
}

std::string stripInvalid(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (!isInvalidFilenameChar(c))
            out.push_back(static_cast<char>(c));
    }
    return out;
}

} // namespace

std::string sanitizeFilename(std::string_view filename) {
    // Split the extension off first so a stripped separator cannot move it.
    std::string_view stem = filename;
    std::string_view ext;
    auto dot = filename.find_last_of('.');
    if (dot != std::string_view::npos && dot > 0) {
        stem = filename.substr(0, dot);
        ext = filename.substr(dot);
    }

    std::string name = stripInvalid(stem);
    std::string extension = stripInvalid(ext);

    if (name.size() > kMaxFilenameLength) {
        std::size_t available =
            extension.size() < kMaxFilenameLength ? kMaxFilenameLength - extension.size() : 0;
        // Never cut inside a multi-byte UTF-8 sequence.
        while (available > 0 && (static_cast<unsigned char>(name[available]) & 0xC0) == 0x80)
            --available;
        name.resize(available);
    }

    std::string out = name + extension;
    if (out.empty() || out == "." || out == "..")
        return "download";
    return out;
}

std::string sanitizeDirectoryName(std::string_view name) {
    std::string out(name);
    for (auto& c : out) {
        if (c == '/' || c == ':')
            c = '_';
    }
    if (out == "." || out == "..")
        return "album";
    return out;
}

std::string filenameFromLink(std::string_view link) {
    std::string path(link);

    using UrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;
    UrlHandle url{curl_url(), &curl_url_cleanup};
    if (url && curl_url_set(url.get(), CURLUPART_URL, path.c_str(), CURLU_DEFAULT_SCHEME) ==
                   CURLUE_OK) {
        char* part = nullptr;
        if (curl_url_get(url.get(), CURLUPART_PATH, &part, CURLU_URLDECODE) == CURLUE_OK &&
            part != nullptr) {
            path = part;
            curl_free(part);
        }
    } else {
        auto cut = path.find_first_of("?#");
        if (cut != std::string::npos)
            path.resize(cut);
    }

    while (!path.empty() && path.back() == '/')
        path.pop_back();
    auto slash = path.find_last_of('/');
    std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
    return sanitizeFilename(last);
}

} // namespace hoard::downloader
