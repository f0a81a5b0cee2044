#include "rqsynth/core/mime_types.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace rqsynth::http::mime_types {

namespace {

struct ext_entry {
    std::string_view ext;
    std::string_view type;
};

// Sorted by extension for binary search
constexpr ext_entry ext_db[] = {
    {"7z", "application/x-7z-compressed"},
    {"aac", "audio/aac"},
    {"asc", "text/plain"},
    {"avi", "video/x-msvideo"},
    {"bmp", "image/bmp"},
    {"bz2", "application/x-bzip2"},
    {"c", "text/plain"},
    {"cpp", "text/plain"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"doc", "application/msword"},
    {"dvi", "application/x-dvi"},
    {"flac", "audio/flac"},
    {"gif", "image/gif"},
    {"gz", "application/x-gzip"},
    {"h", "text/plain"},
    {"hpp", "text/plain"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jar", "application/x-java-archive"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"m3u", "audio/x-mpegurl"},
    {"md", "text/markdown"},
    {"mov", "video/quicktime"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"mpeg", "video/mpeg"},
    {"mpg", "video/mpeg"},
    {"ogg", "application/ogg"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"ps", "application/postscript"},
    {"qt", "video/quicktime"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"tgz", "application/x-tgz"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"txt", "text/plain"},
    {"wav", "audio/x-wav"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"xhtml", "application/xhtml+xml"},
    {"xml", "text/xml"},
    {"zip", "application/zip"},
};

} // namespace

std::string_view lookup(std::string_view filename) noexcept {
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == filename.size()) {
        return DEFAULT_TYPE;
    }

    std::string_view ext = filename.substr(dot + 1);
    if (ext.find('/') != std::string_view::npos) {
        return DEFAULT_TYPE;
    }

    char buf[16];
    if (ext.size() > sizeof(buf)) {
        return DEFAULT_TYPE;
    }
    for (size_t i = 0; i < ext.size(); ++i) {
        buf[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(ext[i])));
    }
    std::string_view key(buf, ext.size());

    auto it = std::lower_bound(std::begin(ext_db), std::end(ext_db), key,
                               [](const ext_entry& e, std::string_view k) { return e.ext < k; });
    if (it != std::end(ext_db) && it->ext == key) {
        return it->type;
    }
    return DEFAULT_TYPE;
}

} // namespace rqsynth::http::mime_types
