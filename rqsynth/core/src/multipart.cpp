#include "rqsynth/core/multipart.hpp"
#include "rqsynth/core/mime_types.hpp"

#include <array>
#include <cstdint>

namespace rqsynth::http {

namespace {

constexpr char HEX_LOWER[] = "0123456789abcdef";

constexpr std::string_view CRLF = "\r\n";
constexpr std::string_view DASHES = "--";
constexpr std::string_view FORM_DATA_NAME = "Content-Disposition: form-data; name=\"";
constexpr std::string_view CONTENT_DISPOSITION = "Content-Disposition: ";
constexpr std::string_view FILENAME = "; filename=\"";
constexpr std::string_view CONTENT_TYPE = "Content-Type: ";
constexpr std::string_view MIXED_CONTENT_TYPE = "Content-Type: multipart/mixed; boundary=";

void append_delimiter(std::string& out, std::string_view boundary) {
    out.append(DASHES);
    out.append(boundary);
    out.append(CRLF);
}

void append_param_part(std::string& out,
                       std::string_view boundary,
                       std::string_view name,
                       std::string_view value) {
    append_delimiter(out, boundary);
    out.append(FORM_DATA_NAME);
    out.append(name);
    out.push_back('"');
    out.append(CRLF);
    out.append(CRLF);
    out.append(value);
    out.append(CRLF);
}

// Shared tail of top-level and nested file parts: filename, Content-Type, content.
void append_file_tail(std::string& out, const file_part& file) {
    out.append(FILENAME);
    out.append(file.filename);
    out.push_back('"');
    out.append(CRLF);
    out.append(CONTENT_TYPE);
    out.append(mime_types::lookup(file.filename));
    out.append(CRLF);
    out.append(CRLF);
    out.append(file.content);
    out.append(CRLF);
}

void append_simple_file(std::string& out,
                        std::string_view boundary,
                        std::string_view name,
                        const file_part& file) {
    append_delimiter(out, boundary);
    out.append(FORM_DATA_NAME);
    out.append(name);
    out.push_back('"');
    append_file_tail(out, file);
}

void append_compound_file(std::string& out,
                          std::string_view boundary,
                          std::string_view file_boundary,
                          std::string_view name,
                          const std::vector<file_part>& files) {
    append_delimiter(out, boundary);
    out.append(FORM_DATA_NAME);
    out.append(name);
    out.push_back('"');
    out.append(CRLF);
    out.append(MIXED_CONTENT_TYPE);
    out.append(file_boundary);
    out.append(CRLF);
    out.append(CRLF);

    for (const auto& file : files) {
        append_delimiter(out, file_boundary);
        out.append(CONTENT_DISPOSITION);
        out.append(name);
        append_file_tail(out, file);
    }

    out.append(DASHES);
    out.append(file_boundary);
    out.append(DASHES);
    out.append(CRLF);
}

} // namespace

result<std::string> new_boundary(random_source& rng) {
    std::array<uint8_t, BOUNDARY_RANDOM_BYTES> bytes{};
    auto filled = rng.fill(bytes);
    if (!filled) {
        return std::unexpected(filled.error());
    }

    std::string boundary;
    boundary.reserve(BOUNDARY_LENGTH);
    boundary.append(BOUNDARY_PREFIX);
    for (uint8_t b : bytes) {
        boundary.push_back(HEX_LOWER[b >> 4]);
        boundary.push_back(HEX_LOWER[b & 0x0F]);
    }
    return boundary;
}

std::string encode_multipart(std::string_view boundary,
                             std::string_view file_boundary,
                             const params_map& params,
                             const file_params_map& file_params) {
    std::string out;

    size_t estimate = boundary.size() + 4;
    for (const auto& [name, values] : params) {
        for (const auto& value : values) {
            estimate += 64 + boundary.size() + name.size() + value.size();
        }
    }
    for (const auto& [name, files] : file_params) {
        for (const auto& file : files) {
            estimate += 128 + file_boundary.size() + name.size() + file.filename.size() +
                        file.content.size();
        }
    }
    out.reserve(estimate);

    for (const auto& [name, values] : params) {
        for (const auto& value : values) {
            append_param_part(out, boundary, name, value);
        }
    }

    for (const auto& [name, files] : file_params) {
        if (files.size() == 1) {
            append_simple_file(out, boundary, name, files.front());
        } else {
            append_compound_file(out, boundary, file_boundary, name, files);
        }
    }

    out.append(DASHES);
    out.append(boundary);
    out.append(DASHES);
    return out;
}

} // namespace rqsynth::http
