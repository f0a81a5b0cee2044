#pragma once

#include "http_headers.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rqsynth::http {

enum class method : uint8_t { get, post, put, del, patch, head, options, trace, connect, unknown };

// Content-type tags understood by body resolution.
constexpr std::string_view FORM_URL_ENCODED = "x-www-form-urlencoded";
constexpr std::string_view MULTIPART_FORM_DATA = "multipart/form-data";

// Values are kept most-recently-added first.
using params_map = std::map<std::string, std::vector<std::string>>;

struct file_part {
    std::string filename;
    std::string content;

    bool operator==(const file_part&) const = default;
};

// One part per field is a simple upload; any other count is sent as multipart/mixed.
using file_params_map = std::map<std::string, std::vector<file_part>>;

struct http_version {
    int major = 1;
    int minor = 1;

    bool operator==(const http_version&) const = default;
};

// Fully resolved request handed to handlers under test.
struct request {
    method http_method = method::get;
    std::string uri;
    std::string query_string;
    headers_map headers;
    std::string body;
    std::optional<size_t> content_length;
    params_map params;
    bool is_secure = false;
    http_version version;

    std::string server_name;
    uint16_t server_port = 0;
    std::string remote_addr;
    uint16_t remote_port = 0;
    std::string local_addr;
    uint16_t local_port = 0;
    std::string local_hostname;

    std::string context_path;
    std::string path_info;
    std::string snaplet_path;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const {
        return headers.get(name);
    }

    [[nodiscard]] std::optional<std::string_view> param(std::string_view name) const;

    [[nodiscard]] std::string_view body_string() const noexcept { return body; }

    // HTTP/1.1 wire rendering; emits Content-Length only when one was resolved.
    void serialize_into(std::string& out) const;
    [[nodiscard]] std::string serialize() const;
};

method parse_method(std::string_view str);
std::string_view method_to_string(method m);

} // namespace rqsynth::http
