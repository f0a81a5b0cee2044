#include "rqsynth/core/http.hpp"

#include <charconv>

namespace rqsynth::http {

namespace {

constexpr std::string_view HTTP_VERSION_PREFIX = "HTTP/";
constexpr std::string_view CONTENT_LENGTH = "Content-Length";
constexpr std::string_view HEADER_SEPARATOR = ": ";
constexpr std::string_view CRLF = "\r\n";

void append_number(std::string& out, size_t value) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(buf, static_cast<size_t>(ptr - buf));
}

} // namespace

method parse_method(std::string_view str) {
    if (str == "GET") return method::get;
    if (str == "POST") return method::post;
    if (str == "PUT") return method::put;
    if (str == "DELETE") return method::del;
    if (str == "PATCH") return method::patch;
    if (str == "HEAD") return method::head;
    if (str == "OPTIONS") return method::options;
    if (str == "TRACE") return method::trace;
    if (str == "CONNECT") return method::connect;
    return method::unknown;
}

std::string_view method_to_string(method m) {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::del: return "DELETE";
        case method::patch: return "PATCH";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        case method::trace: return "TRACE";
        case method::connect: return "CONNECT";
        default: return "UNKNOWN";
    }
}

std::optional<std::string_view> request::param(std::string_view name) const {
    auto it = params.find(std::string(name));
    if (it == params.end() || it->second.empty()) {
        return std::nullopt;
    }
    return std::string_view(it->second.front());
}

void request::serialize_into(std::string& out) const {
    out.append(method_to_string(http_method));
    out.push_back(' ');
    out.append(uri.empty() ? std::string_view("/") : std::string_view(uri));
    out.push_back(' ');
    out.append(HTTP_VERSION_PREFIX);
    append_number(out, static_cast<size_t>(version.major));
    out.push_back('.');
    append_number(out, static_cast<size_t>(version.minor));
    out.append(CRLF);

    for (const auto& [name, value] : headers) {
        out.append(name);
        out.append(HEADER_SEPARATOR);
        out.append(value);
        out.append(CRLF);
    }

    if (content_length && !headers.contains(CONTENT_LENGTH)) {
        out.append(CONTENT_LENGTH);
        out.append(HEADER_SEPARATOR);
        append_number(out, *content_length);
        out.append(CRLF);
    }

    out.append(CRLF);
    out.append(body);
}

std::string request::serialize() const {
    size_t headers_size = 0;
    for (const auto& [name, value] : headers) {
        headers_size += name.size() + HEADER_SEPARATOR.size() + value.size() + CRLF.size();
    }

    std::string result;
    result.reserve(64 + uri.size() + headers_size + body.size());
    serialize_into(result);
    return result;
}

} // namespace rqsynth::http
