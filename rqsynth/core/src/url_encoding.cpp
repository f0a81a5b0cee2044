#include "rqsynth/core/url_encoding.hpp"

namespace rqsynth::http {

namespace {

constexpr char HEX_UPPER[] = "0123456789ABCDEF";

alignas(64) static const bool UNRESERVED_CHARS[256] = {
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,1,1,0,1,1,1,1,1,1,1,1,1,1,0,0,0,0,0,0,
    0,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,0,0,0,0,1,
    0,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,1,0,0,0,1,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
    0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0
};

inline bool is_unreserved(unsigned char c) noexcept {
    return UNRESERVED_CHARS[c];
}

} // namespace

void percent_encode_into(std::string& out, std::string_view in) {
    for (char ch : in) {
        auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX_UPPER[c >> 4]);
            out.push_back(HEX_UPPER[c & 0x0F]);
        }
    }
}

std::string percent_encode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    percent_encode_into(out, in);
    return out;
}

std::string encode_query(const params_map& params) {
    std::string out;
    bool first = true;
    for (const auto& [name, values] : params) {
        for (const auto& value : values) {
            if (!first) {
                out.push_back('&');
            }
            first = false;
            percent_encode_into(out, name);
            out.push_back('=');
            percent_encode_into(out, value);
        }
    }
    return out;
}

} // namespace rqsynth::http
