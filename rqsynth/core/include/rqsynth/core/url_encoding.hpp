#pragma once

#include "http.hpp"

#include <string>
#include <string_view>

namespace rqsynth::http {

// RFC 3986 unreserved characters pass through; everything else, including
// space, becomes %XX with uppercase hex.
[[nodiscard]] std::string percent_encode(std::string_view in);
void percent_encode_into(std::string& out, std::string_view in);

// application/x-www-form-urlencoded rendering of params: "n1=v1&n2=v2", in key
// order and then value order. Empty params yield an empty string.
[[nodiscard]] std::string encode_query(const params_map& params);

} // namespace rqsynth::http
