#pragma once

#include "http.hpp"

#include <optional>
#include <string>

namespace rqsynth::http {

// Mutable configuration accumulated by a request_builder before resolution.
struct request_draft {
    method http_method = method::get;
    params_map params;
    file_params_map file_params;
    std::optional<std::string> body;
    headers_map headers;
    std::string content_type{FORM_URL_ENCODED};
    bool is_secure = false;
    std::string uri;
};

} // namespace rqsynth::http
