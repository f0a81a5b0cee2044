#pragma once

#include "body_resolution.hpp"
#include "http.hpp"
#include "request_draft.hpp"

#include <cstdint>
#include <string>

namespace rqsynth::http {

// Connection fields stamped onto every built request.
struct request_defaults {
    std::string server_name = "localhost";
    uint16_t server_port = 80;
    std::string remote_addr = "127.0.0.1";
    uint16_t remote_port = 80;
    std::string local_addr = "127.0.0.1";
    uint16_t local_port = 80;
    std::string local_hostname = "localhost";
    http_version version{1, 1};
    std::string context_path;
    std::string path_info;
    std::string snaplet_path;
};

// "uri?query" for GET with params, the draft URI otherwise.
[[nodiscard]] std::string assemble_uri(const request_draft& draft);

// Draft headers, with Content-Type rewritten to carry the boundary when a
// multipart body was produced for a multipart/form-data draft.
[[nodiscard]] headers_map assemble_headers(const request_draft& draft,
                                           const std::optional<std::string>& boundary);

[[nodiscard]] request assemble_request(request_draft&& draft,
                                       resolved_body&& body,
                                       const request_defaults& defaults = {});

} // namespace rqsynth::http
