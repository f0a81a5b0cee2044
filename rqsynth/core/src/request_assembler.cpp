#include "rqsynth/core/request_assembler.hpp"
#include "rqsynth/core/url_encoding.hpp"

#include <utility>

namespace rqsynth::http {

namespace {

constexpr std::string_view CONTENT_TYPE = "Content-Type";
constexpr std::string_view BOUNDARY_PARAM = "; boundary=";

} // namespace

std::string assemble_uri(const request_draft& draft) {
    if (draft.http_method != method::get || draft.params.empty()) {
        return draft.uri;
    }

    std::string uri;
    uri.reserve(draft.uri.size() + 1 + draft.params.size() * 16);
    uri.append(draft.uri);
    uri.push_back('?');
    uri.append(encode_query(draft.params));
    return uri;
}

headers_map assemble_headers(const request_draft& draft,
                             const std::optional<std::string>& boundary) {
    headers_map headers = draft.headers;
    if (boundary && draft.content_type == MULTIPART_FORM_DATA) {
        std::string value;
        value.reserve(MULTIPART_FORM_DATA.size() + BOUNDARY_PARAM.size() + boundary->size());
        value.append(MULTIPART_FORM_DATA);
        value.append(BOUNDARY_PARAM);
        value.append(*boundary);
        headers.set(CONTENT_TYPE, value);
    }
    return headers;
}

request assemble_request(request_draft&& draft,
                         resolved_body&& body,
                         const request_defaults& defaults) {
    request req;
    req.http_method = draft.http_method;
    req.uri = assemble_uri(draft);
    if (draft.http_method == method::get) {
        req.query_string = encode_query(draft.params);
    }
    req.headers = assemble_headers(draft, body.boundary);
    req.body = std::move(body.body);
    req.content_length = body.content_length;
    req.params = std::move(draft.params);
    req.is_secure = draft.is_secure;
    req.version = defaults.version;

    req.server_name = defaults.server_name;
    req.server_port = defaults.server_port;
    req.remote_addr = defaults.remote_addr;
    req.remote_port = defaults.remote_port;
    req.local_addr = defaults.local_addr;
    req.local_port = defaults.local_port;
    req.local_hostname = defaults.local_hostname;

    req.context_path = defaults.context_path;
    req.path_info = defaults.path_info;
    req.snaplet_path = defaults.snaplet_path;
    return req;
}

} // namespace rqsynth::http
