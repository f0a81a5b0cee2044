#include "rqsynth/core/body_resolution.hpp"
#include "rqsynth/core/multipart.hpp"
#include "rqsynth/core/url_encoding.hpp"

#include <utility>

namespace rqsynth::http {

body_kind classify_body(const request_draft& draft) noexcept {
    if (draft.http_method == method::post && draft.content_type == FORM_URL_ENCODED) {
        return body_kind::url_encoded;
    }
    if (draft.http_method == method::post && draft.content_type == MULTIPART_FORM_DATA) {
        return body_kind::multipart;
    }
    if (draft.http_method == method::put) {
        return body_kind::raw;
    }
    return body_kind::empty;
}

result<resolved_body> resolve_body(const request_draft& draft, random_source& rng) {
    resolved_body out;

    switch (classify_body(draft)) {
    case body_kind::url_encoded:
        out.body = encode_query(draft.params);
        out.content_length = out.body.size();
        break;

    case body_kind::multipart: {
        // Both boundaries are drawn up front even when no compound file field needs the second.
        auto boundary = new_boundary(rng);
        if (!boundary) {
            return std::unexpected(boundary.error());
        }
        auto file_boundary = new_boundary(rng);
        if (!file_boundary) {
            return std::unexpected(file_boundary.error());
        }
        out.body = encode_multipart(*boundary, *file_boundary, draft.params, draft.file_params);
        out.content_length = out.body.size();
        out.boundary = std::move(*boundary);
        break;
    }

    case body_kind::raw:
        if (draft.body) {
            out.body = *draft.body;
            out.content_length = draft.body->size();
        }
        break;

    case body_kind::empty:
        break;
    }

    return out;
}

} // namespace rqsynth::http
