#pragma once

#include "http.hpp"
#include "random_source.hpp"
#include "request_assembler.hpp"
#include "request_draft.hpp"
#include "result.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rqsynth::http {

using param_list = std::vector<std::pair<std::string, std::string>>;
using file_param_list = std::vector<std::pair<std::string, file_part>>;

/// Accumulates the configuration of a single test request.
///
/// Every call mutates the draft in place and returns the builder, so later
/// calls override earlier ones. Nothing is validated here: combinations that
/// make no sense (files on a urlencoded POST, a raw body on GET) are accepted
/// and simply have no effect once the body is resolved.
///
/// Example:
/// @code
///   seeded_random_source rng(42);
///   auto req = request_builder()
///                  .post_multipart("/upload", {{"title", "cat"}},
///                                  {{"photo", {"cat.jpg", jpeg_bytes}}})
///                  .set_header("Accept", "application/json")
///                  .build(rng);
/// @endcode
class request_builder {
public:
    request_builder() = default;

    request_builder& set_method(method m) {
        draft_.http_method = m;
        return *this;
    }

    // Prepends, so the newest value for a name comes first.
    request_builder& add_param(std::string_view name, std::string_view value);

    // Replaces all params; each name maps to a one-element list (last duplicate wins).
    request_builder& set_params(const param_list& params);

    // Replaces all file params; each name maps to a single file.
    request_builder& set_file_params(const file_param_list& file_params);

    // Only used when the request resolves as PUT.
    request_builder& set_request_body(std::string body) {
        draft_.body = std::move(body);
        return *this;
    }

    request_builder& set_header(std::string_view name, std::string_view value) {
        draft_.headers.set(name, value);
        return *this;
    }

    request_builder& add_header(std::string_view name, std::string_view value) {
        draft_.headers.add(name, value);
        return *this;
    }

    request_builder& form_url_encoded() { return set_content_type(FORM_URL_ENCODED); }

    // The boundary parameter is appended to Content-Type at build time.
    request_builder& multipart_encoded() { return set_content_type(MULTIPART_FORM_DATA); }

    request_builder& set_content_type(std::string_view content_type);

    request_builder& use_https() {
        draft_.is_secure = true;
        return *this;
    }

    request_builder& set_uri(std::string_view uri) {
        draft_.uri = std::string(uri);
        return *this;
    }

    request_builder& get(std::string_view uri, const param_list& params);
    request_builder& post_url_encoded(std::string_view uri, const param_list& params);
    request_builder& post_multipart(std::string_view uri,
                                    const param_list& params,
                                    const file_param_list& file_params);

    [[nodiscard]] const request_draft& draft() const noexcept { return draft_; }

    // Resolves the body and assembles the final request. The draft is moved
    // out, leaving the builder holding a default draft.
    [[nodiscard]] result<request> build(random_source& rng, const request_defaults& defaults = {});

private:
    request_draft draft_;
};

using builder_steps = std::function<void(request_builder&)>;

// Applies steps to a fresh builder and builds it.
[[nodiscard]] result<request> build_request(const builder_steps& steps,
                                            random_source& rng,
                                            const request_defaults& defaults = {});

// Same, drawing boundaries from the kernel random source.
[[nodiscard]] result<request> build_request(const builder_steps& steps);

} // namespace rqsynth::http
