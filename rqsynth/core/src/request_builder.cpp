#include "rqsynth/core/request_builder.hpp"
#include "rqsynth/core/body_resolution.hpp"

#include <iostream>
#include <utility>

namespace rqsynth::http {

namespace {

constexpr std::string_view CONTENT_TYPE = "Content-Type";

} // namespace

request_builder& request_builder::add_param(std::string_view name, std::string_view value) {
    auto& values = draft_.params[std::string(name)];
    values.insert(values.begin(), std::string(value));
    return *this;
}

request_builder& request_builder::set_params(const param_list& params) {
    params_map replaced;
    for (const auto& [name, value] : params) {
        replaced.insert_or_assign(name, std::vector<std::string>{value});
    }
    draft_.params = std::move(replaced);
    return *this;
}

request_builder& request_builder::set_file_params(const file_param_list& file_params) {
    file_params_map replaced;
    for (const auto& [name, file] : file_params) {
        replaced.insert_or_assign(name, std::vector<file_part>{file});
    }
    draft_.file_params = std::move(replaced);
    return *this;
}

request_builder& request_builder::set_content_type(std::string_view content_type) {
    draft_.headers.set(CONTENT_TYPE, content_type);
    draft_.content_type = std::string(content_type);
    return *this;
}

request_builder& request_builder::get(std::string_view uri, const param_list& params) {
    return form_url_encoded().set_method(method::get).set_uri(uri).set_params(params);
}

request_builder& request_builder::post_url_encoded(std::string_view uri,
                                                   const param_list& params) {
    return form_url_encoded().set_method(method::post).set_uri(uri).set_params(params);
}

request_builder& request_builder::post_multipart(std::string_view uri,
                                                 const param_list& params,
                                                 const file_param_list& file_params) {
    return multipart_encoded()
        .set_method(method::post)
        .set_uri(uri)
        .set_params(params)
        .set_file_params(file_params);
}

result<request> request_builder::build(random_source& rng, const request_defaults& defaults) {
    request_draft draft = std::exchange(draft_, request_draft{});

    auto body = resolve_body(draft, rng);
    if (!body) {
        std::cerr << "[request_builder] failed to resolve body for "
                  << method_to_string(draft.http_method) << " " << draft.uri << ": "
                  << body.error().message() << "\n";
        return std::unexpected(body.error());
    }
    return assemble_request(std::move(draft), std::move(*body), defaults);
}

result<request> build_request(const builder_steps& steps,
                              random_source& rng,
                              const request_defaults& defaults) {
    request_builder builder;
    if (steps) {
        steps(builder);
    }
    return builder.build(rng, defaults);
}

result<request> build_request(const builder_steps& steps) {
    system_random_source rng;
    return build_request(steps, rng);
}

} // namespace rqsynth::http
