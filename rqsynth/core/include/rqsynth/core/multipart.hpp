#pragma once

#include "http.hpp"
#include "random_source.hpp"
#include "result.hpp"

#include <string>
#include <string_view>

namespace rqsynth::http {

constexpr std::string_view BOUNDARY_PREFIX = "snap-boundary-";
constexpr size_t BOUNDARY_RANDOM_BYTES = 10;
constexpr size_t BOUNDARY_LENGTH = BOUNDARY_PREFIX.size() + BOUNDARY_RANDOM_BYTES * 2;

// BOUNDARY_PREFIX followed by BOUNDARY_RANDOM_BYTES of lowercase hex.
[[nodiscard]] result<std::string> new_boundary(random_source& rng);

/// Render a multipart/form-data body.
///
/// Layout: one part per param value, then one part per file field, then the
/// closing "--boundary--" (no trailing CRLF). A file field with exactly one
/// file is sent as a plain file part; any other count is wrapped in a nested
/// multipart/mixed part delimited by file_boundary, whose inner
/// Content-Disposition carries the bare field name without "form-data;".
[[nodiscard]] std::string encode_multipart(std::string_view boundary,
                                           std::string_view file_boundary,
                                           const params_map& params,
                                           const file_params_map& file_params);

} // namespace rqsynth::http
