#pragma once

#include "random_source.hpp"
#include "request_draft.hpp"
#include "result.hpp"

#include <optional>
#include <string>

namespace rqsynth::http {

struct resolved_body {
    std::string body;
    // Absent means no body was configured, which differs from a zero-length body.
    std::optional<size_t> content_length;
    // Set only for multipart bodies; used to patch Content-Type.
    std::optional<std::string> boundary;
};

enum class body_kind : uint8_t { empty, url_encoded, multipart, raw };

// Which encoding a draft resolves to. First match wins:
//   POST + x-www-form-urlencoded -> url_encoded
//   POST + multipart/form-data   -> multipart
//   PUT                          -> raw
//   anything else                -> empty
[[nodiscard]] body_kind classify_body(const request_draft& draft) noexcept;

// Encodes the draft's body. Params, files or raw bodies that do not match the
// selected branch are dropped without error. Fails only if boundary generation
// cannot draw random bytes.
[[nodiscard]] result<resolved_body> resolve_body(const request_draft& draft, random_source& rng);

} // namespace rqsynth::http
