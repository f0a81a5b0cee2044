#pragma once

#include <string_view>

namespace rqsynth::http::mime_types {

constexpr std::string_view DEFAULT_TYPE = "application/octet-stream";

// MIME type for a filename, keyed on the extension after the last '.'
// (case-insensitive). Unknown or missing extensions map to DEFAULT_TYPE.
[[nodiscard]] std::string_view lookup(std::string_view filename) noexcept;

} // namespace rqsynth::http::mime_types
