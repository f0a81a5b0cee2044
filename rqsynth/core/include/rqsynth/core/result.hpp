#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace rqsynth {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    random_source_failed = 1,
    short_random_read = 2,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "rqsynth"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::random_source_failed:
            return "random source failed";
        case ec::short_random_read:
            return "random source returned fewer bytes than requested";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace rqsynth

namespace std {
template <> struct is_error_code_enum<rqsynth::error_code> : true_type {};
} // namespace std
