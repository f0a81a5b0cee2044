#include "rqsynth/core/random_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/random.h>
#include <system_error>

namespace rqsynth {

result<void> system_random_source::fill(std::span<uint8_t> out) {
    size_t filled = 0;
    while (filled < out.size()) {
        ssize_t n;
        do {
            n = ::getrandom(out.data() + filled, out.size() - filled, 0);
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            return std::unexpected(std::error_code(errno, std::system_category()));
        }
        if (n == 0) {
            return std::unexpected(make_error_code(error_code::short_random_read));
        }
        filled += static_cast<size_t>(n);
    }
    return {};
}

result<void> seeded_random_source::fill(std::span<uint8_t> out) {
    size_t i = 0;
    while (i < out.size()) {
        uint64_t word = engine_();
        size_t take = std::min(sizeof(word), out.size() - i);
        std::memcpy(out.data() + i, &word, take);
        i += take;
    }
    return {};
}

} // namespace rqsynth
