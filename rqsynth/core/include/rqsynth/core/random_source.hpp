#pragma once

#include "result.hpp"

#include <cstdint>
#include <random>
#include <span>

namespace rqsynth {

// Random byte capability used for multipart boundaries. Not thread-safe.
class random_source {
public:
    virtual ~random_source() = default;

    // Fills the whole buffer or returns an error; partial fills are errors.
    [[nodiscard]] virtual result<void> fill(std::span<uint8_t> out) = 0;
};

// Kernel CSPRNG via getrandom(2).
class system_random_source final : public random_source {
public:
    [[nodiscard]] result<void> fill(std::span<uint8_t> out) override;
};

// Deterministic stream for reproducible tests.
class seeded_random_source final : public random_source {
public:
    explicit seeded_random_source(uint64_t seed) noexcept : engine_(seed) {}

    [[nodiscard]] result<void> fill(std::span<uint8_t> out) override;

private:
    std::mt19937_64 engine_;
};

} // namespace rqsynth
