#pragma once

#include "rqsynth/core/http.hpp"
#include "rqsynth/core/random_source.hpp"
#include "rqsynth/core/request_builder.hpp"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace rqsynth::test_support {

// Lightweight harness to run HTTP handlers against synthesized requests.
// Boundaries come from a seeded source so multipart bodies are reproducible.
template <typename Response> class HttpHandlerHarness {
public:
    using Handler = std::function<Response(const http::request&)>;

    explicit HttpHandlerHarness(Handler handler, uint64_t seed = 0x5eed)
        : handler_(std::move(handler)), rng_(seed) {}

    // Build a request from builder steps, run handler, and return its response.
    Response run(const http::builder_steps& steps) {
        auto req = http::build_request(steps, rng_, defaults_);
        if (!req) {
            throw std::runtime_error("Failed to build HTTP request in harness: " +
                                     req.error().message());
        }
        return handler_(*req);
    }

    // Run handler against an already built request.
    Response run(const http::request& req) const { return handler_(req); }

    http::request_defaults& defaults() noexcept { return defaults_; }

private:
    Handler handler_;
    seeded_random_source rng_;
    http::request_defaults defaults_;
};

} // namespace rqsynth::test_support
