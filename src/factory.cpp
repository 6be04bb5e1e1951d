#include <stdexcept>
#include <string>

#include "rateguard/factory.h"

namespace rg {

namespace {

struct NamedAlgorithm {
    const char* name;
    Algorithm algorithm;
};

constexpr NamedAlgorithm kAlgorithms[] = {
    {"fixed_window", Algorithm::kFixedWindow},
    {"leaky_bucket", Algorithm::kLeakyBucket},
    {"token_bucket", Algorithm::kTokenBucket},
    {"sliding_window", Algorithm::kSlidingWindow},
    {"approximate_sliding_window", Algorithm::kApproximateSlidingWindow},
};

struct Builder {
    std::unique_ptr<RateLimiter> operator()(const FixedWindowCounter::Config& c) const {
        return std::make_unique<FixedWindowCounter>(c);
    }
    std::unique_ptr<RateLimiter> operator()(const LeakyBucket::Config& c) const {
        return std::make_unique<LeakyBucket>(c);
    }
    std::unique_ptr<RateLimiter> operator()(const TokenBucket::Config& c) const {
        return std::make_unique<TokenBucket>(c);
    }
    std::unique_ptr<RateLimiter> operator()(const SlidingWindowCounter::Config& c) const {
        return std::make_unique<SlidingWindowCounter>(c);
    }
    std::unique_ptr<RateLimiter> operator()(const ApproximateSlidingWindow::Config& c) const {
        return std::make_unique<ApproximateSlidingWindow>(c);
    }
};

} // namespace

Algorithm parse_algorithm(std::string_view name) {
    for (const auto& a : kAlgorithms) {
        if (name == a.name) return a.algorithm;
    }
    throw std::invalid_argument("unknown algorithm: " + std::string(name));
}

const char* to_string(Algorithm algorithm) noexcept {
    for (const auto& a : kAlgorithms) {
        if (a.algorithm == algorithm) return a.name;
    }
    return "unknown";
}

std::size_t rate_param_count(Algorithm algorithm) noexcept {
    switch (algorithm) {
        case Algorithm::kFixedWindow:
        case Algorithm::kApproximateSlidingWindow:
            return 1;
        case Algorithm::kLeakyBucket:
        case Algorithm::kTokenBucket:
        case Algorithm::kSlidingWindow:
            return 2;
    }
    return 0;
}

LimiterConfig make_limiter_config(Algorithm algorithm, Uint capacity,
                                  const std::vector<Uint>& params) {
    const std::size_t expected = rate_param_count(algorithm);
    if (params.size() != expected) {
        throw std::invalid_argument(std::string(to_string(algorithm)) + " takes " +
                                    std::to_string(expected) + " parameter(s) after capacity, got " +
                                    std::to_string(params.size()));
    }
    switch (algorithm) {
        case Algorithm::kFixedWindow:
            return FixedWindowCounter::Config{capacity, params[0]};
        case Algorithm::kLeakyBucket:
            return LeakyBucket::Config{capacity, params[0], params[1]};
        case Algorithm::kTokenBucket:
            return TokenBucket::Config{capacity, params[0], params[1]};
        case Algorithm::kSlidingWindow:
            return SlidingWindowCounter::Config{capacity, params[0], params[1]};
        case Algorithm::kApproximateSlidingWindow:
            return ApproximateSlidingWindow::Config{capacity, params[0]};
    }
    throw std::invalid_argument("unknown algorithm");
}

Algorithm algorithm_of(const LimiterConfig& cfg) noexcept {
    return static_cast<Algorithm>(cfg.index());
}

std::unique_ptr<RateLimiter> make_rate_limiter(const LimiterConfig& cfg) {
    return std::visit(Builder{}, cfg);
}

} // namespace rg
