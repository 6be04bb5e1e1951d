#pragma once
#include <memory>
#include <string_view>
#include <variant>
#include <vector>

#include "rateguard/approximate_sliding_window.h"
#include "rateguard/fixed_window_counter.h"
#include "rateguard/leaky_bucket.h"
#include "rateguard/sliding_window_counter.h"
#include "rateguard/token_bucket.h"

namespace rg {

enum class Algorithm : std::uint8_t {
    kFixedWindow = 0,
    kLeakyBucket = 1,
    kTokenBucket = 2,
    kSlidingWindow = 3,
    kApproximateSlidingWindow = 4,
};

using LimiterConfig = std::variant<FixedWindowCounter::Config,
                                   LeakyBucket::Config,
                                   TokenBucket::Config,
                                   SlidingWindowCounter::Config,
                                   ApproximateSlidingWindow::Config>;

// "fixed_window", "leaky_bucket", "token_bucket", "sliding_window",
// "approximate_sliding_window". Throws std::invalid_argument otherwise.
RG_API Algorithm parse_algorithm(std::string_view name);
RG_API const char* to_string(Algorithm algorithm) noexcept;

// Number of parameters after capacity that `algorithm` takes.
RG_API std::size_t rate_param_count(Algorithm algorithm) noexcept;

// Builds the config from capacity plus the algorithm's rate parameters in
// constructor order. Throws std::invalid_argument on a wrong parameter count.
RG_API LimiterConfig make_limiter_config(Algorithm algorithm, Uint capacity,
                                         const std::vector<Uint>& params);

RG_API Algorithm algorithm_of(const LimiterConfig& cfg) noexcept;

// Same validation as the engine constructors.
RG_API std::unique_ptr<RateLimiter> make_rate_limiter(const LimiterConfig& cfg);

} // namespace rg
