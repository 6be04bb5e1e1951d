#pragma once
#include <memory>

#include "rateguard/rate_limiter.h"

namespace rg {

// Exact sliding window over bucket_count * bucket_ticks ticks, kept as a ring
// of per-bucket counters. Stale slots are cleared lazily the next time their
// index comes around.
class RG_API SlidingWindowCounter final : public RateLimiter {
public:
    struct Config {
        Uint capacity = 0;
        Uint bucket_ticks = 0;
        Uint bucket_count = 0;
    };

    // Throws std::invalid_argument if any parameter is zero. The bucket ring is
    // allocated here and never grows afterwards.
    SlidingWindowCounter(Uint capacity, Uint bucket_ticks, Uint bucket_count);
    explicit SlidingWindowCounter(const Config& cfg);
    ~SlidingWindowCounter();

    Outcome try_acquire(Uint tick, Uint units) noexcept override;
    Decision try_acquire_verbose(Uint tick, Uint units) noexcept override;
    Remaining capacity_remaining(Uint tick) noexcept override;
    Remaining current_capacity_at(Uint tick) noexcept override;
    Remaining current_capacity() noexcept override;
    Uint capacity() const noexcept override;

    const Config& config() const noexcept;
    Uint window_ticks() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rg
