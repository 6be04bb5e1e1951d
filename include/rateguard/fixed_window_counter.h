#pragma once
#include <memory>

#include "rateguard/rate_limiter.h"

namespace rg {

// Counts units per aligned window [k*window_ticks, (k+1)*window_ticks) and
// resets the count when a tick lands in a later window. A full burst at the
// end of one window followed by another at the start of the next is allowed.
class RG_API FixedWindowCounter final : public RateLimiter {
public:
    struct Config {
        Uint capacity = 0;
        Uint window_ticks = 0;
    };

    // Throws std::invalid_argument if any parameter is zero.
    FixedWindowCounter(Uint capacity, Uint window_ticks);
    explicit FixedWindowCounter(const Config& cfg);
    ~FixedWindowCounter();

    Outcome try_acquire(Uint tick, Uint units) noexcept override;
    Decision try_acquire_verbose(Uint tick, Uint units) noexcept override;
    Remaining capacity_remaining(Uint tick) noexcept override;
    Remaining current_capacity_at(Uint tick) noexcept override;
    Remaining current_capacity() noexcept override;
    Uint capacity() const noexcept override;

    const Config& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rg
