#pragma once
#include <memory>

#include "rateguard/rate_limiter.h"

namespace rg {

// Sliding window approximated with two alternating fixed windows.
//
// The window holding `tick` counts in full; the previous one counts in
// proportion to how many of its ticks still fall inside
// [tick - window_ticks + 1, tick]. Everything is compared in units*ticks so no
// division is needed on the admission path.
class RG_API ApproximateSlidingWindow final : public RateLimiter {
public:
    struct Config {
        Uint capacity = 0;
        Uint window_ticks = 0;
    };

    // Throws std::invalid_argument if any parameter is zero.
    ApproximateSlidingWindow(Uint capacity, Uint window_ticks);
    explicit ApproximateSlidingWindow(const Config& cfg);
    ~ApproximateSlidingWindow();

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
