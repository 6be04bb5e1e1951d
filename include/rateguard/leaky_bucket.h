#pragma once
#include <memory>

#include "rateguard/rate_limiter.h"

namespace rg {

// Starts empty. Each admitted unit raises the level; every full leak_interval
// since the last leak lowers it by leak_amount. Partial intervals do not leak.
class RG_API LeakyBucket final : public RateLimiter {
public:
    struct Config {
        Uint capacity = 0;
        Uint leak_interval = 0;
        Uint leak_amount = 0;
    };

    // Throws std::invalid_argument if any parameter is zero.
    LeakyBucket(Uint capacity, Uint leak_interval, Uint leak_amount);
    explicit LeakyBucket(const Config& cfg);
    ~LeakyBucket();

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
