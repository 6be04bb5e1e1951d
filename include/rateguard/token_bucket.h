#pragma once
#include <memory>

#include "rateguard/rate_limiter.h"

namespace rg {

// Starts full. Every full refill_interval adds refill_amount tokens, capped at
// capacity; admitted units are taken out of the bucket.
class RG_API TokenBucket final : public RateLimiter {
public:
    struct Config {
        Uint capacity = 0;
        Uint refill_interval = 0;
        Uint refill_amount = 0;
    };

    // Throws std::invalid_argument if any parameter is zero.
    TokenBucket(Uint capacity, Uint refill_interval, Uint refill_amount);
    explicit TokenBucket(const Config& cfg);
    ~TokenBucket();

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
