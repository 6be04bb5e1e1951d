#pragma once
#include "rateguard/export.h"
#include "types.h"

namespace rg {

// Common interface of the tick-driven limiters.
//
// Ticks come from the caller and must not go backwards. No call ever waits for
// the internal lock: a busy lock is reported as Outcome::kContentionFailure and
// the caller decides whether to retry.
class RG_API RateLimiter {
public:
    virtual ~RateLimiter() = default;

    // Fast path. Requests larger than capacity report kInsufficientCapacity.
    virtual Outcome try_acquire(Uint tick, Uint units) noexcept = 0;

    // Same decision as try_acquire, with the diagnostic payload filled in.
    virtual Decision try_acquire_verbose(Uint tick, Uint units) noexcept = 0;

    // Units that could be admitted at `tick`. Advances the limiter to `tick`
    // the same way an acquire would.
    virtual Remaining capacity_remaining(Uint tick) noexcept = 0;

    // Like capacity_remaining but leaves the stored state untouched.
    virtual Remaining current_capacity_at(Uint tick) noexcept = 0;

    // Units left as of the newest tick the limiter has processed, without
    // moving it forward.
    virtual Remaining current_capacity() noexcept = 0;

    virtual Uint capacity() const noexcept = 0;

    Uint capacity_remaining_or_0(Uint tick) noexcept {
        Remaining r = capacity_remaining(tick);
        return r.ok() ? r.units : 0;
    }

    Uint current_capacity_or_0() noexcept {
        Remaining r = current_capacity();
        return r.ok() ? r.units : 0;
    }
};

} // namespace rg
