#include <algorithm>
#include <mutex>

#include "rateguard/token_bucket.h"
#include "rateguard/saturating.h"
#include "detail.h"

namespace rg {

struct TokenBucket::Impl {
    const Config cfg;
    std::mutex mtx;
    Uint available;
    Uint last_refill_tick = 0;

    explicit Impl(const Config& c) : cfg(c), available(c.capacity) {}

    // Tokens after every whole interval up to `tick` has been credited.
    Uint available_at(Uint tick, Uint* refill_tick) const {
        const Uint intervals = (tick - last_refill_tick) / cfg.refill_interval;
        if (refill_tick) *refill_tick = last_refill_tick + intervals * cfg.refill_interval;
        if (intervals == 0) return available;
        return std::min(sat_add(available, sat_mul(intervals, cfg.refill_amount)), cfg.capacity);
    }

    void refill(Uint tick) {
        available = available_at(tick, &last_refill_tick);
    }

    Decision acquire(Uint tick, Uint units, bool verbose) {
        if (units == 0) return allowed();
        if (units > cfg.capacity) return beyond_capacity(units, cfg.capacity);

        std::unique_lock<std::mutex> lk(mtx, std::try_to_lock);
        if (!lk.owns_lock()) return contention_failure();
        if (tick < last_refill_tick) return expired_tick(last_refill_tick);

        refill(tick);
        if (units <= available) {
            available -= units;
            return allowed();
        }
        Uint retry = 0;
        if (verbose) {
            const Uint intervals = ceil_div(units - available, cfg.refill_amount);
            retry = std::max<Uint>(
                sat_sub(sat_mul(intervals, cfg.refill_interval), tick - last_refill_tick), 1);
        }
        return insufficient_capacity(units, available, retry);
    }
};

TokenBucket::TokenBucket(Uint capacity, Uint refill_interval, Uint refill_amount)
    : TokenBucket(Config{capacity, refill_interval, refill_amount}) {}

TokenBucket::TokenBucket(const Config& cfg) {
    detail::require_positive(cfg.capacity, "capacity");
    detail::require_positive(cfg.refill_interval, "refill_interval");
    detail::require_positive(cfg.refill_amount, "refill_amount");
    impl_ = std::make_unique<Impl>(cfg);
}

TokenBucket::~TokenBucket() = default;

Outcome TokenBucket::try_acquire(Uint tick, Uint units) noexcept {
    return detail::simple_outcome(impl_->acquire(tick, units, false));
}

Decision TokenBucket::try_acquire_verbose(Uint tick, Uint units) noexcept {
    return impl_->acquire(tick, units, true);
}

Remaining TokenBucket::capacity_remaining(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->last_refill_tick) return detail::remaining(Outcome::kExpiredTick);

    impl_->refill(tick);
    return detail::remaining(Outcome::kAllowed, impl_->available);
}

Remaining TokenBucket::current_capacity_at(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->last_refill_tick) return detail::remaining(Outcome::kExpiredTick);

    return detail::remaining(Outcome::kAllowed, impl_->available_at(tick, nullptr));
}

Remaining TokenBucket::current_capacity() noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    return detail::remaining(Outcome::kAllowed, impl_->available);
}

Uint TokenBucket::capacity() const noexcept {
    return impl_->cfg.capacity;
}

const TokenBucket::Config& TokenBucket::config() const noexcept {
    return impl_->cfg;
}

} // namespace rg
