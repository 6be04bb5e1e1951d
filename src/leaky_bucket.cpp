#include <algorithm>
#include <mutex>

#include "rateguard/leaky_bucket.h"
#include "rateguard/saturating.h"
#include "detail.h"

namespace rg {

namespace {

struct Level {
    Uint level;
    Uint last_leak_tick;
};

} // namespace

struct LeakyBucket::Impl {
    const Config cfg;
    std::mutex mtx;
    Uint level = 0;          // bucket starts empty
    Uint last_leak_tick = 0; // always a whole number of intervals from 0

    explicit Impl(const Config& c) : cfg(c) {}

    // Level after draining every whole interval up to `tick`. The leak clock
    // keeps its phase: it moves by whole intervals, never to `tick` itself.
    Level leak_at(Uint tick) const {
        const Uint intervals = (tick - last_leak_tick) / cfg.leak_interval;
        if (intervals == 0) return Level{level, last_leak_tick};
        return Level{sat_sub(level, sat_mul(intervals, cfg.leak_amount)),
                     last_leak_tick + intervals * cfg.leak_interval};
    }

    void leak(Uint tick) {
        Level l = leak_at(tick);
        level = l.level;
        last_leak_tick = l.last_leak_tick;
    }

    Uint retry_after(Uint tick, Uint units, Uint room) const {
        const Uint intervals = ceil_div(units - room, cfg.leak_amount);
        const Uint into_interval = tick - last_leak_tick;
        return std::max<Uint>(sat_sub(sat_mul(intervals, cfg.leak_interval), into_interval), 1);
    }

    Decision acquire(Uint tick, Uint units, bool verbose) {
        if (units == 0) return allowed();
        if (units > cfg.capacity) return beyond_capacity(units, cfg.capacity);

        std::unique_lock<std::mutex> lk(mtx, std::try_to_lock);
        if (!lk.owns_lock()) return contention_failure();
        if (tick < last_leak_tick) return expired_tick(last_leak_tick);

        leak(tick);
        const Uint room = cfg.capacity - level;
        if (units <= room) {
            level += units;
            return allowed();
        }
        return insufficient_capacity(units, room, verbose ? retry_after(tick, units, room) : 0);
    }
};

LeakyBucket::LeakyBucket(Uint capacity, Uint leak_interval, Uint leak_amount)
    : LeakyBucket(Config{capacity, leak_interval, leak_amount}) {}

LeakyBucket::LeakyBucket(const Config& cfg) {
    detail::require_positive(cfg.capacity, "capacity");
    detail::require_positive(cfg.leak_interval, "leak_interval");
    detail::require_positive(cfg.leak_amount, "leak_amount");
    impl_ = std::make_unique<Impl>(cfg);
}

LeakyBucket::~LeakyBucket() = default;

Outcome LeakyBucket::try_acquire(Uint tick, Uint units) noexcept {
    return detail::simple_outcome(impl_->acquire(tick, units, false));
}

Decision LeakyBucket::try_acquire_verbose(Uint tick, Uint units) noexcept {
    return impl_->acquire(tick, units, true);
}

Remaining LeakyBucket::capacity_remaining(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->last_leak_tick) return detail::remaining(Outcome::kExpiredTick);

    impl_->leak(tick);
    return detail::remaining(Outcome::kAllowed, impl_->cfg.capacity - impl_->level);
}

Remaining LeakyBucket::current_capacity_at(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->last_leak_tick) return detail::remaining(Outcome::kExpiredTick);

    return detail::remaining(Outcome::kAllowed, impl_->cfg.capacity - impl_->leak_at(tick).level);
}

Remaining LeakyBucket::current_capacity() noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    return detail::remaining(Outcome::kAllowed, impl_->cfg.capacity - impl_->level);
}

Uint LeakyBucket::capacity() const noexcept {
    return impl_->cfg.capacity;
}

const LeakyBucket::Config& LeakyBucket::config() const noexcept {
    return impl_->cfg;
}

} // namespace rg
