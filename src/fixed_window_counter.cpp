#include <algorithm>
#include <mutex>

#include "rateguard/fixed_window_counter.h"
#include "rateguard/saturating.h"
#include "detail.h"

namespace rg {

struct FixedWindowCounter::Impl {
    const Config cfg;
    std::mutex mtx;
    Uint count = 0;
    Uint window_start = 0;

    explicit Impl(const Config& c) : cfg(c) {}

    // Count that would apply at `tick`; a later window starts from zero.
    Uint count_at(Uint tick) const {
        return align_down(tick, cfg.window_ticks) == window_start ? count : Uint{0};
    }

    void roll(Uint tick) {
        Uint start = align_down(tick, cfg.window_ticks);
        if (start != window_start) {
            count = 0;
            window_start = start;
        }
    }

    Decision acquire(Uint tick, Uint units, bool verbose) {
        if (units == 0) return allowed();
        if (units > cfg.capacity) return beyond_capacity(units, cfg.capacity);

        std::unique_lock<std::mutex> lk(mtx, std::try_to_lock);
        if (!lk.owns_lock()) return contention_failure();
        if (tick < window_start) return expired_tick(window_start);

        roll(tick);
        const Uint room = cfg.capacity - count;
        if (units <= room) {
            count += units;
            return allowed();
        }
        Uint retry = 0;
        if (verbose) {
            // Nothing frees up before the next window opens.
            retry = std::max<Uint>(sat_sub(sat_add(window_start, cfg.window_ticks), tick), 1);
        }
        return insufficient_capacity(units, room, retry);
    }
};

FixedWindowCounter::FixedWindowCounter(Uint capacity, Uint window_ticks)
    : FixedWindowCounter(Config{capacity, window_ticks}) {}

FixedWindowCounter::FixedWindowCounter(const Config& cfg) {
    detail::require_positive(cfg.capacity, "capacity");
    detail::require_positive(cfg.window_ticks, "window_ticks");
    impl_ = std::make_unique<Impl>(cfg);
}

FixedWindowCounter::~FixedWindowCounter() = default;

Outcome FixedWindowCounter::try_acquire(Uint tick, Uint units) noexcept {
    return detail::simple_outcome(impl_->acquire(tick, units, false));
}

Decision FixedWindowCounter::try_acquire_verbose(Uint tick, Uint units) noexcept {
    return impl_->acquire(tick, units, true);
}

Remaining FixedWindowCounter::capacity_remaining(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->window_start) return detail::remaining(Outcome::kExpiredTick);

    impl_->roll(tick);
    return detail::remaining(Outcome::kAllowed, impl_->cfg.capacity - impl_->count);
}

Remaining FixedWindowCounter::current_capacity_at(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->window_start) return detail::remaining(Outcome::kExpiredTick);

    return detail::remaining(Outcome::kAllowed, impl_->cfg.capacity - impl_->count_at(tick));
}

Remaining FixedWindowCounter::current_capacity() noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    return detail::remaining(Outcome::kAllowed, impl_->cfg.capacity - impl_->count);
}

Uint FixedWindowCounter::capacity() const noexcept {
    return impl_->cfg.capacity;
}

const FixedWindowCounter::Config& FixedWindowCounter::config() const noexcept {
    return impl_->cfg;
}

} // namespace rg
