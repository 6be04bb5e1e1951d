#include <algorithm>
#include <cstddef>
#include <limits>
#include <mutex>
#include <vector>

#include "rateguard/sliding_window_counter.h"
#include "rateguard/saturating.h"
#include "detail.h"

namespace rg {

struct SlidingWindowCounter::Impl {
    const Config cfg;
    const Uint window; // bucket_ticks * bucket_count, saturated
    const std::size_t n;
    std::mutex mtx;
    std::vector<Uint> buckets;
    std::vector<Uint> starts; // aligned start each slot was last stamped with
    std::size_t last_index = 0;

    explicit Impl(const Config& c)
        : cfg(c),
          window(sat_mul(c.bucket_ticks, c.bucket_count)),
          n(static_cast<std::size_t>(c.bucket_count)),
          buckets(n, 0),
          starts(n, 0) {}

    std::size_t slot_of(Uint tick) const {
        return static_cast<std::size_t>((tick / cfg.bucket_ticks) % cfg.bucket_count);
    }

    Uint oldest_live_start(Uint tick) const {
        return sat_sub(tick, window - 1);
    }

    bool live(std::size_t i, Uint head, Uint tick) const {
        return starts[i] >= head && starts[i] <= tick;
    }

    // Lazy reset of the slot owning `tick`.
    std::size_t touch(Uint tick) {
        const std::size_t idx = slot_of(tick);
        const Uint start = align_down(tick, cfg.bucket_ticks);
        if (starts[idx] != start) {
            buckets[idx] = 0;
            starts[idx] = start;
        }
        last_index = idx;
        return idx;
    }

    // A slot that still needs its lazy reset is never inside the window, so
    // this is exact with or without touch() having run.
    Uint used(Uint tick) const {
        const Uint head = oldest_live_start(tick);
        Uint total = 0;
        for (std::size_t i = 0; i < n; ++i) {
            if (live(i, head, tick)) total = sat_add(total, buckets[i]);
        }
        return total;
    }

    // Walks the live buckets oldest first; slots after `current` in ring order
    // hold the oldest starts. A bucket stops counting at start + window.
    Uint retry_after(Uint tick, Uint units, Uint available, std::size_t current) const {
        const Uint head = oldest_live_start(tick);
        Uint freed = available;
        for (std::size_t step = 1; step <= n; ++step) {
            const std::size_t i = (current + step) % n;
            if (!live(i, head, tick)) continue;
            freed = sat_add(freed, buckets[i]);
            if (freed >= units) {
                return std::max<Uint>(sat_sub(sat_add(starts[i], window), tick), 1);
            }
        }
        return window;
    }

    Uint min_acceptable_tick() const {
        return starts[last_index];
    }

    Decision acquire(Uint tick, Uint units, bool verbose) {
        if (units == 0) return allowed();
        if (units > cfg.capacity) return beyond_capacity(units, cfg.capacity);

        std::unique_lock<std::mutex> lk(mtx, std::try_to_lock);
        if (!lk.owns_lock()) return contention_failure();
        if (tick < min_acceptable_tick()) return expired_tick(min_acceptable_tick());

        const std::size_t idx = touch(tick);
        const Uint available = sat_sub(cfg.capacity, used(tick));
        if (units <= available) {
            buckets[idx] += units;
            return allowed();
        }
        return insufficient_capacity(units, available,
                                     verbose ? retry_after(tick, units, available, idx) : 0);
    }
};

SlidingWindowCounter::SlidingWindowCounter(Uint capacity, Uint bucket_ticks, Uint bucket_count)
    : SlidingWindowCounter(Config{capacity, bucket_ticks, bucket_count}) {}

SlidingWindowCounter::SlidingWindowCounter(const Config& cfg) {
    detail::require_positive(cfg.capacity, "capacity");
    detail::require_positive(cfg.bucket_ticks, "bucket_ticks");
    detail::require_positive(cfg.bucket_count, "bucket_count");
    if (cfg.bucket_count > std::numeric_limits<std::size_t>::max()) {
        throw std::invalid_argument("bucket_count does not fit in memory");
    }
    impl_ = std::make_unique<Impl>(cfg);
}

SlidingWindowCounter::~SlidingWindowCounter() = default;

Outcome SlidingWindowCounter::try_acquire(Uint tick, Uint units) noexcept {
    return detail::simple_outcome(impl_->acquire(tick, units, false));
}

Decision SlidingWindowCounter::try_acquire_verbose(Uint tick, Uint units) noexcept {
    return impl_->acquire(tick, units, true);
}

Remaining SlidingWindowCounter::capacity_remaining(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->min_acceptable_tick()) return detail::remaining(Outcome::kExpiredTick);

    impl_->touch(tick);
    return detail::remaining(Outcome::kAllowed, sat_sub(impl_->cfg.capacity, impl_->used(tick)));
}

Remaining SlidingWindowCounter::current_capacity_at(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->min_acceptable_tick()) return detail::remaining(Outcome::kExpiredTick);

    return detail::remaining(Outcome::kAllowed, sat_sub(impl_->cfg.capacity, impl_->used(tick)));
}

// Read at the last tick of the newest bucket, which covers exactly the ring.
Remaining SlidingWindowCounter::current_capacity() noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    const Uint tick = sat_add(impl_->min_acceptable_tick(), impl_->cfg.bucket_ticks - 1);
    return detail::remaining(Outcome::kAllowed, sat_sub(impl_->cfg.capacity, impl_->used(tick)));
}

Uint SlidingWindowCounter::capacity() const noexcept {
    return impl_->cfg.capacity;
}

Uint SlidingWindowCounter::window_ticks() const noexcept {
    return impl_->window;
}

const SlidingWindowCounter::Config& SlidingWindowCounter::config() const noexcept {
    return impl_->cfg;
}

} // namespace rg
