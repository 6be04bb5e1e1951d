#include <algorithm>
#include <cstddef>
#include <mutex>

#include "rateguard/approximate_sliding_window.h"
#include "rateguard/saturating.h"
#include "detail.h"

namespace rg {

namespace {

struct Windows {
    Uint counts[2] = {0, 0};
    Uint starts[2] = {0, 0};
    std::size_t current = 0;

    std::size_t other() const { return current ^ 1; }
    Uint newest_start() const { return std::max(starts[0], starts[1]); }
};

} // namespace

struct ApproximateSlidingWindow::Impl {
    const Config cfg;
    const Uint capacity_weight; // capacity * window_ticks
    std::mutex mtx;
    Windows state;

    explicit Impl(const Config& c)
        : cfg(c), capacity_weight(sat_mul(c.capacity, c.window_ticks)) {}

    // Points `w` at the window holding `tick`. Requires tick >= newest_start().
    void advance(Windows& w, Uint tick) const {
        const Uint start = align_down(tick, cfg.window_ticks);
        const std::size_t idx = static_cast<std::size_t>((tick / cfg.window_ticks) % 2);
        if (idx == w.current && w.starts[idx] == start) return;

        w.current = idx;
        if (w.starts[idx] == start) return;

        w.counts[idx] = 0;
        w.starts[idx] = start;
        const std::size_t other = w.other();
        if (start - w.starts[other] > cfg.window_ticks) {
            // More than one window behind: it no longer touches the view.
            w.counts[other] = 0;
            w.starts[other] = start - cfg.window_ticks;
        }
    }

    // Ticks of the other window that fall inside [tick - window + 1, tick].
    Uint overlap(const Windows& w, Uint tick) const {
        const Uint head = sat_sub(tick, cfg.window_ticks - 1);
        const Uint other_start = w.starts[w.other()];
        const Uint other_end = sat_add(other_start, cfg.window_ticks - 1);
        const Uint lo = std::max(head, other_start);
        const Uint hi = std::min(tick, other_end);
        return lo <= hi ? sat_add(hi - lo, 1) : Uint{0};
    }

    Uint weighted_usage(const Windows& w, Uint tick) const {
        const Uint current = sat_mul(w.counts[w.current], cfg.window_ticks);
        return sat_add(current, sat_mul(w.counts[w.other()], overlap(w, tick)));
    }

    Uint remaining(const Windows& w, Uint tick) const {
        return sat_sub(capacity_weight, weighted_usage(w, tick)) / cfg.window_ticks;
    }

    // Two ways to make room: wait for the other window to slide out of view,
    // or, when the current window alone is too full, wait for it to become the
    // other window and then slide out. The first is always the shorter wait.
    Uint retry_after(const Windows& w, Uint tick, Uint units) const {
        const Uint need = sat_mul(units, cfg.window_ticks);
        const Uint current = sat_mul(w.counts[w.current], cfg.window_ticks);
        const Uint other_count = w.counts[w.other()];

        Uint wait;
        if (other_count != 0 && sat_add(current, need) <= capacity_weight) {
            const Uint slack = sat_sub(sat_sub(capacity_weight, need), current);
            wait = sat_sub(overlap(w, tick), slack / other_count);
        } else {
            const Uint to_boundary =
                sat_sub(sat_add(w.starts[w.current], cfg.window_ticks), tick);
            Uint tail = 0;
            if (w.counts[w.current] != 0) {
                const Uint tolerated = sat_sub(capacity_weight, need) / w.counts[w.current];
                tail = sat_sub(cfg.window_ticks - 1, tolerated);
            }
            wait = sat_add(to_boundary, tail);
        }
        return std::max<Uint>(wait, 1);
    }

    Decision acquire(Uint tick, Uint units, bool verbose) {
        if (units == 0) return allowed();
        if (units > cfg.capacity) return beyond_capacity(units, cfg.capacity);

        std::unique_lock<std::mutex> lk(mtx, std::try_to_lock);
        if (!lk.owns_lock()) return contention_failure();
        if (tick < state.newest_start()) return expired_tick(state.newest_start());

        advance(state, tick);
        const Uint usage = weighted_usage(state, tick);
        if (usage <= sat_sub(capacity_weight, sat_mul(units, cfg.window_ticks))) {
            state.counts[state.current] += units;
            return allowed();
        }
        const Uint available = sat_sub(capacity_weight, usage) / cfg.window_ticks;
        return insufficient_capacity(units, available,
                                     verbose ? retry_after(state, tick, units) : 0);
    }
};

ApproximateSlidingWindow::ApproximateSlidingWindow(Uint capacity, Uint window_ticks)
    : ApproximateSlidingWindow(Config{capacity, window_ticks}) {}

ApproximateSlidingWindow::ApproximateSlidingWindow(const Config& cfg) {
    detail::require_positive(cfg.capacity, "capacity");
    detail::require_positive(cfg.window_ticks, "window_ticks");
    impl_ = std::make_unique<Impl>(cfg);
}

ApproximateSlidingWindow::~ApproximateSlidingWindow() = default;

Outcome ApproximateSlidingWindow::try_acquire(Uint tick, Uint units) noexcept {
    return detail::simple_outcome(impl_->acquire(tick, units, false));
}

Decision ApproximateSlidingWindow::try_acquire_verbose(Uint tick, Uint units) noexcept {
    return impl_->acquire(tick, units, true);
}

Remaining ApproximateSlidingWindow::capacity_remaining(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->state.newest_start()) return detail::remaining(Outcome::kExpiredTick);

    impl_->advance(impl_->state, tick);
    return detail::remaining(Outcome::kAllowed, impl_->remaining(impl_->state, tick));
}

Remaining ApproximateSlidingWindow::current_capacity_at(Uint tick) noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    if (tick < impl_->state.newest_start()) return detail::remaining(Outcome::kExpiredTick);

    Windows preview = impl_->state;
    impl_->advance(preview, tick);
    return detail::remaining(Outcome::kAllowed, impl_->remaining(preview, tick));
}

// Read at the last tick of the current window, where the previous window no
// longer overlaps.
Remaining ApproximateSlidingWindow::current_capacity() noexcept {
    std::unique_lock<std::mutex> lk(impl_->mtx, std::try_to_lock);
    if (!lk.owns_lock()) return detail::remaining(Outcome::kContentionFailure);
    const Windows& w = impl_->state;
    const Uint tick = sat_add(w.starts[w.current], impl_->cfg.window_ticks - 1);
    return detail::remaining(Outcome::kAllowed, impl_->remaining(w, tick));
}

Uint ApproximateSlidingWindow::capacity() const noexcept {
    return impl_->cfg.capacity;
}

const ApproximateSlidingWindow::Config& ApproximateSlidingWindow::config() const noexcept {
    return impl_->cfg;
}

} // namespace rg
