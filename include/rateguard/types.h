#pragma once
#include <cstdint>
#include <string>

#include "rateguard/export.h"

namespace rg {

// Tick and unit counter. Width is picked once for the whole build by the
// RATEGUARD_WIDE_TICKS CMake option.
#if defined(RG_WIDE_TICKS)
using Uint = unsigned __int128;
#else
using Uint = std::uint64_t;
#endif

constexpr Uint kUintMax = static_cast<Uint>(~Uint{0});

enum class Outcome : std::uint8_t {
    kAllowed = 0,
    kInsufficientCapacity = 1, // may succeed later
    kBeyondCapacity = 2,       // can never succeed against this limiter
    kExpiredTick = 3,          // tick older than the limiter's retained state
    kContentionFailure = 4,    // lock was busy, nothing was decided
};

// Result of try_acquire_verbose. Only the fields relevant to `outcome` are set,
// the rest stay zero.
struct Decision {
    Outcome outcome = Outcome::kAllowed;
    Uint acquiring = 0;
    Uint available = 0;
    Uint capacity = 0;
    Uint retry_after_ticks = 0;   // estimate, not a guarantee
    Uint min_acceptable_tick = 0;

    bool allowed() const noexcept { return outcome == Outcome::kAllowed; }
};

// Result of capacity_remaining / current_capacity_at.
struct Remaining {
    Outcome outcome = Outcome::kAllowed;
    Uint units = 0;

    bool ok() const noexcept { return outcome == Outcome::kAllowed; }
};

inline Decision allowed() noexcept { return Decision{}; }

inline Decision insufficient_capacity(Uint acquiring, Uint available, Uint retry_after_ticks) noexcept {
    Decision d;
    d.outcome = Outcome::kInsufficientCapacity;
    d.acquiring = acquiring;
    d.available = available;
    d.retry_after_ticks = retry_after_ticks;
    return d;
}

inline Decision beyond_capacity(Uint acquiring, Uint capacity) noexcept {
    Decision d;
    d.outcome = Outcome::kBeyondCapacity;
    d.acquiring = acquiring;
    d.capacity = capacity;
    return d;
}

inline Decision expired_tick(Uint min_acceptable_tick) noexcept {
    Decision d;
    d.outcome = Outcome::kExpiredTick;
    d.min_acceptable_tick = min_acceptable_tick;
    return d;
}

inline Decision contention_failure() noexcept {
    Decision d;
    d.outcome = Outcome::kContentionFailure;
    return d;
}

RG_API const char* to_string(Outcome outcome) noexcept;
RG_API std::string to_string(Uint value);
RG_API std::string describe(const Decision& d);

} // namespace rg
