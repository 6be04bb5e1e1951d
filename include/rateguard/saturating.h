#pragma once
#include "rateguard/types.h"

namespace rg {

// Saturating arithmetic on Uint. Nothing in the limiters is allowed to wrap.

constexpr Uint sat_add(Uint a, Uint b) noexcept {
    return (a > kUintMax - b) ? kUintMax : a + b;
}

constexpr Uint sat_sub(Uint a, Uint b) noexcept {
    return (a > b) ? a - b : Uint{0};
}

constexpr Uint sat_mul(Uint a, Uint b) noexcept {
    if (a == 0 || b == 0) return 0;
    return (a > kUintMax / b) ? kUintMax : a * b;
}

// ceil(a / b), b != 0, without the a + b - 1 overflow.
constexpr Uint ceil_div(Uint a, Uint b) noexcept {
    return (a == 0) ? Uint{0} : (a - 1) / b + 1;
}

// Start of the aligned span of `width` ticks containing `tick`.
constexpr Uint align_down(Uint tick, Uint width) noexcept {
    return (tick / width) * width;
}

} // namespace rg
