#pragma once
#include <stdexcept>
#include <string>

#include "rateguard/types.h"

namespace rg {
namespace detail {

inline Uint require_positive(Uint value, const char* name) {
    if (value == 0) {
        throw std::invalid_argument(std::string(name) + " must be greater than 0");
    }
    return value;
}

// The fast path has no permanent-failure code of its own.
inline Outcome simple_outcome(const Decision& d) noexcept {
    return d.outcome == Outcome::kBeyondCapacity ? Outcome::kInsufficientCapacity : d.outcome;
}

inline Remaining remaining(Outcome outcome, Uint units = 0) noexcept {
    return Remaining{outcome, units};
}

} // namespace detail
} // namespace rg
