#include <algorithm>
#include <string>

#include "rateguard/types.h"

namespace rg {

const char* to_string(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::kAllowed: return "allowed";
        case Outcome::kInsufficientCapacity: return "insufficient_capacity";
        case Outcome::kBeyondCapacity: return "beyond_capacity";
        case Outcome::kExpiredTick: return "expired_tick";
        case Outcome::kContentionFailure: return "contention_failure";
    }
    return "unknown";
}

// Works for both tick widths; std::to_string has no 128-bit overload.
std::string to_string(Uint value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string describe(const Decision& d) {
    switch (d.outcome) {
        case Outcome::kAllowed:
            return "allowed";
        case Outcome::kInsufficientCapacity:
            return "insufficient capacity: acquiring " + to_string(d.acquiring) +
                   ", available " + to_string(d.available) +
                   ", retry after " + to_string(d.retry_after_ticks) + " tick(s)";
        case Outcome::kBeyondCapacity:
            return "beyond capacity: acquiring " + to_string(d.acquiring) +
                   ", capacity " + to_string(d.capacity) + "; this request can never succeed";
        case Outcome::kExpiredTick:
            return "expired tick: minimum acceptable tick is " + to_string(d.min_acceptable_tick);
        case Outcome::kContentionFailure:
            return "contention failure: limiter busy, retry";
    }
    return "unknown";
}

} // namespace rg
