#include <exception>
#include <limits>
#include <vector>

#include "rateguard/rateguard_c.h"
#include "rateguard/factory.h"
#include "rateguard/version.h"

using rg::RateLimiter;

namespace {

// Clamp for 128-bit builds; the C surface is 64-bit.
uint64_t narrow(rg::Uint v) {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    return v > kMax ? kMax : static_cast<uint64_t>(v);
}

} // namespace

extern "C" RG_API const char* rg_version(void) {
    return RG_VERSION;
}

extern "C" RG_API void* rg_new(int algorithm, uint64_t capacity, uint64_t p1, uint64_t p2) {
    if (algorithm < RG_FIXED_WINDOW || algorithm > RG_APPROXIMATE_SLIDING_WINDOW) {
        return nullptr;
    }
    try {
        const auto alg = static_cast<rg::Algorithm>(algorithm);
        std::vector<rg::Uint> params{p1, p2};
        params.resize(rg::rate_param_count(alg));
        auto limiter = rg::make_rate_limiter(rg::make_limiter_config(alg, capacity, params));
        return static_cast<void*>(limiter.release());
    } catch (const std::exception&) {
        return nullptr;
    }
}

extern "C" RG_API int rg_try_acquire(void* handle, uint64_t tick, uint64_t units) {
    if (!handle) return RG_INVALID_HANDLE;
    auto* limiter = static_cast<RateLimiter*>(handle);
    return static_cast<int>(limiter->try_acquire(tick, units));
}

extern "C" RG_API rg_decision_t rg_try_acquire_verbose(void* handle, uint64_t tick, uint64_t units) {
    rg_decision_t out{};
    if (!handle) {
        out.outcome = RG_INVALID_HANDLE;
        return out;
    }
    auto* limiter = static_cast<RateLimiter*>(handle);
    rg::Decision d = limiter->try_acquire_verbose(tick, units);
    out.outcome = static_cast<int>(d.outcome);
    out.acquiring = narrow(d.acquiring);
    out.available = narrow(d.available);
    out.capacity = narrow(d.capacity);
    out.retry_after_ticks = narrow(d.retry_after_ticks);
    out.min_acceptable_tick = narrow(d.min_acceptable_tick);
    return out;
}

extern "C" RG_API int rg_capacity_remaining(void* handle, uint64_t tick, uint64_t* out_units) {
    if (!handle || !out_units) return RG_INVALID_HANDLE;
    auto* limiter = static_cast<RateLimiter*>(handle);
    rg::Remaining r = limiter->capacity_remaining(tick);
    *out_units = r.ok() ? narrow(r.units) : 0;
    return static_cast<int>(r.outcome);
}

extern "C" RG_API const char* rg_outcome_name(int outcome) {
    if (outcome == RG_INVALID_HANDLE) return "invalid_handle";
    if (outcome < RG_ALLOWED || outcome > RG_CONTENTION_FAILURE) return "unknown";
    return rg::to_string(static_cast<rg::Outcome>(outcome));
}

extern "C" RG_API void rg_free(void* handle) {
    delete static_cast<RateLimiter*>(handle);
}
