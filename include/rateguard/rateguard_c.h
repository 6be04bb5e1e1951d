/* include/rateguard/rateguard_c.h */
#pragma once
#include <stdint.h>

#include "rateguard/export.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Values match rg::Algorithm. */
typedef enum rg_algorithm_t {
    RG_FIXED_WINDOW = 0,
    RG_LEAKY_BUCKET = 1,
    RG_TOKEN_BUCKET = 2,
    RG_SLIDING_WINDOW = 3,
    RG_APPROXIMATE_SLIDING_WINDOW = 4
} rg_algorithm_t;

/* Values match rg::Outcome. */
typedef enum rg_outcome_t {
    RG_ALLOWED = 0,
    RG_INSUFFICIENT_CAPACITY = 1,
    RG_BEYOND_CAPACITY = 2,
    RG_EXPIRED_TICK = 3,
    RG_CONTENTION_FAILURE = 4,
    RG_INVALID_HANDLE = 255
} rg_outcome_t;

typedef struct rg_decision_t {
    int outcome;
    uint64_t acquiring;
    uint64_t available;
    uint64_t capacity;
    uint64_t retry_after_ticks;
    uint64_t min_acceptable_tick;
} rg_decision_t;

RG_API const char* rg_version(void);

/* p2 is ignored by fixed_window and approximate_sliding_window.
   Returns NULL on an unknown algorithm or a zero parameter. */
RG_API void* rg_new(int algorithm, uint64_t capacity, uint64_t p1, uint64_t p2);

RG_API int rg_try_acquire(void* handle, uint64_t tick, uint64_t units);
RG_API rg_decision_t rg_try_acquire_verbose(void* handle, uint64_t tick, uint64_t units);
RG_API int rg_capacity_remaining(void* handle, uint64_t tick, uint64_t* out_units);
RG_API const char* rg_outcome_name(int outcome);

RG_API void rg_free(void* handle);

#ifdef __cplusplus
}
#endif
