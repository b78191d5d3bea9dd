#pragma once

#include <stdint.h>

/** @file fortune/engine/config.hpp
 *  @brief Defines global constants that determine wheel behavior
 */
#define FORTUNE_ENGINE_VERSION                              1

/**
 *  The prefix prepended to the string representation of
 *  participant addresses.
 */
#define FORTUNE_ADDRESS_PREFIX                              "FTN"

/**
 *  Bounds on the number of entries a wheel may be configured with,
 *  checked at creation and whenever the entries are replaced.  Draws
 *  shrink the entry list below the minimum without violating this.
 */
#define FORTUNE_MIN_ENTRIES                                 2
#define FORTUNE_MAX_ENTRIES                                 200

#define FORTUNE_DEFAULT_CLAIM_WINDOW_MS                     uint64_t(24*60*60*1000) // 24 hours
#define FORTUNE_MIN_CLAIM_WINDOW_MS                         uint64_t(60*60*1000)    // 1 hour

/**
 *  Upper bound on the delay and the claim window.  Keeps
 *  spin_time + delay + window representable as an fc::time_point.
 */
#define FORTUNE_MAX_TIMING_MS                               (uint64_t(100)*365*24*60*60*1000) // 100 years

#define FORTUNE_DEFAULT_ASSET_ID                            asset_id_type(0)
