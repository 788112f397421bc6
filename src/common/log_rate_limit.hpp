// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <cstdint>

// Per-callsite rate-limited logging. Emits the first occurrence and then every Nth one.
// Usage: HDW_LOG_EVERY_N(warn, 12, "[perf] process for unit {} not found", unit);
// The sampler runs every few seconds; a stopped game server would otherwise produce the same
// warning on every tick.
#define HDW_LOG_EVERY_N(level, N, ...) \
    do { \
        static uint64_t _hdw_log_counter_##__LINE__ = 0; \
        if ((_hdw_log_counter_##__LINE__++ % (N)) == 0) { \
            hdw::log::level(__VA_ARGS__); \
        } \
    } while (0)
