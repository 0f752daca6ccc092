// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "common/logger.hpp"

#include <atomic>
#include <cstdint>

// Per-callsite rate-limited logging: emits every Nth invocation at the given level.
// Usage: ROYALE_LOG_EVERY_N(trace, 20, "[zone] radius={}", r);
// The zone interpolation step runs at ~20 Hz per active match; logging every sample would
// dominate the log volume at trace level.
#define ROYALE_LOG_CONCAT_INNER(a, b) a##b
#define ROYALE_LOG_CONCAT(a, b) ROYALE_LOG_CONCAT_INNER(a, b)
#define ROYALE_LOG_EVERY_N(level, N, ...) \
    do { \
        static std::atomic<uint64_t> ROYALE_LOG_CONCAT(_royale_log_counter_, __LINE__){0}; \
        if ((ROYALE_LOG_CONCAT(_royale_log_counter_, __LINE__).fetch_add(1, std::memory_order_relaxed) + 1) % (N) \
            == 0) { \
            royale::log::level(__VA_ARGS__); \
        } \
    } while (0)
