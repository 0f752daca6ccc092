// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Process-wide runtime counters (atomics, no dynamic allocation). Exported by the
// Prometheus text endpoint (server/net/metrics_http) and the periodic runtime log line.
#pragma once
#include <atomic>
#include <cstdint>

namespace royale::metrics {

struct RuntimeCounters
{
    // Driver tick duration (time spent inside one phase handler iteration).
    std::atomic<uint64_t> tick_duration_ns_accum{0};
    std::atomic<uint64_t> tick_samples{0};
    // Power-of-two buckets (base 50k ns) -> up to ~25ms.
    static constexpr int TICK_BUCKETS = 10;
    static constexpr uint64_t TICK_BUCKET_BASE_NS = 50000;
    std::atomic<uint64_t> tick_hist[TICK_BUCKETS]{};

    // Match lifecycle
    std::atomic<uint64_t> phase_transitions{0};
    std::atomic<uint64_t> matches_started{0};
    std::atomic<uint64_t> matches_won{0};
    std::atomic<uint64_t> matches_timed_out{0};
    std::atomic<uint64_t> eliminations{0};
    std::atomic<uint64_t> handler_failures{0};
    std::atomic<uint64_t> collaborator_failures{0};
    std::atomic<uint64_t> mode_change_rejected{0};

    // Zone
    std::atomic<uint64_t> zone_steps{0};
    std::atomic<uint64_t> zone_damage_events{0};
    std::atomic<uint64_t> zone_damage_milli_total{0}; // damage * 1000, integer accumulation

    // Broadcast / network
    std::atomic<uint64_t> broadcasts_published{0};
    std::atomic<uint64_t> direct_messages{0};
    std::atomic<uint64_t> broadcast_failures{0};
    std::atomic<uint64_t> frames_rejected{0};

    // Gauges
    std::atomic<uint64_t> connected_players{0};
    std::atomic<uint64_t> alive_players{0};
    std::atomic<uint64_t> current_phase{0};
    std::atomic<uint64_t> zone_phase{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_tick_duration(uint64_t ns)
{
    auto &rt = runtime();
    rt.tick_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.tick_samples.fetch_add(1, std::memory_order_relaxed);
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        uint64_t bound = RuntimeCounters::TICK_BUCKET_BASE_NS << i;
        if (ns < bound) {
            rt.tick_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.tick_hist[RuntimeCounters::TICK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_tick_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.tick_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TICK_BUCKETS; ++i) {
        cumulative += rt.tick_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return RuntimeCounters::TICK_BUCKET_BASE_NS << i;
    }
    return RuntimeCounters::TICK_BUCKET_BASE_NS << (RuntimeCounters::TICK_BUCKETS - 1);
}

inline void add_zone_damage(float amount)
{
    auto &rt = runtime();
    rt.zone_damage_events.fetch_add(1, std::memory_order_relaxed);
    if (amount > 0.f)
        rt.zone_damage_milli_total.fetch_add(static_cast<uint64_t>(amount * 1000.f), std::memory_order_relaxed);
}

// Saturating decrement for gauges fed from several call sites.
inline void gauge_dec(std::atomic<uint64_t> &g)
{
    uint64_t cur = g.load(std::memory_order_relaxed);
    while (cur > 0 && !g.compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {
        // retry
    }
}

} // namespace royale::metrics
