// SPDX-License-Identifier: Apache-2.0
// metrics.hpp
// Worker counters (atomics, no dynamic allocation). Written by the control loop, read by the
// metrics endpoint and the periodic summary line.
#pragma once
#include <atomic>
#include <cstdint>

namespace hdw::metrics {

struct TaskCounters
{
    std::atomic<uint64_t> runs{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> duration_ns_accum{0};
    std::atomic<uint64_t> last_duration_ns{0};
};

struct RuntimeCounters
{
    TaskCounters perf;
    TaskCounters ingest;
    TaskCounters cleanup;
    // Power-of-two buckets for task durations (base 1ms) -> up to ~8s; last bucket is overflow.
    static constexpr int TASK_BUCKETS = 14;
    std::atomic<uint64_t> task_hist[TASK_BUCKETS]{};
    std::atomic<uint64_t> task_samples{0};
    std::atomic<uint64_t> task_duration_ns_accum{0};
    // Ingestion
    std::atomic<uint64_t> events_extracted{0};
    std::atomic<uint64_t> events_merged{0};
    std::atomic<uint64_t> events_new{0};
    std::atomic<uint64_t> checkpoint_advances{0};
    std::atomic<uint64_t> query_failures{0};
    std::atomic<uint64_t> backfill_players{0};
    // Sampling
    std::atomic<uint64_t> samples_written{0};
    std::atomic<uint64_t> probe_misses{0};
    std::atomic<uint64_t> players_online{0};
    // Retention
    std::atomic<uint64_t> samples_pruned{0};
    std::atomic<uint64_t> events_pruned{0};
    std::atomic<uint64_t> compactions{0};
    // Storage: history rows dropped by the one-time dedupe migration
    std::atomic<uint64_t> events_deduplicated{0};
};

inline RuntimeCounters &runtime()
{
    static RuntimeCounters inst;
    return inst;
}

inline void add_task_duration(TaskCounters &task, uint64_t ns)
{
    auto &rt = runtime();
    task.duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    task.last_duration_ns.store(ns, std::memory_order_relaxed);
    rt.task_duration_ns_accum.fetch_add(ns, std::memory_order_relaxed);
    rt.task_samples.fetch_add(1, std::memory_order_relaxed);
    constexpr uint64_t base = 1000000; // 1ms
    for (int i = 0; i < RuntimeCounters::TASK_BUCKETS - 1; ++i) {
        if (ns < (base << i)) {
            rt.task_hist[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    rt.task_hist[RuntimeCounters::TASK_BUCKETS - 1].fetch_add(1, std::memory_order_relaxed);
}

inline uint64_t approx_task_p99()
{
    auto &rt = runtime();
    uint64_t total = rt.task_samples.load(std::memory_order_relaxed);
    if (total == 0)
        return 0;
    uint64_t target = (total * 99 + 99 - 1) / 100; // ceil(total*0.99)
    constexpr uint64_t base = 1000000;
    uint64_t cumulative = 0;
    for (int i = 0; i < RuntimeCounters::TASK_BUCKETS; ++i) {
        cumulative += rt.task_hist[i].load(std::memory_order_relaxed);
        if (cumulative >= target)
            return (base << i);
    }
    return (base << (RuntimeCounters::TASK_BUCKETS - 1));
}

} // namespace hdw::metrics
