// SPDX-License-Identifier: Apache-2.0
// metric_sampler.hpp
// One performance sample per tick: log-derived tps / view radius plus process CPU and memory.
#pragma once

#include "common/time_util.hpp"
#include "worker/model.hpp"
#include "worker/probe/process_probe.hpp"
#include "worker/source/log_source.hpp"
#include "worker/store/store.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace hdw::sampler {

struct SamplerConfig
{
    size_t scan_lines{200}; // newest lines rescanned every tick
    std::chrono::seconds query_timeout{10};
};

class MetricSampler
{
public:
    MetricSampler(
        store::Store &store,
        source::ILogSource &logs,
        probe::IPidResolver &resolver,
        probe::IResourceProbe &probe,
        SamplerConfig cfg,
        timeutil::now_fn now);

    // Builds and inserts one sample. Returns nullopt when the log query failed (tick skipped).
    std::optional<PerformanceSample> sample_tick();

    // Builds a sample without touching storage except for the online player count.
    std::optional<PerformanceSample> collect();

private:
    store::Store &m_store;
    source::ILogSource &m_logs;
    probe::IPidResolver &m_resolver;
    probe::IResourceProbe &m_probe;
    SamplerConfig m_cfg;
    timeutil::now_fn m_now;
};

} // namespace hdw::sampler
