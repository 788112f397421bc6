// SPDX-License-Identifier: Apache-2.0
#include "worker/sampler/metric_sampler.hpp"

#include "common/log_rate_limit.hpp"
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "worker/extract/event_extractor.hpp"

namespace hdw::sampler {

MetricSampler::MetricSampler(
    store::Store &store,
    source::ILogSource &logs,
    probe::IPidResolver &resolver,
    probe::IResourceProbe &probe,
    SamplerConfig cfg,
    timeutil::now_fn now)
    : m_store(store), m_logs(logs), m_resolver(resolver), m_probe(probe), m_cfg(cfg), m_now(std::move(now))
{}

std::optional<PerformanceSample> MetricSampler::collect()
{
    auto &rt = metrics::runtime();
    std::vector<std::string> lines;
    try {
        lines = m_logs.query(source::LogQuery::tail(m_cfg.scan_lines, m_cfg.query_timeout));
    } catch (const source::QueryError &ex) {
        rt.query_failures.fetch_add(1, std::memory_order_relaxed);
        log::warn("[perf] log query failed, tick skipped: {}", ex.what());
        return std::nullopt;
    }

    const auto now = m_now();
    PerformanceSample s;
    s.timestamp = timeutil::format_iso8601_utc(now);
    s.ts_epoch = timeutil::to_epoch_seconds(now);

    auto readings = extract::scan_metrics(lines);
    s.tps = readings.tps;
    s.view_radius = readings.view_radius;

    if (auto pid = m_resolver.resolve()) {
        if (auto usage = m_probe.sample(*pid)) {
            s.cpu_percent = usage->cpu_percent;
            s.ram_percent = usage->ram_percent;
            s.ram_mb = (double)usage->ram_kb / 1024.0;
        } else {
            rt.probe_misses.fetch_add(1, std::memory_order_relaxed);
            log::debug("[perf] pid {} vanished before sampling", *pid);
        }
    } else {
        rt.probe_misses.fetch_add(1, std::memory_order_relaxed);
        HDW_LOG_EVERY_N(warn, 60, "[perf] game server process not found; resource fields left empty");
    }

    s.players_online = m_store.count_online();
    return s;
}

std::optional<PerformanceSample> MetricSampler::sample_tick()
{
    auto s = collect();
    if (!s)
        return std::nullopt;
    s->id = m_store.insert_sample(*s);
    auto &rt = metrics::runtime();
    rt.samples_written.fetch_add(1, std::memory_order_relaxed);
    rt.players_online.store(static_cast<uint64_t>(s->players_online), std::memory_order_relaxed);
    log::debug(
        "[perf] tps={} view_radius={} cpu={} ram_mb={} players={}",
        s->tps ? std::to_string(*s->tps) : std::string("-"),
        s->view_radius ? std::to_string(*s->view_radius) : std::string("-"),
        s->cpu_percent ? std::to_string(*s->cpu_percent) : std::string("-"),
        s->ram_mb ? std::to_string(*s->ram_mb) : std::string("-"),
        s->players_online);
    return s;
}

} // namespace hdw::sampler
