// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "common/time_util.hpp"
#include "worker/config.hpp"
#include "worker/extract/event_extractor.hpp"
#include "worker/net/metrics_http.hpp"
#include "worker/probe/process_probe.hpp"
#include "worker/reconcile/reconciler.hpp"
#include "worker/retention/pruner.hpp"
#include "worker/sampler/metric_sampler.hpp"
#include "worker/scheduler/scheduler.hpp"
#include "worker/source/log_source.hpp"
#include "worker/store/store.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>
#include <coro/sync_wait.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>

#ifndef HDW_VERSION
#    define HDW_VERSION "dev"
#endif

namespace hdw {
std::atomic_bool g_shutdown{false};
}

static void handle_signal(int)
{
    hdw::g_shutdown.store(true);
}

// Auto-shutdown for smoke runs (--duration). Polls so it never outlives a signal-driven stop.
static coro::task<void> duration_watch(std::shared_ptr<coro::io_scheduler> sched, int seconds)
{
    co_await sched->schedule();
    auto start = std::chrono::steady_clock::now();
    while (!hdw::g_shutdown.load()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start);
        if (elapsed.count() >= seconds) {
            hdw::log::info("Duration reached ({}s); initiating shutdown", elapsed.count());
            hdw::g_shutdown.store(true);
            break;
        }
        co_await sched->yield_for(std::chrono::milliseconds(200));
    }
    co_return;
}

static void log_summary(const char *metric)
{
    auto &rt = hdw::metrics::runtime();
    uint64_t samples = rt.task_samples.load();
    uint64_t avg_ns = samples ? rt.task_duration_ns_accum.load() / samples : 0;
    std::ostringstream j;
    j << "{\"metric\":\"" << metric << "\"";
    j << ",\"perf_runs\":" << rt.perf.runs.load();
    j << ",\"perf_failures\":" << rt.perf.failures.load();
    j << ",\"ingest_runs\":" << rt.ingest.runs.load();
    j << ",\"ingest_failures\":" << rt.ingest.failures.load();
    j << ",\"cleanup_runs\":" << rt.cleanup.runs.load();
    j << ",\"cleanup_failures\":" << rt.cleanup.failures.load();
    j << ",\"avg_task_ns\":" << avg_ns;
    j << ",\"p99_task_ns\":" << hdw::metrics::approx_task_p99();
    j << ",\"events_merged\":" << rt.events_merged.load();
    j << ",\"events_new\":" << rt.events_new.load();
    j << ",\"query_failures\":" << rt.query_failures.load();
    j << ",\"samples_written\":" << rt.samples_written.load();
    j << ",\"probe_misses\":" << rt.probe_misses.load();
    j << ",\"players_online\":" << rt.players_online.load();
    j << ",\"samples_pruned\":" << rt.samples_pruned.load();
    j << ",\"events_pruned\":" << rt.events_pruned.load();
    j << "}";
    hdw::log::info("{}", j.str());
}

int main(int argc, char **argv)
{
    hdw::WorkerConfig cfg;
    std::string config_path = "config/worker.yaml";
    int duration_override_sec = 0; // 0 means run until signal
    bool cli_port_override = false;
    uint16_t port_override = 0;
    bool cli_no_backfill = false;
    // First non-flag argument is the config path.
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                hdw::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (a == "--metrics-port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                hdw::log::warn("Invalid --metrics-port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--no-backfill") {
            cli_no_backfill = true;
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }
    try {
        hdw::apply_config_file(cfg, config_path);
    } catch (const std::exception &ex) {
        hdw::log::error("Failed to load config {}: {}", config_path, ex.what());
        return 1;
    }
    if (const char *db = std::getenv("HDW_DB_PATH"))
        cfg.db_path = db;
    if (cli_port_override)
        cfg.metrics_port = port_override;
    if (cli_no_backfill)
        cfg.backfill_enabled = false;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Logging config goes through the environment before the first init; an explicit external
    // setting wins.
    if (!cfg.log_level.empty() && std::getenv("HDW_LOG_LEVEL") == nullptr)
        setenv("HDW_LOG_LEVEL", cfg.log_level.c_str(), 1);
    if (cfg.log_json)
        setenv("HDW_LOG_JSON", "1", 1);
    hdw::log::init();
    hdw::log::info("hdw worker starting (version: {})", HDW_VERSION);
    hdw::log::info("Service unit: {}", cfg.service_unit);
    hdw::log::info("Database: {}", cfg.db_path);
    hdw::log::info(
        "Intervals: perf {}s, ingest {}s, cleanup {}s",
        cfg.perf_interval_sec,
        cfg.ingest_interval_sec,
        cfg.cleanup_interval_sec);
    if (duration_override_sec > 0)
        hdw::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);

    using std::chrono::hours;
    using std::chrono::seconds;
    hdw::timeutil::now_fn now = [] { return hdw::timeutil::clock::now(); };
    hdw::source::JournalLogSource journal(cfg.service_unit);
    hdw::probe::SystemdPidResolver resolver(hdw::probe::PidResolverConfig{
        cfg.service_unit, cfg.process_name, cfg.process_cmdline_marker, seconds(cfg.probe_timeout_sec), "/proc"});
    hdw::probe::ProcResourceProbe resource_probe;
    const auto extractor = hdw::extract::make_default_extractor();

    std::unique_ptr<hdw::store::Store> store;
    std::unique_ptr<hdw::reconcile::Reconciler> reconciler;
    std::unique_ptr<hdw::sampler::MetricSampler> sampler;
    std::unique_ptr<hdw::retention::RetentionPruner> pruner;

    hdw::sched::Lifecycle lifecycle;
    lifecycle.startup = [&] {
        if (cfg.db_path != ":memory:") {
            auto parent = std::filesystem::path(cfg.db_path).parent_path();
            if (!parent.empty())
                std::filesystem::create_directories(parent);
        }
        store = std::make_unique<hdw::store::Store>(cfg.db_path);
        store->init_schema();
        hdw::log::info("Database initialized: {}", cfg.db_path);

        reconciler = std::make_unique<hdw::reconcile::Reconciler>(
            *store,
            journal,
            extractor,
            hdw::reconcile::ReconcilerConfig{
                hours(24 * cfg.ingest_lookback_days),
                hours(24 * cfg.backfill_days),
                seconds(cfg.ingest_query_timeout_sec),
                seconds(cfg.backfill_query_timeout_sec)},
            now);
        sampler = std::make_unique<hdw::sampler::MetricSampler>(
            *store,
            journal,
            resolver,
            resource_probe,
            hdw::sampler::SamplerConfig{cfg.metric_scan_lines, seconds(cfg.metric_query_timeout_sec)},
            now);
        pruner = std::make_unique<hdw::retention::RetentionPruner>(
            *store,
            hdw::retention::RetentionConfig{hours(cfg.perf_retention_hours), hours(24 * cfg.event_retention_days)},
            now);

        if (cfg.backfill_enabled) {
            try {
                reconciler->backfill();
            } catch (const hdw::store::StorageError &ex) {
                // Steady-state ingestion rebuilds the same state from the checkpoint window.
                hdw::log::error("[backfill] storage error: {}", ex.what());
            }
        }
    };
    lifecycle.shutdown = [&] {
        if (store)
            store->close();
    };

    auto &rt = hdw::metrics::runtime();
    hdw::sched::Scheduler scheduler(std::chrono::milliseconds(cfg.tick_ms), hdw::g_shutdown);
    scheduler.add_task({"perf", seconds(cfg.perf_interval_sec), [&] { sampler->sample_tick(); }, &rt.perf});
    scheduler.add_task({"ingest", seconds(cfg.ingest_interval_sec), [&] { reconciler->ingest_tick(); }, &rt.ingest});
    scheduler.add_task({"cleanup", seconds(cfg.cleanup_interval_sec), [&] { pruner->prune(); }, &rt.cleanup});
    if (cfg.summary_interval_sec > 0)
        scheduler.add_task({"summary", seconds(cfg.summary_interval_sec), [] { log_summary("runtime"); }, nullptr});

    auto io = coro::default_executor::io_executor();
    if (cfg.metrics_port != 0)
        io->spawn(hdw::net::run_metrics_endpoint(io, cfg.metrics_port, hdw::g_shutdown));
    if (duration_override_sec > 0)
        io->spawn(duration_watch(io, duration_override_sec));

    int rc = coro::sync_wait(scheduler.run(io, lifecycle));
    // Background coroutines poll this flag; set it for the startup-failure path too.
    hdw::g_shutdown.store(true);
    log_summary("runtime_final");
    hdw::log::info("Shutdown complete (exit {}).", rc);
    hdw::log::shutdown();
    return rc;
}
