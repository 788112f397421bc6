// SPDX-License-Identifier: Apache-2.0
#include "worker/config.hpp"

#include <yaml-cpp/yaml.h>

namespace hdw {

void apply_config_file(WorkerConfig &cfg, const std::string &path)
{
    YAML::Node root = YAML::LoadFile(path);
    if (root["db_path"])
        cfg.db_path = root["db_path"].as<std::string>();
    if (root["service_unit"])
        cfg.service_unit = root["service_unit"].as<std::string>();
    if (root["process_name"])
        cfg.process_name = root["process_name"].as<std::string>();
    if (root["process_cmdline_marker"])
        cfg.process_cmdline_marker = root["process_cmdline_marker"].as<std::string>();
    if (root["tick_ms"])
        cfg.tick_ms = root["tick_ms"].as<uint32_t>();
    if (root["perf_interval_sec"])
        cfg.perf_interval_sec = root["perf_interval_sec"].as<uint32_t>();
    if (root["ingest_interval_sec"])
        cfg.ingest_interval_sec = root["ingest_interval_sec"].as<uint32_t>();
    if (root["cleanup_interval_sec"])
        cfg.cleanup_interval_sec = root["cleanup_interval_sec"].as<uint32_t>();
    if (root["summary_interval_sec"])
        cfg.summary_interval_sec = root["summary_interval_sec"].as<uint32_t>();
    if (root["perf_retention_hours"])
        cfg.perf_retention_hours = root["perf_retention_hours"].as<uint32_t>();
    if (root["event_retention_days"])
        cfg.event_retention_days = root["event_retention_days"].as<uint32_t>();
    if (root["ingest_lookback_days"])
        cfg.ingest_lookback_days = root["ingest_lookback_days"].as<uint32_t>();
    if (root["backfill_days"])
        cfg.backfill_days = root["backfill_days"].as<uint32_t>();
    if (root["backfill_enabled"])
        cfg.backfill_enabled = root["backfill_enabled"].as<bool>();
    if (root["metric_scan_lines"])
        cfg.metric_scan_lines = root["metric_scan_lines"].as<uint32_t>();
    if (root["metric_query_timeout_sec"])
        cfg.metric_query_timeout_sec = root["metric_query_timeout_sec"].as<uint32_t>();
    if (root["ingest_query_timeout_sec"])
        cfg.ingest_query_timeout_sec = root["ingest_query_timeout_sec"].as<uint32_t>();
    if (root["backfill_query_timeout_sec"])
        cfg.backfill_query_timeout_sec = root["backfill_query_timeout_sec"].as<uint32_t>();
    if (root["probe_timeout_sec"])
        cfg.probe_timeout_sec = root["probe_timeout_sec"].as<uint32_t>();
    if (root["log_level"])
        cfg.log_level = root["log_level"].as<std::string>();
    if (root["log_json"])
        cfg.log_json = root["log_json"].as<bool>();
    if (root["metrics_port"])
        cfg.metrics_port = root["metrics_port"].as<uint16_t>();
}

} // namespace hdw
