// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>

namespace hdw {

struct WorkerConfig
{
    std::string db_path{"data/dashboard.db"};
    std::string service_unit{"hytale"};
    std::string process_name{"java"};
    std::string process_cmdline_marker{"HytaleServer.jar"};
    uint32_t tick_ms{1000};
    uint32_t perf_interval_sec{5};
    uint32_t ingest_interval_sec{10};
    uint32_t cleanup_interval_sec{3600};
    uint32_t summary_interval_sec{60};
    uint32_t perf_retention_hours{24};
    uint32_t event_retention_days{7};
    uint32_t ingest_lookback_days{3};
    uint32_t backfill_days{7};
    bool backfill_enabled{true};
    uint32_t metric_scan_lines{200};
    uint32_t metric_query_timeout_sec{10};
    uint32_t ingest_query_timeout_sec{30};
    uint32_t backfill_query_timeout_sec{60};
    uint32_t probe_timeout_sec{10};
    std::string log_level{"info"};
    bool log_json{false};
    uint16_t metrics_port{0}; // 0 disables
};

// Applies keys present in the file onto cfg; absent keys keep their current values. Throws
// YAML::Exception on a missing or malformed file.
void apply_config_file(WorkerConfig &cfg, const std::string &path);

} // namespace hdw
