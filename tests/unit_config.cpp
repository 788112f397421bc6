// SPDX-License-Identifier: Apache-2.0
#include "worker/config.hpp"

#include <unistd.h>

#include <yaml-cpp/yaml.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

int main()
{
    auto path = std::filesystem::temp_directory_path() / ("hdw_unit_config_" + std::to_string(getpid()) + ".yaml");
    {
        std::ofstream out(path);
        out << "db_path: /var/lib/hdw/state.db\n"
            << "service_unit: hytale-test\n"
            << "perf_interval_sec: 2\n"
            << "backfill_enabled: false\n"
            << "log_json: true\n"
            << "metrics_port: 9105\n";
    }
    hdw::WorkerConfig cfg;
    cfg.tick_ms = 250;
    hdw::apply_config_file(cfg, path.string());
    // Values set before the file is applied survive when the file omits the key.
    assert(cfg.tick_ms == 250);
    assert(cfg.db_path == "/var/lib/hdw/state.db");
    assert(cfg.service_unit == "hytale-test");
    assert(cfg.perf_interval_sec == 2);
    assert(!cfg.backfill_enabled);
    assert(cfg.log_json);
    assert(cfg.metrics_port == 9105);
    // Keys absent from the file keep their defaults.
    assert(cfg.ingest_interval_sec == 10);
    assert(cfg.cleanup_interval_sec == 3600);
    assert(cfg.perf_retention_hours == 24);
    assert(cfg.event_retention_days == 7);
    assert(cfg.backfill_days == 7);
    assert(cfg.process_cmdline_marker == "HytaleServer.jar");

    {
        std::ofstream out(path);
        out << "perf_interval_sec: [not, a, number]\n";
    }
    bool threw = false;
    try {
        hdw::WorkerConfig bad;
        hdw::apply_config_file(bad, path.string());
    } catch (const YAML::Exception &) {
        threw = true;
    }
    assert(threw);

    std::filesystem::remove(path);
    threw = false;
    try {
        hdw::WorkerConfig bad;
        hdw::apply_config_file(bad, path.string());
    } catch (const YAML::Exception &) {
        threw = true;
    }
    assert(threw);

    std::cout << "unit_config OK" << std::endl;
    return 0;
}
