// SPDX-License-Identifier: Apache-2.0
#include "fake_sources.hpp"
#include "worker/sampler/metric_sampler.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace hdw;

int main()
{
    store::Store store(":memory:");
    store.init_schema();
    PlayerRecord online;
    online.player_id = "aaa";
    online.display_name = "Alice";
    online.online = true;
    store.upsert_player(online);
    PlayerRecord offline = online;
    offline.player_id = "bbb";
    offline.online = false;
    store.upsert_player(offline);

    test::ScriptedLogSource logs;
    test::FixedPidResolver resolver;
    test::FixedResourceProbe fake_probe;
    const auto now = *timeutil::parse_iso8601("2024-01-01T10:00:00Z");
    sampler::MetricSampler metric_sampler(store, logs, resolver, fake_probe, sampler::SamplerConfig{50, std::chrono::seconds(5)},
                                   [now] { return now; });

    // Process found: every field populated.
    resolver.pid = 4242;
    fake_probe.usage = probe::ResourceUsage{37.5, 12.5, 2048 * 1024};
    logs.batches.push_back({
        "2024-01-01T09:59:00+0000 host java[1]: Setting TPS of world default to 18",
        "2024-01-01T09:59:10+0000 host java[1]: Initial view radius is 10",
        "2024-01-01T09:59:20+0000 host java[1]: Setting TPS of world default to 20",
    });
    auto s = metric_sampler.sample_tick();
    assert(s && s->id > 0);
    assert(logs.queries.back().last_lines && *logs.queries.back().last_lines == 50);
    assert(!logs.queries.back().since);
    assert(s->timestamp == "2024-01-01T10:00:00+00:00");
    assert(s->ts_epoch == 1704103200);
    assert(s->tps && *s->tps == 20);
    assert(s->view_radius && *s->view_radius == 10);
    assert(s->cpu_percent && std::fabs(*s->cpu_percent - 37.5) < 1e-9);
    assert(s->ram_percent && std::fabs(*s->ram_percent - 12.5) < 1e-9);
    assert(s->ram_mb && std::fabs(*s->ram_mb - 2048.0) < 1e-9);
    assert(s->players_online == 1);

    // Process not running: resource fields stay null, never zero.
    resolver.pid.reset();
    s = metric_sampler.sample_tick();
    assert(s);
    assert(!s->cpu_percent && !s->ram_mb && !s->ram_percent);
    assert(!s->tps && !s->view_radius);
    assert(s->players_online == 1);

    // Process vanished between resolve and sample.
    resolver.pid = 4242;
    fake_probe.usage.reset();
    s = metric_sampler.sample_tick();
    assert(s && !s->cpu_percent && !s->ram_mb);

    // Probe could read RSS but not the percentages: only ram_mb is filled.
    fake_probe.usage = probe::ResourceUsage{std::nullopt, std::nullopt, 1024};
    s = metric_sampler.sample_tick();
    assert(s && !s->cpu_percent && !s->ram_percent);
    assert(s->ram_mb && std::fabs(*s->ram_mb - 1.0) < 1e-9);

    // A failed log query skips the tick entirely.
    logs.fail = true;
    assert(!metric_sampler.sample_tick());

    auto rows = store.samples();
    assert(rows.size() == 4);
    assert(rows[0].tps && *rows[0].tps == 20);
    assert(!rows[1].cpu_percent && !rows[1].tps);

    std::cout << "unit_metric_sampler OK" << std::endl;
    return 0;
}
