// SPDX-License-Identifier: Apache-2.0
#include "common/metrics.hpp"
#include "worker/store/store.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <iostream>

using namespace hdw;

static Event make_event(EventKind kind, const std::string &id, const std::string &ts)
{
    Event e;
    e.kind = kind;
    e.player_id = id;
    e.display_name = "P-" + id;
    e.timestamp = Timestamp{ts, *timeutil::parse_iso8601(ts)};
    if (kind == EventKind::join)
        e.world = "default";
    return e;
}

int main()
{
    // Schema creation is idempotent.
    {
        store::Store s(":memory:");
        s.init_schema();
        s.init_schema();
        assert(s.players().empty());
        assert(!s.checkpoint());
        assert(s.count_online() == 0);
    }

    // Player upsert / merge semantics.
    {
        store::Store s(":memory:");
        s.init_schema();
        PlayerRecord p;
        p.player_id = "aaa";
        p.display_name = "Alice";
        p.online = true;
        p.last_login = "2024-01-01T10:00:00";
        p.last_logout = "2024-01-01T09:00:00";
        p.current_world = "w1";
        p.cumulative_playtime_seconds = 120;
        s.upsert_player(p);
        assert(s.count_online() == 1);

        // Backfill merge keeps stored fields the window did not see, and never touches playtime.
        PlayerRecord m;
        m.player_id = "aaa";
        m.display_name = "Alice2";
        m.online = false;
        m.last_logout = "2024-01-01T11:00:00";
        s.merge_player(m);
        auto got = s.find_player("aaa");
        assert(got);
        assert(got->display_name == "Alice2" && !got->online);
        assert(got->last_login && *got->last_login == "2024-01-01T10:00:00");
        assert(got->last_logout && *got->last_logout == "2024-01-01T11:00:00");
        assert(got->current_world && *got->current_world == "w1");
        assert(got->cumulative_playtime_seconds == 120);

        // Full upsert clears what the record clears.
        got->current_world.reset();
        s.upsert_player(*got);
        assert(!s.find_player("aaa")->current_world);
        assert(!s.find_player("zzz"));
    }

    // Event history dedupe and checkpoint round-trip.
    {
        store::Store s(":memory:");
        s.init_schema();
        auto j = make_event(EventKind::join, "aaa", "2024-01-01T10:00:00");
        assert(s.append_event(j));
        assert(!s.append_event(j));
        assert(s.append_event(make_event(EventKind::leave, "aaa", "2024-01-01T10:00:00")));
        auto evs = s.events();
        assert(evs.size() == 2);
        assert(evs[0].kind == EventKind::join && evs[0].world && *evs[0].world == "default");
        assert(evs[1].kind == EventKind::leave && !evs[1].world);

        s.set_checkpoint("2024-01-01T10:00:00+0000");
        s.set_checkpoint("2024-01-01T10:05:00+0000");
        assert(s.checkpoint() && *s.checkpoint() == "2024-01-01T10:05:00+0000");
    }

    // Samples keep unset fields as null.
    {
        store::Store s(":memory:");
        s.init_schema();
        PerformanceSample ps;
        ps.timestamp = "2024-01-01T10:00:00+00:00";
        ps.ts_epoch = 1704103200;
        ps.tps = 20;
        ps.players_online = 3;
        auto id = s.insert_sample(ps);
        assert(id > 0);
        auto rows = s.samples();
        assert(rows.size() == 1);
        assert(rows[0].tps && *rows[0].tps == 20);
        assert(!rows[0].cpu_percent && !rows[0].ram_mb && !rows[0].ram_percent && !rows[0].view_radius);
        assert(rows[0].players_online == 3);
        assert(s.delete_samples_before(1704103200) == 0);
        assert(s.delete_samples_before(1704103201) == 1);
    }

    // Databases from older versions: missing columns and duplicate history rows are migrated.
    {
        auto path = std::filesystem::temp_directory_path() / ("hdw_unit_store_" + std::to_string(getpid()) + ".db");
        std::filesystem::remove(path);
        {
            store::Database legacy(path.string());
            legacy.exec(R"(CREATE TABLE performance (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp TEXT NOT NULL,
                tps INTEGER, cpu_percent REAL, ram_mb REAL, ram_percent REAL, players_online INTEGER DEFAULT 0))");
            legacy.exec(R"(CREATE TABLE player_events (id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp TEXT NOT NULL,
                uuid TEXT NOT NULL, name TEXT NOT NULL, event_type TEXT NOT NULL, world TEXT))");
            legacy.exec("INSERT INTO performance (timestamp, tps) VALUES ('2024-01-01T10:00:00+00:00', 20)");
            legacy.exec(R"(INSERT INTO player_events (timestamp, uuid, name, event_type)
                VALUES ('2024-01-01T10:00:00', 'aaa', 'A', 'join'), ('2024-01-01T10:00:00', 'aaa', 'A', 'join'))");
        }
        const auto deduped_before = metrics::runtime().events_deduplicated.load();
        {
            store::Store s(path.string());
            s.init_schema();
            // The duplicate join is dropped from the history, and the drop is counted.
            assert(metrics::runtime().events_deduplicated.load() == deduped_before + 1);
            auto rows = s.samples();
            assert(rows.size() == 1);
            assert(rows[0].ts_epoch == 1704103200);
            assert(!rows[0].view_radius);
            assert(s.events().size() == 1);
            s.set_checkpoint("2024-01-01T10:00:00");
        }
        {
            store::Store s(path.string());
            s.init_schema();
            // The unique index exists now, so the dedupe migration does not run again.
            assert(metrics::runtime().events_deduplicated.load() == deduped_before + 1);
            assert(s.checkpoint() && *s.checkpoint() == "2024-01-01T10:00:00");
            s.close();
            assert(!s.is_open());
            bool threw = false;
            try {
                s.players();
            } catch (const store::StorageError &) {
                threw = true;
            }
            assert(threw);
        }
        std::filesystem::remove(path);
        std::filesystem::remove(path.string() + "-wal");
        std::filesystem::remove(path.string() + "-shm");
    }

    std::cout << "unit_store OK" << std::endl;
    return 0;
}
