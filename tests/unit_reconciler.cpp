// SPDX-License-Identifier: Apache-2.0
#include "fake_sources.hpp"
#include "worker/reconcile/reconciler.hpp"

#include <cassert>
#include <iostream>

using namespace hdw;

namespace {
const std::string k_join_alice =
    "2024-01-01T10:00:00+0000 host java[1]: Adding player 'Alice' to world 'Overworld' at location (1, 2, 3) (abc-123)";
const std::string k_leave_alice =
    "2024-01-01T10:30:00+0000 host java[1]: Removing player 'Alice' from world 'Overworld' (abc-123)";
const std::string k_join_bob =
    "2024-01-01T10:10:00+0000 host java[1]: Adding player 'Bob' to world 'Nether' at location (0, 0, 0) (bbb-1)";
const std::string k_leave_ghost =
    "2024-01-01T10:20:00+0000 host java[1]: Removing player 'Ghost' from world 'Overworld' (dead-1)";

timeutil::time_point at(const char *ts)
{
    return *timeutil::parse_iso8601(ts);
}

struct Fixture
{
    store::Store store{":memory:"};
    test::ScriptedLogSource logs;
    extract::EventExtractor extractor = extract::make_default_extractor();
    timeutil::time_point now = at("2024-01-01T12:00:00Z");
    reconcile::Reconciler reconciler{store, logs, extractor, reconcile::ReconcilerConfig{}, [this] { return now; }};

    Fixture() { store.init_schema(); }
};
} // namespace

int main()
{
    // Steady-state tick merges events and advances the checkpoint to the last event.
    {
        Fixture f;
        f.logs.batches.push_back({k_join_alice, "2024-01-01T10:05:00+0000 noise", k_leave_alice});
        auto r = f.reconciler.ingest_tick();
        assert(!r.skipped && r.extracted == 2 && r.new_entries == 2);
        assert(r.checkpoint_advanced && r.checkpoint && *r.checkpoint == "2024-01-01T10:30:00+0000");
        // No checkpoint yet: the window starts at now - lookback.
        assert(f.logs.queries.size() == 1);
        assert(*f.logs.queries[0].since == f.now - std::chrono::hours(72));
        assert(*f.logs.queries[0].until == f.now);
        auto p = f.store.find_player("abc-123");
        assert(p && !p->online && p->cumulative_playtime_seconds == 1800);
        assert(*p->current_world == "Overworld");

        // The next window starts at the checkpoint (inclusive) so the boundary event is seen again.
        f.logs.batches.push_back({k_leave_alice});
        auto r2 = f.reconciler.ingest_tick();
        assert(*f.logs.queries[1].since == at("2024-01-01T10:30:00+0000"));
        assert(r2.extracted == 1 && r2.new_entries == 0 && !r2.checkpoint_advanced);
        p = f.store.find_player("abc-123");
        assert(p->cumulative_playtime_seconds == 1800);
        assert(f.store.events().size() == 2);
    }

    // Processing the same window twice changes nothing.
    {
        Fixture f;
        std::vector<std::string> window = {k_join_alice, k_join_bob, k_leave_alice};
        f.logs.batches.push_back(window);
        f.reconciler.ingest_tick();
        auto players = f.store.players();
        auto events = f.store.events();
        auto cp = f.store.checkpoint();
        f.reconciler.merge(f.extractor.extract(window));
        auto players2 = f.store.players();
        assert(players2.size() == players.size());
        for (size_t i = 0; i < players.size(); ++i) {
            assert(players[i].player_id == players2[i].player_id);
            assert(players[i].online == players2[i].online);
            assert(players[i].last_login == players2[i].last_login);
            assert(players[i].last_logout == players2[i].last_logout);
            assert(players[i].cumulative_playtime_seconds == players2[i].cumulative_playtime_seconds);
        }
        assert(f.store.events().size() == events.size());
        assert(f.store.checkpoint() == cp);
    }

    // Join@t1, Leave@t2, Join@t3: any sub-batching ends in the sequential result.
    {
        const std::string rejoin =
            "2024-01-01T11:00:00+0000 host java[1]: Adding player 'Alice' to world 'Sky' at location (0, 0, 0) (abc-123)";
        std::vector<std::vector<std::vector<std::string>>> splits = {
            {{k_join_alice, k_leave_alice, rejoin}},
            {{k_join_alice}, {k_leave_alice}, {rejoin}},
            {{k_join_alice, k_leave_alice}, {rejoin}},
            {{k_join_alice}, {k_leave_alice, rejoin}},
        };
        for (const auto &split : splits) {
            Fixture f;
            for (const auto &batch : split) {
                f.logs.batches.push_back(batch);
                f.reconciler.ingest_tick();
            }
            auto p = f.store.find_player("abc-123");
            assert(p && p->online);
            assert(*p->last_login == "2024-01-01T11:00:00+0000");
            assert(*p->current_world == "Sky");
            assert(p->cumulative_playtime_seconds == 1800);
            assert(*f.store.checkpoint() == "2024-01-01T11:00:00+0000");
        }
    }

    // Leave lines out of timestamp order are applied in line order.
    {
        Fixture f;
        const std::string early_leave =
            "2024-01-01T10:20:00+0000 host java[1]: Removing player 'Alice' from world 'Overworld' (abc-123)";
        auto added = f.reconciler.merge(f.extractor.extract({k_join_alice, k_leave_alice, early_leave}));
        assert(added == 3);
        auto p = f.store.find_player("abc-123");
        assert(p && !p->online);
        assert(*p->last_logout == "2024-01-01T10:20:00+0000");
        assert(p->cumulative_playtime_seconds == 1800);

        // Replaying the same lines changes nothing.
        assert(f.reconciler.merge(f.extractor.extract({k_join_alice, k_leave_alice, early_leave})) == 0);
        p = f.store.find_player("abc-123");
        assert(*p->last_logout == "2024-01-01T10:20:00+0000");
        assert(p->cumulative_playtime_seconds == 1800);
        assert(f.store.events().size() == 3);
    }

    // Empty batch leaves the checkpoint alone; a failed query skips the tick.
    {
        Fixture f;
        f.store.set_checkpoint("2024-01-01T09:00:00+0000");
        f.logs.batches.push_back({"2024-01-01T11:00:00+0000 host java[1]: unrelated"});
        auto r = f.reconciler.ingest_tick();
        assert(!r.skipped && r.extracted == 0 && !r.checkpoint_advanced);
        assert(*f.store.checkpoint() == "2024-01-01T09:00:00+0000");

        f.logs.fail = true;
        auto r2 = f.reconciler.ingest_tick();
        assert(r2.skipped);
        assert(*f.store.checkpoint() == "2024-01-01T09:00:00+0000");
        assert(f.store.players().empty());
    }

    // Leave for an unknown player: history row but no player record.
    {
        Fixture f;
        f.logs.batches.push_back({k_leave_ghost});
        auto r = f.reconciler.ingest_tick();
        assert(r.new_entries == 1);
        assert(!f.store.find_player("dead-1"));
        auto evs = f.store.events();
        assert(evs.size() == 1 && evs[0].kind == EventKind::leave && evs[0].player_id == "dead-1");
    }

    // The checkpoint never moves backwards.
    {
        Fixture f;
        f.store.set_checkpoint("2024-01-01T11:00:00+0000");
        auto ev = f.extractor.extract({k_join_alice});
        assert(!f.reconciler.advance_checkpoint(ev[0].timestamp));
        assert(*f.store.checkpoint() == "2024-01-01T11:00:00+0000");
    }

    // Startup backfill merges without clobbering fields the window did not observe.
    {
        Fixture f;
        PlayerRecord old;
        old.player_id = "abc-123";
        old.display_name = "Alice";
        old.online = true;
        old.last_login = "2023-12-30T08:00:00+0000";
        old.current_world = "Overworld";
        old.cumulative_playtime_seconds = 500;
        f.store.upsert_player(old);

        f.logs.batches.push_back({k_leave_alice, k_join_bob});
        auto n = f.reconciler.backfill();
        assert(n == 2);
        assert(*f.logs.queries[0].since == f.now - std::chrono::hours(168));
        auto a = f.store.find_player("abc-123");
        assert(!a->online);
        assert(*a->last_login == "2023-12-30T08:00:00+0000");
        assert(*a->last_logout == "2024-01-01T10:30:00+0000");
        assert(*a->current_world == "Overworld");
        assert(a->cumulative_playtime_seconds == 500);
        auto b = f.store.find_player("bbb-1");
        assert(b && b->online && *b->current_world == "Nether");
        // Backfill does not touch the checkpoint or the history.
        assert(!f.store.checkpoint());
        assert(f.store.events().empty());

        f.logs.fail = true;
        assert(f.reconciler.backfill() == 0);
    }

    std::cout << "unit_reconciler OK" << std::endl;
    return 0;
}
