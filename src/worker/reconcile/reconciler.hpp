// SPDX-License-Identifier: Apache-2.0
// reconciler.hpp
// Merges join/leave events into the durable player set, driven by an incremental log checkpoint.
#pragma once

#include "common/time_util.hpp"
#include "worker/extract/event_extractor.hpp"
#include "worker/model.hpp"
#include "worker/source/log_source.hpp"
#include "worker/store/store.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace hdw::reconcile {

// Single-event merge, independent of storage. Returns the record to persist, or nullopt when
// nothing should be written (leave for an unknown player).
//  join : create or overwrite name/online/last_login/world
//  leave: online=false, last_logout=t, whatever the stored logout was
// first_seen is false when the event is already in the history; such a leave adds no playtime.
std::optional<PlayerRecord> apply_event(
    const std::optional<PlayerRecord> &current, const Event &ev, bool first_seen = true);

// Startup backfill fold: one record per player_id from the window's events, in order.
// Fields never set by the window stay unset so the store keeps existing values.
std::map<std::string, PlayerRecord> fold_backfill(const std::vector<Event> &events);

struct ReconcilerConfig
{
    std::chrono::hours lookback{72}; // scan start when no checkpoint exists
    std::chrono::hours backfill_window{168};
    std::chrono::seconds query_timeout{30};
    std::chrono::seconds backfill_timeout{60};
};

struct IngestResult
{
    bool skipped{false}; // log query failed; nothing touched
    size_t extracted{0};
    size_t new_entries{0}; // event history rows actually added
    std::optional<std::string> checkpoint; // value after the tick
    bool checkpoint_advanced{false};
};

class Reconciler
{
public:
    Reconciler(
        store::Store &store,
        source::ILogSource &logs,
        const extract::EventExtractor &extractor,
        ReconcilerConfig cfg,
        timeutil::now_fn now);

    // One incremental scan: [checkpoint, now). QueryError skips the tick; StorageError propagates
    // with the checkpoint left where it was.
    IngestResult ingest_tick();

    // Applies events in order, one transaction per event. Returns the number of new history rows.
    size_t merge(const std::vector<Event> &events);

    // Moves the checkpoint to ts unless that would move it backwards. Returns true when written.
    bool advance_checkpoint(const Timestamp &ts);

    // Wide-window scan run once before the first steady-state tick. Returns players written;
    // a failed query logs and returns 0.
    size_t backfill();

private:
    timeutil::time_point scan_start();

    store::Store &m_store;
    source::ILogSource &m_logs;
    const extract::EventExtractor &m_extractor;
    ReconcilerConfig m_cfg;
    timeutil::now_fn m_now;
};

} // namespace hdw::reconcile
