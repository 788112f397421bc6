// SPDX-License-Identifier: Apache-2.0
// store.hpp
// Durable worker state: players, player event history, performance samples and the ingestion checkpoint.
#pragma once

#include "worker/model.hpp"
#include "worker/store/database.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hdw::store {

class Store
{
public:
    // Opens (creating if needed) the SQLite file. ":memory:" gives a private in-memory database.
    explicit Store(const std::string &path);

    // Idempotent; safe on every start.
    void init_schema();
    void close();
    bool is_open() const noexcept { return m_db && m_db->is_open(); }

    Database &db();

    // --- players ---
    std::optional<PlayerRecord> find_player(const std::string &player_id);
    // Full overwrite of every column for the key.
    void upsert_player(const PlayerRecord &rec);
    // Backfill merge: name and online overwrite; login/logout/world keep the stored value when the
    // incoming one is unset. Playtime is left untouched.
    void merge_player(const PlayerRecord &rec);
    std::vector<PlayerRecord> players();
    int64_t count_online();

    // --- event history ---
    // Returns false when an identical entry (timestamp, player, kind) already exists.
    bool append_event(const Event &ev);
    std::vector<EventLogEntry> events();

    // --- checkpoint ---
    std::optional<std::string> checkpoint();
    void set_checkpoint(const std::string &ts);

    // --- performance ---
    int64_t insert_sample(const PerformanceSample &s);
    std::vector<PerformanceSample> samples();

    // --- retention ---
    int delete_samples_before(int64_t epoch_seconds);
    int delete_events_before(int64_t epoch_seconds);
    // Best-effort WAL checkpoint; does not wait for readers.
    void compact();

private:
    std::unique_ptr<Database> m_db;
};

} // namespace hdw::store
