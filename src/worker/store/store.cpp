// SPDX-License-Identifier: Apache-2.0
#include "worker/store/store.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace hdw::store {

namespace {
constexpr const char *k_checkpoint_key = "last_event_ts";

bool has_column(Database &db, const std::string &table, const std::string &column)
{
    Statement st(db, "PRAGMA table_info(" + table + ")");
    while (st.step()) {
        if (st.column_text(1) == column)
            return true;
    }
    return false;
}

bool has_index(Database &db, const std::string &name)
{
    Statement st(db, "SELECT 1 FROM sqlite_master WHERE type = 'index' AND name = ?");
    st.bind(1, name);
    return st.step();
}

PlayerRecord read_player(const Statement &st)
{
    PlayerRecord p;
    p.player_id = st.column_text(0);
    p.display_name = st.column_text(1);
    p.online = st.column_int64(2) != 0;
    p.last_login = st.column_opt_text(3);
    p.last_logout = st.column_opt_text(4);
    p.current_world = st.column_opt_text(5);
    p.cumulative_playtime_seconds = st.column_int64(6);
    return p;
}
} // namespace

Store::Store(const std::string &path) : m_db(std::make_unique<Database>(path))
{
    m_db->exec("PRAGMA journal_mode=WAL");
    m_db->exec("PRAGMA synchronous=NORMAL");
}

Database &Store::db()
{
    if (!is_open())
        throw StorageError("store is closed");
    return *m_db;
}

void Store::close()
{
    if (m_db)
        m_db->close();
}

void Store::init_schema()
{
    auto &d = db();
    Transaction tx(d);
    d.exec(R"(CREATE TABLE IF NOT EXISTS players (
        uuid TEXT PRIMARY KEY,
        name TEXT NOT NULL,
        online INTEGER DEFAULT 0,
        last_login TEXT,
        last_logout TEXT,
        world TEXT,
        total_playtime_seconds INTEGER DEFAULT 0
    ))");
    d.exec(R"(CREATE TABLE IF NOT EXISTS performance (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        timestamp TEXT NOT NULL,
        ts_epoch INTEGER NOT NULL DEFAULT 0,
        tps INTEGER,
        cpu_percent REAL,
        ram_mb REAL,
        ram_percent REAL,
        view_radius INTEGER,
        players_online INTEGER DEFAULT 0
    ))");
    d.exec(R"(CREATE TABLE IF NOT EXISTS player_events (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        timestamp TEXT NOT NULL,
        ts_epoch INTEGER NOT NULL DEFAULT 0,
        uuid TEXT NOT NULL,
        name TEXT NOT NULL,
        event_type TEXT NOT NULL,
        world TEXT
    ))");
    d.exec(R"(CREATE TABLE IF NOT EXISTS metadata (
        key TEXT PRIMARY KEY,
        value TEXT
    ))");

    // Databases created by earlier worker versions lack these columns.
    if (!has_column(d, "performance", "view_radius")) {
        log::info("[store] migrating: performance.view_radius");
        d.exec("ALTER TABLE performance ADD COLUMN view_radius INTEGER");
    }
    for (const char *table : {"performance", "player_events"}) {
        if (!has_column(d, table, "ts_epoch")) {
            log::info("[store] migrating: {}.ts_epoch", table);
            d.exec(std::string("ALTER TABLE ") + table + " ADD COLUMN ts_epoch INTEGER NOT NULL DEFAULT 0");
            d.exec(
                std::string("UPDATE ") + table
                + " SET ts_epoch = COALESCE(CAST(strftime('%s', timestamp) AS INTEGER), 0) WHERE ts_epoch = 0");
        }
    }
    if (!has_index(d, "idx_events_unique")) {
        // Older versions re-appended the boundary event on every scan.
        d.exec(R"(DELETE FROM player_events WHERE id NOT IN (
            SELECT MIN(id) FROM player_events GROUP BY timestamp, uuid, event_type))");
        if (const int removed = d.changes(); removed > 0) {
            log::info("[store] migrating: removed {} duplicate player_events rows", removed);
            metrics::runtime().events_deduplicated.fetch_add(static_cast<uint64_t>(removed), std::memory_order_relaxed);
        }
        d.exec("CREATE UNIQUE INDEX idx_events_unique ON player_events(timestamp, uuid, event_type)");
    }
    d.exec("CREATE INDEX IF NOT EXISTS idx_perf_epoch ON performance(ts_epoch)");
    d.exec("CREATE INDEX IF NOT EXISTS idx_events_epoch ON player_events(ts_epoch)");
    d.exec("CREATE INDEX IF NOT EXISTS idx_players_online ON players(online)");
    tx.commit();
}

std::optional<PlayerRecord> Store::find_player(const std::string &player_id)
{
    Statement st(
        db(),
        "SELECT uuid, name, online, last_login, last_logout, world, total_playtime_seconds FROM players WHERE uuid = ?");
    st.bind(1, player_id);
    if (!st.step())
        return std::nullopt;
    return read_player(st);
}

void Store::upsert_player(const PlayerRecord &rec)
{
    Statement st(db(), R"(INSERT INTO players (uuid, name, online, last_login, last_logout, world, total_playtime_seconds)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(uuid) DO UPDATE SET
            name = excluded.name,
            online = excluded.online,
            last_login = excluded.last_login,
            last_logout = excluded.last_logout,
            world = excluded.world,
            total_playtime_seconds = excluded.total_playtime_seconds)");
    st.bind(1, rec.player_id)
        .bind(2, rec.display_name)
        .bind(3, rec.online ? 1 : 0)
        .bind(4, rec.last_login)
        .bind(5, rec.last_logout)
        .bind(6, rec.current_world)
        .bind(7, rec.cumulative_playtime_seconds);
    st.run();
}

void Store::merge_player(const PlayerRecord &rec)
{
    Statement st(db(), R"(INSERT INTO players (uuid, name, online, last_login, last_logout, world)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(uuid) DO UPDATE SET
            name = excluded.name,
            online = excluded.online,
            last_login = COALESCE(excluded.last_login, players.last_login),
            last_logout = COALESCE(excluded.last_logout, players.last_logout),
            world = COALESCE(excluded.world, players.world))");
    st.bind(1, rec.player_id)
        .bind(2, rec.display_name)
        .bind(3, rec.online ? 1 : 0)
        .bind(4, rec.last_login)
        .bind(5, rec.last_logout)
        .bind(6, rec.current_world);
    st.run();
}

std::vector<PlayerRecord> Store::players()
{
    Statement st(
        db(),
        "SELECT uuid, name, online, last_login, last_logout, world, total_playtime_seconds FROM players ORDER BY uuid");
    std::vector<PlayerRecord> out;
    while (st.step())
        out.push_back(read_player(st));
    return out;
}

int64_t Store::count_online()
{
    Statement st(db(), "SELECT COUNT(*) FROM players WHERE online = 1");
    return st.step() ? st.column_int64(0) : 0;
}

bool Store::append_event(const Event &ev)
{
    Statement st(db(), R"(INSERT OR IGNORE INTO player_events (timestamp, ts_epoch, uuid, name, event_type, world)
        VALUES (?, ?, ?, ?, ?, ?))");
    st.bind(1, ev.timestamp.text)
        .bind(2, timeutil::to_epoch_seconds(ev.timestamp.instant))
        .bind(3, ev.player_id)
        .bind(4, ev.display_name)
        .bind(5, std::string(event_kind_name(ev.kind)))
        .bind(6, ev.world);
    st.run();
    return m_db->changes() > 0;
}

std::vector<EventLogEntry> Store::events()
{
    Statement st(db(), "SELECT id, timestamp, uuid, name, event_type, world FROM player_events ORDER BY id");
    std::vector<EventLogEntry> out;
    while (st.step()) {
        EventLogEntry e;
        e.id = st.column_int64(0);
        e.timestamp = st.column_text(1);
        e.player_id = st.column_text(2);
        e.display_name = st.column_text(3);
        auto kind = parse_event_kind(st.column_text(4));
        if (!kind)
            throw StorageError("player_events row " + std::to_string(e.id) + " has unknown event_type");
        e.kind = *kind;
        e.world = st.column_opt_text(5);
        out.push_back(std::move(e));
    }
    return out;
}

std::optional<std::string> Store::checkpoint()
{
    Statement st(db(), "SELECT value FROM metadata WHERE key = ?");
    st.bind(1, std::string(k_checkpoint_key));
    if (!st.step())
        return std::nullopt;
    return st.column_opt_text(0);
}

void Store::set_checkpoint(const std::string &ts)
{
    Statement st(db(), R"(INSERT INTO metadata (key, value) VALUES (?, ?)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value)");
    st.bind(1, std::string(k_checkpoint_key)).bind(2, ts);
    st.run();
}

int64_t Store::insert_sample(const PerformanceSample &s)
{
    Statement st(db(), R"(INSERT INTO performance
        (timestamp, ts_epoch, tps, cpu_percent, ram_mb, ram_percent, view_radius, players_online)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?))");
    st.bind(1, s.timestamp)
        .bind(2, s.ts_epoch)
        .bind(3, s.tps)
        .bind(4, s.cpu_percent)
        .bind(5, s.ram_mb)
        .bind(6, s.ram_percent)
        .bind(7, s.view_radius)
        .bind(8, s.players_online);
    st.run();
    return sqlite3_last_insert_rowid(m_db->handle());
}

std::vector<PerformanceSample> Store::samples()
{
    Statement st(db(), R"(SELECT id, timestamp, ts_epoch, tps, cpu_percent, ram_mb, ram_percent, view_radius,
        players_online FROM performance ORDER BY id)");
    std::vector<PerformanceSample> out;
    while (st.step()) {
        PerformanceSample s;
        s.id = st.column_int64(0);
        s.timestamp = st.column_text(1);
        s.ts_epoch = st.column_int64(2);
        if (auto v = st.column_opt_int64(3))
            s.tps = static_cast<int>(*v);
        s.cpu_percent = st.column_opt_double(4);
        s.ram_mb = st.column_opt_double(5);
        s.ram_percent = st.column_opt_double(6);
        if (auto v = st.column_opt_int64(7))
            s.view_radius = static_cast<int>(*v);
        s.players_online = st.column_int64(8);
        out.push_back(std::move(s));
    }
    return out;
}

int Store::delete_samples_before(int64_t epoch_seconds)
{
    Statement st(db(), "DELETE FROM performance WHERE ts_epoch < ?");
    st.bind(1, epoch_seconds);
    st.run();
    return m_db->changes();
}

int Store::delete_events_before(int64_t epoch_seconds)
{
    Statement st(db(), "DELETE FROM player_events WHERE ts_epoch < ?");
    st.bind(1, epoch_seconds);
    st.run();
    return m_db->changes();
}

void Store::compact()
{
    auto &d = db();
    int log_frames = 0, checkpointed = 0;
    int rc = sqlite3_wal_checkpoint_v2(d.handle(), nullptr, SQLITE_CHECKPOINT_PASSIVE, &log_frames, &checkpointed);
    if (rc != SQLITE_OK && rc != SQLITE_BUSY)
        d.raise("wal checkpoint");
    log::debug("[store] wal checkpoint frames={} checkpointed={}", log_frames, checkpointed);
}

} // namespace hdw::store
