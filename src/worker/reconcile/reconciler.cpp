// SPDX-License-Identifier: Apache-2.0
#include "worker/reconcile/reconciler.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace hdw::reconcile {

namespace {
std::optional<timeutil::time_point> instant_of(const std::optional<std::string> &text)
{
    if (!text)
        return std::nullopt;
    return timeutil::parse_iso8601(*text);
}
} // namespace

std::optional<PlayerRecord> apply_event(const std::optional<PlayerRecord> &current, const Event &ev, bool first_seen)
{
    if (ev.kind == EventKind::join) {
        PlayerRecord rec = current.value_or(PlayerRecord{});
        rec.player_id = ev.player_id;
        rec.display_name = ev.display_name;
        rec.online = true;
        rec.last_login = ev.timestamp.text;
        rec.current_world = ev.world;
        return rec;
    }

    if (!current)
        return std::nullopt;
    PlayerRecord rec = *current;
    // A replayed leave (already in the history) must not count the same session twice.
    if (first_seen && rec.online) {
        const auto login = instant_of(rec.last_login);
        if (login && *login <= ev.timestamp.instant) {
            rec.cumulative_playtime_seconds +=
                std::chrono::duration_cast<std::chrono::seconds>(ev.timestamp.instant - *login).count();
        }
    }
    rec.online = false;
    rec.last_logout = ev.timestamp.text;
    return rec;
}

std::map<std::string, PlayerRecord> fold_backfill(const std::vector<Event> &events)
{
    std::map<std::string, PlayerRecord> players;
    for (const auto &ev : events) {
        auto it = players.find(ev.player_id);
        if (it == players.end()) {
            PlayerRecord fresh;
            fresh.player_id = ev.player_id;
            fresh.display_name = ev.display_name;
            it = players.emplace(ev.player_id, std::move(fresh)).first;
        }
        auto &p = it->second;
        if (ev.kind == EventKind::join) {
            p.online = true;
            p.last_login = ev.timestamp.text;
            if (ev.world)
                p.current_world = ev.world;
            p.display_name = ev.display_name;
        } else {
            p.online = false;
            p.last_logout = ev.timestamp.text;
        }
    }
    return players;
}

Reconciler::Reconciler(
    store::Store &store,
    source::ILogSource &logs,
    const extract::EventExtractor &extractor,
    ReconcilerConfig cfg,
    timeutil::now_fn now)
    : m_store(store), m_logs(logs), m_extractor(extractor), m_cfg(cfg), m_now(std::move(now))
{}

timeutil::time_point Reconciler::scan_start()
{
    const auto now = m_now();
    auto cp = m_store.checkpoint();
    if (cp) {
        if (auto instant = timeutil::parse_iso8601(*cp))
            return *instant;
        log::warn("[scan] checkpoint '{}' is not a timestamp; rescanning lookback window", *cp);
    }
    return now - m_cfg.lookback;
}

IngestResult Reconciler::ingest_tick()
{
    auto &rt = metrics::runtime();
    IngestResult result;
    const auto until = m_now();
    const auto since = scan_start();

    std::vector<std::string> lines;
    try {
        lines = m_logs.query(source::LogQuery::window(since, until, m_cfg.query_timeout));
    } catch (const source::QueryError &ex) {
        rt.query_failures.fetch_add(1, std::memory_order_relaxed);
        log::warn("[scan] log query failed, tick skipped: {}", ex.what());
        result.skipped = true;
        return result;
    }

    auto events = m_extractor.extract(lines);
    result.extracted = events.size();
    rt.events_extracted.fetch_add(events.size(), std::memory_order_relaxed);
    if (events.empty()) {
        result.checkpoint = m_store.checkpoint();
        log::debug("[scan] {} lines, no player events", lines.size());
        return result;
    }

    result.new_entries = merge(events);
    // Source-line order, not timestamp order.
    result.checkpoint_advanced = advance_checkpoint(events.back().timestamp);
    result.checkpoint = m_store.checkpoint();
    if (result.new_entries > 0)
        log::info("[scan] processed {} player events ({} new)", events.size(), result.new_entries);
    else
        log::debug("[scan] processed {} player events (0 new)", events.size());
    return result;
}

size_t Reconciler::merge(const std::vector<Event> &events)
{
    auto &rt = metrics::runtime();
    size_t added = 0;
    for (const auto &ev : events) {
        store::Transaction tx(m_store.db());
        const bool first_seen = m_store.append_event(ev);
        if (first_seen)
            ++added;
        if (auto next = apply_event(m_store.find_player(ev.player_id), ev, first_seen))
            m_store.upsert_player(*next);
        else
            log::debug("[scan] leave for unknown player {} ({})", ev.player_id, ev.display_name);
        tx.commit();
        rt.events_merged.fetch_add(1, std::memory_order_relaxed);
    }
    rt.events_new.fetch_add(added, std::memory_order_relaxed);
    return added;
}

bool Reconciler::advance_checkpoint(const Timestamp &ts)
{
    auto current = m_store.checkpoint();
    if (current) {
        if (*current == ts.text)
            return false;
        auto cur_instant = timeutil::parse_iso8601(*current);
        if (cur_instant && ts.instant < *cur_instant) {
            log::warn("[scan] last event {} is older than checkpoint {}; checkpoint kept", ts.text, *current);
            return false;
        }
    }
    m_store.set_checkpoint(ts.text);
    metrics::runtime().checkpoint_advances.fetch_add(1, std::memory_order_relaxed);
    return true;
}

size_t Reconciler::backfill()
{
    const auto now = m_now();
    log::info("[backfill] scanning last {}h of logs", m_cfg.backfill_window.count());
    std::vector<std::string> lines;
    try {
        lines = m_logs.query(source::LogQuery::window(now - m_cfg.backfill_window, now, m_cfg.backfill_timeout));
    } catch (const source::QueryError &ex) {
        metrics::runtime().query_failures.fetch_add(1, std::memory_order_relaxed);
        log::warn("[backfill] log query failed: {}", ex.what());
        return 0;
    }

    auto players = fold_backfill(m_extractor.extract(lines));
    store::Transaction tx(m_store.db());
    for (const auto &[id, rec] : players)
        m_store.merge_player(rec);
    tx.commit();
    metrics::runtime().backfill_players.store(players.size(), std::memory_order_relaxed);
    log::info("[backfill] synced {} players", players.size());
    return players.size();
}

} // namespace hdw::reconcile
