// SPDX-License-Identifier: Apache-2.0
// Asynchronous structured logger (header-only).
// The worker runs as a systemd service, so output goes to stderr and ends up in journald.
// A background thread drains a bounded queue so a slow journal never stalls the control loop.
//  - HDW_LOG_LEVEL (debug|info|warn|error)
//  - HDW_LOG_JSON: one JSON object per line
//  - HDW_LOG_APP_ID: prefix for plain-text lines
//  - JOURNAL_STREAM (set by systemd): plain-text lines carry a <N> syslog priority instead of a
//    local timestamp, so journalctl -p filtering works
// shutdown() drains the queue; anything logged afterwards is written synchronously.

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace hdw::log {

enum class level
{
    debug = 0,
    info = 1,
    warn = 2,
    error = 3
};

namespace detail {

constexpr size_t k_queue_limit = 8192;

struct record
{
    level lv;
    std::chrono::system_clock::time_point ts;
    std::string msg;
};

struct sink_config
{
    bool json{false};
    bool journal{false};
    std::string app_id;
};

inline std::atomic<int> g_level{static_cast<int>(level::info)};
inline std::atomic<uint64_t> g_dropped{0};
inline std::mutex g_cfg_mtx;
inline sink_config g_cfg;

inline std::mutex g_q_mtx;
inline std::condition_variable g_q_cv;
inline std::deque<record> g_queue;
inline bool g_accepting{false}; // guarded by g_q_mtx
inline std::thread g_consumer;
inline std::once_flag g_atexit_once;

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

// sd-daemon priority prefixes
inline const char *journal_prefix(level lv)
{
    switch (lv) {
        case level::debug:
            return "<7>";
        case level::info:
            return "<6>";
        case level::warn:
            return "<4>";
        case level::error:
            return "<3>";
    }
    return "<6>";
}

inline level parse_level(std::string_view s, level fallback)
{
    std::string v(s);
    for (auto &c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "debug" || v == "trace")
        return level::debug;
    if (v == "info")
        return level::info;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return fallback;
}

inline std::string utc_stamp(std::chrono::system_clock::time_point tp)
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[40];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", static_cast<int>(ms));
    return buf;
}

inline void json_escape(std::ostream &os, std::string_view s)
{
    for (char c : s) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                    os << ' ';
                else
                    os << c;
        }
    }
}

inline void emit(const record &r)
{
    sink_config cfg;
    {
        std::lock_guard lk(g_cfg_mtx);
        cfg = g_cfg;
    }
    std::ostringstream line;
    if (cfg.json) {
        line << "{\"ts\":\"" << utc_stamp(r.ts) << "\",\"level\":\"" << level_name(r.lv) << "\"";
        if (!cfg.app_id.empty()) {
            line << ",\"app\":\"";
            json_escape(line, cfg.app_id);
            line << "\"";
        }
        line << ",\"msg\":\"";
        json_escape(line, r.msg);
        line << "\"}\n";
    } else if (cfg.journal) {
        line << journal_prefix(r.lv);
        if (!cfg.app_id.empty())
            line << cfg.app_id << ' ';
        line << r.msg << '\n';
    } else {
        if (!cfg.app_id.empty())
            line << cfg.app_id << ' ';
        line << utc_stamp(r.ts) << ' ' << level_name(r.lv) << ' ' << r.msg << '\n';
    }
    // One write per record keeps lines intact when the synchronous path races the consumer.
    std::cerr << line.str() << std::flush;
}

inline void drain()
{
    std::unique_lock lk(g_q_mtx);
    for (;;) {
        g_q_cv.wait(lk, [] { return !g_accepting || !g_queue.empty(); });
        if (g_queue.empty())
            return; // stopped and drained
        std::deque<record> batch;
        batch.swap(g_queue);
        lk.unlock();
        for (const auto &r : batch)
            emit(r);
        lk.lock();
    }
}

inline void configure_from_env()
{
    if (const char *lvl = std::getenv("HDW_LOG_LEVEL"))
        g_level.store(static_cast<int>(parse_level(lvl, level::info)), std::memory_order_relaxed);
    sink_config cfg;
    cfg.json = std::getenv("HDW_LOG_JSON") != nullptr;
    cfg.journal = std::getenv("JOURNAL_STREAM") != nullptr;
    if (const char *app = std::getenv("HDW_LOG_APP_ID"))
        cfg.app_id = app;
    std::lock_guard lk(g_cfg_mtx);
    g_cfg = std::move(cfg);
}

inline void stop_consumer()
{
    {
        std::lock_guard lk(g_q_mtx);
        if (!g_accepting)
            return;
        g_accepting = false;
    }
    g_q_cv.notify_all();
    if (g_consumer.joinable())
        g_consumer.join();
    if (uint64_t dropped = g_dropped.exchange(0))
        emit(record{level::warn, std::chrono::system_clock::now(), std::to_string(dropped) + " log lines dropped (queue full)"});
}

} // namespace detail

namespace detail_format {

template <typename T>
inline void put(std::ostringstream &os, const T &v)
{
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, bool>)
        os << (v ? "true" : "false");
    else if constexpr (std::is_same_v<U, const char *> || std::is_same_v<U, char *>)
        os << (v ? v : "");
    else if constexpr (std::is_floating_point_v<U>) {
        auto flags = os.flags();
        auto prec = os.precision();
        os.setf(std::ios::fixed, std::ios::floatfield);
        os.precision(2);
        os << v;
        os.flags(flags);
        os.precision(prec);
    } else
        os << v;
}

// Replaces each "{}" with the next argument; surplus arguments are appended space-separated.
template <typename... Args>
inline std::string format(std::string_view fmt, const Args &...args)
{
    std::ostringstream os;
    size_t pos = 0;
    auto next = [&](const auto &arg) {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos) {
            os << fmt.substr(pos) << ' ';
            put(os, arg);
            pos = fmt.size();
            return;
        }
        os << fmt.substr(pos, p - pos);
        put(os, arg);
        pos = p + 2;
    };
    (next(args), ...);
    if (pos < fmt.size())
        os << fmt.substr(pos);
    return os.str();
}

} // namespace detail_format

// Reads the HDW_LOG_* environment and starts the consumer thread. Safe to call again after the
// environment changed; the consumer is started only once.
inline void init()
{
    detail::configure_from_env();
    std::lock_guard lk(detail::g_q_mtx);
    if (detail::g_accepting || detail::g_consumer.joinable())
        return;
    detail::g_accepting = true;
    detail::g_consumer = std::thread([] { detail::drain(); });
    std::call_once(detail::g_atexit_once, [] { std::atexit([] { detail::stop_consumer(); }); });
}

inline void shutdown()
{
    detail::stop_consumer();
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::g_level.load(std::memory_order_relaxed);
}

// Before init() and after shutdown() records are written synchronously.
inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::record r{lv, std::chrono::system_clock::now(), std::string(msg)};
    {
        std::lock_guard lk(detail::g_q_mtx);
        if (detail::g_accepting) {
            if (detail::g_queue.size() >= detail::k_queue_limit) {
                detail::g_dropped.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            detail::g_queue.push_back(std::move(r));
            detail::g_q_cv.notify_one();
            return;
        }
    }
    detail::emit(r);
}

template <typename... Args>
inline void debug(std::string_view fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail_format::format(fmt, args...));
}

template <typename... Args>
inline void info(std::string_view fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail_format::format(fmt, args...));
}

template <typename... Args>
inline void warn(std::string_view fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail_format::format(fmt, args...));
}

template <typename... Args>
inline void error(std::string_view fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail_format::format(fmt, args...));
}

} // namespace hdw::log
