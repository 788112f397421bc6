// SPDX-License-Identifier: Apache-2.0
// Domain records shared by the extractor, reconciler, sampler and store.
#pragma once

#include "common/time_util.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hdw {

enum class EventKind
{
    join,
    leave
};

const char *event_kind_name(EventKind kind) noexcept;
std::optional<EventKind> parse_event_kind(std::string_view name) noexcept;

// Source timestamp: the text as it appears in the log line plus its parsed instant.
struct Timestamp
{
    std::string text;
    timeutil::time_point instant{};
};

struct Event
{
    Timestamp timestamp;
    std::string player_id;
    std::string display_name;
    EventKind kind{EventKind::join};
    std::optional<std::string> world; // join only
};

struct PlayerRecord
{
    std::string player_id;
    std::string display_name;
    bool online{false};
    std::optional<std::string> last_login;
    std::optional<std::string> last_logout;
    std::optional<std::string> current_world;
    int64_t cumulative_playtime_seconds{0};
};

struct EventLogEntry
{
    int64_t id{0};
    std::string timestamp;
    std::string player_id;
    std::string display_name;
    EventKind kind{EventKind::join};
    std::optional<std::string> world;
};

// Unset numeric fields mean "not observed this tick", never zero.
struct PerformanceSample
{
    int64_t id{0};
    std::string timestamp;
    int64_t ts_epoch{0};
    std::optional<int> tps;
    std::optional<double> cpu_percent;
    std::optional<double> ram_mb;
    std::optional<double> ram_percent;
    std::optional<int> view_radius;
    int64_t players_online{0};
};

} // namespace hdw
