// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace hdw::timeutil {

using clock = std::chrono::system_clock;
using time_point = clock::time_point;

// Injected wall clock; production passes clock::now, tests pass a fixed instant.
using now_fn = std::function<time_point()>;

// Parses YYYY-MM-DDTHH:MM:SS with optional fraction and optional Z / +HH:MM / +HHMM offset.
// A missing offset is read as UTC. Returns nullopt for anything else.
std::optional<time_point> parse_iso8601(std::string_view text);

// 2024-01-01T10:00:00+00:00
std::string format_iso8601_utc(time_point tp);

// 2024-01-01 10:00:00 UTC (accepted by journalctl --since/--until)
std::string format_journal(time_point tp);

int64_t to_epoch_seconds(time_point tp);

} // namespace hdw::timeutil
