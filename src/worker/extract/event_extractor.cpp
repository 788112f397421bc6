// SPDX-License-Identifier: Apache-2.0
#include "worker/extract/event_extractor.hpp"

#include "common/logger.hpp"
#include "common/time_util.hpp"

#include <charconv>

namespace hdw::extract {

namespace {
// Timestamp group shared by both event shapes: the first ISO date-time token on the line
// (journalctl -o short-iso prefix).
constexpr const char *k_join_re =
    R"((\d{4}-\d{2}-\d{2}T\S+).*Adding player '([^']+)' to world '([^']+)' at location .+\(([A-Fa-f0-9-]+)\))";
constexpr const char *k_leave_re =
    R"((\d{4}-\d{2}-\d{2}T\S+).*Removing player '([^']+?)(?:\s*\([^)]+\))?'.*\(([A-Fa-f0-9-]+)\)\s*$)";
constexpr const char *k_tps_re = R"(Setting TPS of world \w+ to (\d+))";
constexpr const char *k_view_radius_re = R"((?:Initial view radius is|View radius.*?to) (\d+))";

std::optional<Timestamp> make_timestamp(const std::string &text)
{
    auto instant = timeutil::parse_iso8601(text);
    if (!instant) {
        log::debug("[extract] unparsable timestamp '{}', line skipped", text);
        return std::nullopt;
    }
    return Timestamp{text, *instant};
}

std::optional<int> to_int(const std::ssub_match &m)
{
    int value = 0;
    const char *first = &*m.first;
    const char *last = first + m.length();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last)
        return std::nullopt;
    return value;
}
} // namespace

RegexJoinPattern::RegexJoinPattern() : m_re(k_join_re, std::regex::ECMAScript | std::regex::optimize) {}

std::optional<Event> RegexJoinPattern::match(const std::string &line) const
{
    std::smatch m;
    if (!std::regex_search(line, m, m_re))
        return std::nullopt;
    auto ts = make_timestamp(m[1].str());
    if (!ts)
        return std::nullopt;
    Event ev;
    ev.timestamp = std::move(*ts);
    ev.display_name = m[2].str();
    ev.world = m[3].str();
    ev.player_id = m[4].str();
    ev.kind = EventKind::join;
    return ev;
}

RegexLeavePattern::RegexLeavePattern() : m_re(k_leave_re, std::regex::ECMAScript | std::regex::optimize) {}

std::optional<Event> RegexLeavePattern::match(const std::string &line) const
{
    std::smatch m;
    if (!std::regex_search(line, m, m_re))
        return std::nullopt;
    auto ts = make_timestamp(m[1].str());
    if (!ts)
        return std::nullopt;
    Event ev;
    ev.timestamp = std::move(*ts);
    ev.display_name = m[2].str();
    ev.player_id = m[3].str();
    ev.kind = EventKind::leave;
    return ev;
}

EventExtractor::EventExtractor(std::vector<std::unique_ptr<IEventPattern>> patterns) : m_patterns(std::move(patterns))
{}

std::vector<Event> EventExtractor::extract(const std::vector<std::string> &lines) const
{
    std::vector<Event> events;
    for (const auto &line : lines) {
        for (const auto &pattern : m_patterns) {
            if (auto ev = pattern->match(line)) {
                events.push_back(std::move(*ev));
                break;
            }
        }
    }
    return events;
}

EventExtractor make_default_extractor()
{
    std::vector<std::unique_ptr<IEventPattern>> patterns;
    patterns.push_back(std::make_unique<RegexJoinPattern>());
    patterns.push_back(std::make_unique<RegexLeavePattern>());
    return EventExtractor(std::move(patterns));
}

MetricReadings scan_metrics(const std::vector<std::string> &lines)
{
    static const std::regex tps_re(k_tps_re, std::regex::ECMAScript | std::regex::optimize);
    static const std::regex vr_re(k_view_radius_re, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);

    MetricReadings out;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::smatch m;
        if (!out.tps && std::regex_search(*it, m, tps_re))
            out.tps = to_int(m[1]);
        if (!out.view_radius && std::regex_search(*it, m, vr_re))
            out.view_radius = to_int(m[1]);
        if (out.tps && out.view_radius)
            break;
    }
    return out;
}

} // namespace hdw::extract
