// SPDX-License-Identifier: Apache-2.0
// event_extractor.hpp
// Stateless extraction of typed events and metric readings from raw game server log lines.
#pragma once

#include "worker/model.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace hdw::extract {

// Matching strategy for one event kind. Implementations hold no mutable state.
class IEventPattern
{
public:
    virtual ~IEventPattern() = default;
    virtual std::optional<Event> match(const std::string &line) const = 0;
};

// <ISO timestamp> ... Adding player '<name>' to world '<world>' at location ... (<player_id>)
class RegexJoinPattern : public IEventPattern
{
public:
    RegexJoinPattern();
    std::optional<Event> match(const std::string &line) const override;

private:
    std::regex m_re;
};

// <ISO timestamp> ... Removing player '<name>[ (suffix)]' ... (<player_id>)
class RegexLeavePattern : public IEventPattern
{
public:
    RegexLeavePattern();
    std::optional<Event> match(const std::string &line) const override;

private:
    std::regex m_re;
};

class EventExtractor
{
public:
    explicit EventExtractor(std::vector<std::unique_ptr<IEventPattern>> patterns);

    // Events in source-line order. Patterns are tried in registration order; first match wins.
    std::vector<Event> extract(const std::vector<std::string> &lines) const;

private:
    std::vector<std::unique_ptr<IEventPattern>> m_patterns;
};

// Join then leave regex patterns.
EventExtractor make_default_extractor();

struct MetricReadings
{
    std::optional<int> tps;
    std::optional<int> view_radius;
};

// Scans newest-to-oldest (lines are given oldest first) and keeps the most recent value of each
// field independently. Stops once both are found.
MetricReadings scan_metrics(const std::vector<std::string> &lines);

} // namespace hdw::extract
