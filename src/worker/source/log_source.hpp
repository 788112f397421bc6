// SPDX-License-Identifier: Apache-2.0
// log_source.hpp
// Query interface over the game server's log stream.
#pragma once

#include "common/time_util.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hdw::source {

class QueryError : public std::runtime_error
{
public:
    enum class Kind
    {
        timeout,
        failure
    };

    QueryError(Kind kind, const std::string &what) : std::runtime_error(what), m_kind(kind) {}
    Kind kind() const noexcept { return m_kind; }

private:
    Kind m_kind;
};

// Either a time window (since/until) or the newest N lines.
struct LogQuery
{
    std::optional<timeutil::time_point> since;
    std::optional<timeutil::time_point> until;
    std::optional<size_t> last_lines;
    std::chrono::seconds timeout{30};

    static LogQuery window(timeutil::time_point since, timeutil::time_point until, std::chrono::seconds timeout)
    {
        LogQuery q;
        q.since = since;
        q.until = until;
        q.timeout = timeout;
        return q;
    }

    static LogQuery tail(size_t lines, std::chrono::seconds timeout)
    {
        LogQuery q;
        q.last_lines = lines;
        q.timeout = timeout;
        return q;
    }
};

class ILogSource
{
public:
    virtual ~ILogSource() = default;
    // Lines oldest first. Throws QueryError on timeout or a failed query.
    virtual std::vector<std::string> query(const LogQuery &q) = 0;
};

// journalctl -u <unit>, short-iso output.
class JournalLogSource : public ILogSource
{
public:
    explicit JournalLogSource(std::string unit) : m_unit(std::move(unit)) {}
    std::vector<std::string> query(const LogQuery &q) override;

    // Exposed for tests.
    std::vector<std::string> build_argv(const LogQuery &q) const;

private:
    std::string m_unit;
};

} // namespace hdw::source
