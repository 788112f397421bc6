// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "worker/probe/process_probe.hpp"
#include "worker/source/log_source.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace hdw::test {

// Returns scripted line batches in order; an empty script yields no lines.
class ScriptedLogSource : public source::ILogSource
{
public:
    std::deque<std::vector<std::string>> batches;
    std::vector<source::LogQuery> queries;
    bool fail{false};

    std::vector<std::string> query(const source::LogQuery &q) override
    {
        queries.push_back(q);
        if (fail)
            throw source::QueryError(source::QueryError::Kind::timeout, "journalctl timed out");
        if (batches.empty())
            return {};
        auto lines = std::move(batches.front());
        batches.pop_front();
        return lines;
    }
};

class FixedPidResolver : public probe::IPidResolver
{
public:
    std::optional<pid_t> pid;
    std::optional<pid_t> resolve() override { return pid; }
};

class FixedResourceProbe : public probe::IResourceProbe
{
public:
    std::optional<probe::ResourceUsage> usage;
    std::optional<probe::ResourceUsage> sample(pid_t) override { return usage; }
};

} // namespace hdw::test
