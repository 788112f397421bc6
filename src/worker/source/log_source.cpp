// SPDX-License-Identifier: Apache-2.0
#include "worker/source/log_source.hpp"

#include "common/logger.hpp"
#include "worker/source/command.hpp"

namespace hdw::source {

std::vector<std::string> JournalLogSource::build_argv(const LogQuery &q) const
{
    std::vector<std::string> argv{"journalctl", "-u", m_unit, "--no-pager", "-q", "-o", "short-iso"};
    if (q.last_lines) {
        argv.push_back("-n");
        argv.push_back(std::to_string(*q.last_lines));
    }
    if (q.since) {
        argv.push_back("--since");
        argv.push_back(timeutil::format_journal(*q.since));
    }
    if (q.until) {
        argv.push_back("--until");
        argv.push_back(timeutil::format_journal(*q.until));
    }
    return argv;
}

std::vector<std::string> JournalLogSource::query(const LogQuery &q)
{
    auto argv = build_argv(q);
    CommandResult res;
    try {
        res = run_command(argv, std::chrono::duration_cast<std::chrono::milliseconds>(q.timeout));
    } catch (const CommandTimeout &ex) {
        throw QueryError(QueryError::Kind::timeout, ex.what());
    } catch (const CommandError &ex) {
        throw QueryError(QueryError::Kind::failure, ex.what());
    }
    if (res.exit_code != 0)
        throw QueryError(QueryError::Kind::failure, "journalctl exited with " + std::to_string(res.exit_code));
    auto lines = split_lines(res.output);
    log::debug("[journal] unit={} lines={}", m_unit, lines.size());
    return lines;
}

} // namespace hdw::source
