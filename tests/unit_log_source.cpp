// SPDX-License-Identifier: Apache-2.0
#include "worker/source/log_source.hpp"

#include <cassert>
#include <iostream>

using namespace hdw;

int main()
{
    source::JournalLogSource journal("hytale");

    auto since = *timeutil::parse_iso8601("2024-01-01T10:00:00Z");
    auto until = *timeutil::parse_iso8601("2024-01-01T10:00:10+02:00");
    auto argv = journal.build_argv(source::LogQuery::window(since, until, std::chrono::seconds(30)));
    std::vector<std::string> expected{
        "journalctl",
        "-u",
        "hytale",
        "--no-pager",
        "-q",
        "-o",
        "short-iso",
        "--since",
        "2024-01-01 10:00:00 UTC",
        "--until",
        "2024-01-01 08:00:10 UTC"};
    assert(argv == expected);

    auto tail = journal.build_argv(source::LogQuery::tail(200, std::chrono::seconds(10)));
    std::vector<std::string> expected_tail{
        "journalctl", "-u", "hytale", "--no-pager", "-q", "-o", "short-iso", "-n", "200"};
    assert(tail == expected_tail);

    source::QueryError err(source::QueryError::Kind::timeout, "slow");
    assert(err.kind() == source::QueryError::Kind::timeout);
    assert(std::string(err.what()) == "slow");

    std::cout << "unit_log_source OK" << std::endl;
    return 0;
}
