// SPDX-License-Identifier: Apache-2.0
#include "common/time_util.hpp"

#include <cassert>
#include <iostream>

using namespace hdw::timeutil;

int main()
{
    auto base = parse_iso8601("2024-01-01T10:00:00");
    assert(base);
    assert(to_epoch_seconds(*base) == 1704103200);

    // Offsets in both journal (+0000) and RFC 3339 (+00:00) spelling.
    auto z = parse_iso8601("2024-01-01T10:00:00Z");
    auto colon = parse_iso8601("2024-01-01T12:00:00+02:00");
    auto compact = parse_iso8601("2024-01-01T05:00:00-0500");
    assert(z && colon && compact);
    assert(*z == *base && *colon == *base && *compact == *base);

    auto frac = parse_iso8601("2024-01-01T10:00:00.250+00:00");
    assert(frac);
    assert(std::chrono::duration_cast<std::chrono::milliseconds>(*frac - *base).count() == 250);

    assert(!parse_iso8601(""));
    assert(!parse_iso8601("2024-01-01 10:00:00"));
    assert(!parse_iso8601("2024-13-01T10:00:00"));
    assert(!parse_iso8601("2024-01-01T10:00:00+0"));
    assert(!parse_iso8601("2024-01-01T10:00:00 trailing"));

    assert(format_iso8601_utc(*colon) == "2024-01-01T10:00:00+00:00");
    assert(format_journal(*base) == "2024-01-01 10:00:00 UTC");
    // Formatted output parses back to the same instant.
    assert(*parse_iso8601(format_iso8601_utc(*base)) == *base);

    std::cout << "unit_time_util OK" << std::endl;
    return 0;
}
