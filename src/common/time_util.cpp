// SPDX-License-Identifier: Apache-2.0
#include "common/time_util.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace hdw::timeutil {

namespace {
bool read_digits(std::string_view s, size_t pos, size_t count, int &out)
{
    if (pos + count > s.size())
        return false;
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

bool expect(std::string_view s, size_t pos, char c)
{
    return pos < s.size() && s[pos] == c;
}
} // namespace

std::optional<time_point> parse_iso8601(std::string_view text)
{
    // Fixed part: YYYY-MM-DDTHH:MM:SS (19 chars)
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    if (!read_digits(text, 0, 4, year) || !expect(text, 4, '-') || !read_digits(text, 5, 2, mon)
        || !expect(text, 7, '-') || !read_digits(text, 8, 2, day) || !expect(text, 10, 'T')
        || !read_digits(text, 11, 2, hour) || !expect(text, 13, ':') || !read_digits(text, 14, 2, min)
        || !expect(text, 16, ':') || !read_digits(text, 17, 2, sec))
        return std::nullopt;
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60)
        return std::nullopt;

    size_t pos = 19;
    std::chrono::microseconds frac{0};
    if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
        ++pos;
        int digits = 0;
        int64_t value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                value = value * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (; digits < 6; ++digits)
            value *= 10;
        frac = std::chrono::microseconds(value);
    }

    int offset_sec = 0;
    if (pos < text.size()) {
        char c = text[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            if (!read_digits(text, pos + 1, 2, oh))
                return std::nullopt;
            size_t mpos = pos + 3;
            if (expect(text, mpos, ':'))
                ++mpos;
            if (!read_digits(text, mpos, 2, om))
                return std::nullopt;
            if (oh > 23 || om > 59)
                return std::nullopt;
            offset_sec = (oh * 3600 + om * 60) * (c == '-' ? -1 : 1);
            pos = mpos + 2;
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size())
        return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t epoch = timegm(&tm);
    if (epoch == static_cast<std::time_t>(-1))
        return std::nullopt;
    auto tp = clock::from_time_t(epoch - offset_sec);
    return tp + std::chrono::duration_cast<clock::duration>(frac);
}

std::string format_iso8601_utc(time_point tp)
{
    std::time_t tt = clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &tm);
    return buf;
}

std::string format_journal(time_point tp)
{
    std::time_t tt = clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S UTC", &tm);
    return buf;
}

int64_t to_epoch_seconds(time_point tp)
{
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace hdw::timeutil
