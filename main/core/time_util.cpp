#include "core/time_util.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace core {

namespace {

struct TzAlias {
    const char *iana;
    const char *posix;
};

// Newlib has no zoneinfo database; keep the zones people actually configure.
const TzAlias kTzAliases[] = {
    {"America/Los_Angeles", "PST8PDT,M3.2.0,M11.1.0"},
    {"America/Vancouver", "PST8PDT,M3.2.0,M11.1.0"},
    {"America/Denver", "MST7MDT,M3.2.0,M11.1.0"},
    {"America/Edmonton", "MST7MDT,M3.2.0,M11.1.0"},
    {"America/Phoenix", "MST7"},
    {"America/Chicago", "CST6CDT,M3.2.0,M11.1.0"},
    {"America/New_York", "EST5EDT,M3.2.0,M11.1.0"},
    {"America/Toronto", "EST5EDT,M3.2.0,M11.1.0"},
    {"America/Halifax", "AST4ADT,M3.2.0,M11.1.0"},
    {"America/Mexico_City", "CST6"},
    {"America/Sao_Paulo", "<-03>3"},
    {"America/Anchorage", "AKST9AKDT,M3.2.0,M11.1.0"},
    {"Pacific/Honolulu", "HST10"},
    {"Europe/London", "GMT0BST,M3.5.0/1,M10.5.0"},
    {"Europe/Berlin", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Paris", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Madrid", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Amsterdam", "CET-1CEST,M3.5.0,M10.5.0/3"},
    {"Europe/Kyiv", "EET-2EEST,M3.5.0/3,M10.5.0/4"},
    {"Europe/Moscow", "MSK-3"},
    {"Asia/Dubai", "<+04>-4"},
    {"Asia/Kolkata", "IST-5:30"},
    {"Asia/Singapore", "<+08>-8"},
    {"Asia/Shanghai", "CST-8"},
    {"Asia/Tokyo", "JST-9"},
    {"Australia/Sydney", "AEST-10AEDT,M10.1.0,M4.1.0/3"},
    {"Pacific/Auckland", "NZST-12NZDT,M9.5.0,M4.1.0/3"},
    {"UTC", "UTC0"},
    {"Etc/UTC", "UTC0"},
};

// Howard Hinnant's days_from_civil.
long long days_from_civil(int y, unsigned m, unsigned d)
{
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

bool is_leap(int y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m)
{
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y))
        return 29;
    return kDays[m - 1];
}

// Reads exactly `width` digits starting at s[pos].
bool read_digits(const char *s, size_t &pos, int width, int &out)
{
    int v = 0;
    for (int i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (c < '0' || c > '9')
            return false;
        v = v * 10 + (c - '0');
    }
    pos += static_cast<size_t>(width);
    out = v;
    return true;
}

bool expect(const char *s, size_t &pos, char c)
{
    if (s[pos] != c)
        return false;
    ++pos;
    return true;
}

bool is_alpha(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

// Reads 1..max_width digits, value at most `limit`.
bool read_number(const char *s, size_t &pos, int max_width, int limit)
{
    int v = 0;
    int n = 0;
    while (n < max_width && is_digit(s[pos])) {
        v = v * 10 + (s[pos] - '0');
        ++pos;
        ++n;
    }
    return n > 0 && v <= limit;
}

// "EST" or "<+0530>"
bool read_tz_name(const char *s, size_t &pos)
{
    if (s[pos] == '<') {
        size_t start = ++pos;
        while (is_alpha(s[pos]) || is_digit(s[pos]) || s[pos] == '+' || s[pos] == '-')
            ++pos;
        if (s[pos] != '>' || pos - start < 3)
            return false;
        ++pos;
        return true;
    }
    size_t start = pos;
    while (is_alpha(s[pos]))
        ++pos;
    return pos - start >= 3;
}

// [+|-]hh[:mm[:ss]]
bool read_tz_offset(const char *s, size_t &pos, int hour_limit)
{
    if (s[pos] == '+' || s[pos] == '-')
        ++pos;
    if (!read_number(s, pos, 3, hour_limit))
        return false;
    for (int i = 0; i < 2 && s[pos] == ':'; ++i) {
        ++pos;
        if (!read_number(s, pos, 2, 59))
            return false;
    }
    return true;
}

// Jn | n | Mm.w.d, then an optional /time.
bool read_tz_rule(const char *s, size_t &pos)
{
    if (s[pos] == 'M') {
        ++pos;
        if (!read_number(s, pos, 2, 12) || !expect(s, pos, '.') ||
            !read_number(s, pos, 1, 5) || !expect(s, pos, '.') ||
            !read_number(s, pos, 1, 6))
            return false;
    } else {
        if (s[pos] == 'J')
            ++pos;
        if (!read_number(s, pos, 3, 365))
            return false;
    }
    if (s[pos] == '/') {
        ++pos;
        return read_tz_offset(s, pos, 167);
    }
    return true;
}

} // namespace

std::time_t utc_from_fields(int year, int month, int day, int hour, int minute, int second)
{
    long long days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    return static_cast<std::time_t>(days * 86400LL + hour * 3600LL + minute * 60LL + second);
}

bool parse_iso8601(const char *text, std::time_t &out_utc)
{
    if (!text)
        return false;

    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, pos, 4, year) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, month) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, day))
        return false;

    if (text[pos] != 'T' && text[pos] != ' ')
        return false;
    ++pos;

    if (!read_digits(text, pos, 2, hour) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, minute))
        return false;
    if (text[pos] == ':') {
        ++pos;
        if (!read_digits(text, pos, 2, second))
            return false;
        if (text[pos] == '.' || text[pos] == ',') {
            ++pos;
            size_t frac_start = pos;
            while (text[pos] >= '0' && text[pos] <= '9')
                ++pos;
            if (pos == frac_start)
                return false;
        }
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month))
        return false;
    if (hour > 23 || minute > 59 || second > 59)
        return false;

    long offset_s = 0;
    if (text[pos] == 'Z' || text[pos] == 'z') {
        ++pos;
    } else if (text[pos] == '+' || text[pos] == '-') {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int oh = 0, om = 0;
        if (!read_digits(text, pos, 2, oh))
            return false;
        if (text[pos] == ':')
            ++pos;
        if (!read_digits(text, pos, 2, om))
            return false;
        if (oh > 23 || om > 59)
            return false;
        offset_s = sign * (oh * 3600L + om * 60L);
    }

    if (text[pos] != '\0')
        return false;

    out_utc = utc_from_fields(year, month, day, hour, minute, second) - offset_s;
    return true;
}

std::time_t utc_midnight(std::time_t t)
{
    std::time_t rem = t % 86400;
    if (rem < 0)
        rem += 86400;
    return t - rem;
}

std::string format_utc(std::time_t t)
{
    struct tm tm_utc {};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_utc);
    return buf;
}

bool is_posix_tz_rule(const std::string &rule)
{
    const char *s = rule.c_str();
    size_t pos = 0;
    if (!read_tz_name(s, pos) || !read_tz_offset(s, pos, 24))
        return false;
    if (s[pos] == '\0')
        return true;

    if (!read_tz_name(s, pos))
        return false;
    if (s[pos] != ',' && s[pos] != '\0' && !read_tz_offset(s, pos, 24))
        return false;
    if (s[pos] == '\0')
        return true;

    if (!expect(s, pos, ',') || !read_tz_rule(s, pos) ||
        !expect(s, pos, ',') || !read_tz_rule(s, pos))
        return false;
    return s[pos] == '\0';
}

bool resolve_time_zone(const std::string &zone, std::string &posix)
{
    for (const auto &alias : kTzAliases) {
        if (zone == alias.iana) {
            posix = alias.posix;
            return true;
        }
    }
    if (!is_posix_tz_rule(zone))
        return false;
    posix = zone;
    return true;
}

std::string posix_tz_for(const std::string &zone)
{
    for (const auto &alias : kTzAliases) {
        if (zone == alias.iana)
            return alias.posix;
    }
    return zone;
}

ScopedTimeZone::ScopedTimeZone(const std::string &zone)
{
    const char *prev = std::getenv("TZ");
    if (prev) {
        had_previous_ = true;
        previous_ = prev;
    }
    setenv("TZ", posix_tz_for(zone).c_str(), 1);
    tzset();
}

ScopedTimeZone::~ScopedTimeZone()
{
    if (had_previous_)
        setenv("TZ", previous_.c_str(), 1);
    else
        unsetenv("TZ");
    tzset();
}

} // namespace core
