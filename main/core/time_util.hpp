#pragma once

#include <ctime>
#include <string>

namespace core {

// Parse an ISO 8601 timestamp ("2024-10-22T18:00:00", optional fractional
// seconds, optional "Z" or +hh:mm / -hh:mm offset). Timestamps without an
// offset are taken as UTC. Returns false on any syntax or range error.
bool parse_iso8601(const char *text, std::time_t &out_utc);

// Seconds since the epoch for a proleptic Gregorian UTC date/time.
std::time_t utc_from_fields(int year, int month, int day, int hour, int minute, int second);

// Truncate a UTC instant to 00:00:00 of the same UTC day.
std::time_t utc_midnight(std::time_t t);

// "YYYY-MM-DDTHH:MM:SS" in UTC.
std::string format_utc(std::time_t t);

// True for a well-formed POSIX TZ string ("EST5EDT,M3.2.0,M11.1.0",
// "IST-5:30", "<+04>-4").
bool is_posix_tz_rule(const std::string &rule);

// Map an IANA zone name from the built-in table, or a POSIX TZ string, to the
// rule newlib understands. Returns false for anything else, since newlib has
// no zoneinfo database and would silently fall back to UTC.
bool resolve_time_zone(const std::string &zone, std::string &posix);

// Like resolve_time_zone, but returns unknown names unchanged.
std::string posix_tz_for(const std::string &zone);

// Switches the process TZ for the lifetime of the object.
class ScopedTimeZone {
public:
    explicit ScopedTimeZone(const std::string &zone);
    ~ScopedTimeZone();

    ScopedTimeZone(const ScopedTimeZone &) = delete;
    ScopedTimeZone &operator=(const ScopedTimeZone &) = delete;

private:
    bool had_previous_ = false;
    std::string previous_;
};

} // namespace core
