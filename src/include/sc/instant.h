#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sc {

// A point in time as milliseconds since 1970-01-01T00:00:00Z.
struct Instant {
    int64_t millis = 0;

    bool operator==(const Instant& rhs) const { return millis == rhs.millis; }
    bool operator!=(const Instant& rhs) const { return millis != rhs.millis; }
    bool operator<(const Instant& rhs) const { return millis < rhs.millis; }
    bool operator>(const Instant& rhs) const { return millis > rhs.millis; }
};

// Parse an ISO 8601 calendar date or date-time:
//   YYYY | YYYY-MM | YYYY-MM-DD
//   followed optionally by 'T' (or ' ') hh:mm[:ss[.fff]] and Z / +hh:mm / -hh:mm
// Values without an offset are taken as UTC. Returns std::nullopt for text
// that is not a valid calendar date (e.g. 2023-02-29 or 2024-13-01).
std::optional<Instant> parse_iso8601(const std::string& text);

// Render as YYYY-MM-DDTHH:MM:SS.sssZ
std::string format_iso8601(Instant t);

// Days since the epoch for a proleptic Gregorian date, and back.
int64_t days_from_civil(int64_t year, unsigned month, unsigned day);
void civil_from_days(int64_t days, int64_t& year, unsigned& month, unsigned& day);

bool is_leap_year(int64_t year);
unsigned days_in_month(int64_t year, unsigned month);

}  // namespace sc
