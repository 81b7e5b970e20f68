#include <sc/instant.h>

#include <cstdio>
#include <cstdlib>
#include <regex>

namespace sc {

bool is_leap_year(int64_t year) { return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0); }

unsigned days_in_month(int64_t year, unsigned month) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return days[month - 1];
}

// Howard Hinnant's civil calendar algorithms; valid for the whole int64 day range we use.
int64_t days_from_civil(int64_t year, unsigned month, unsigned day) {
    year -= month <= 2;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yoe = year - era * 400;
    const int64_t doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(int64_t days, int64_t& year, unsigned& month, unsigned& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    year = yoe + era * 400 + (month <= 2);
}

namespace {
    int digits(const std::string& s) { return s.empty() ? 0 : std::atoi(s.c_str()); }
}

std::optional<Instant> parse_iso8601(const std::string& text) {
    static const std::regex rx(
                "^(\\d{4})(?:-(\\d{2})(?:-(\\d{2}))?)?"
                "(?:[T ](\\d{2}):(\\d{2})(?::(\\d{2})(?:\\.(\\d{1,9}))?)?(Z|[+-]\\d{2}:\\d{2})?)?$");
    std::smatch m;
    if (!std::regex_match(text, m, rx)) return std::nullopt;

    const int64_t year = digits(m[1].str());
    const unsigned month = m[2].matched ? static_cast<unsigned>(digits(m[2].str())) : 1;
    const unsigned day = m[3].matched ? static_cast<unsigned>(digits(m[3].str())) : 1;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;

    const int hour = digits(m[4].str());
    const int minute = digits(m[5].str());
    const int second = digits(m[6].str());
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    int millis = 0;
    if (m[7].matched) {
        std::string frac = m[7].str();
        frac.resize(3, '0');
        millis = digits(frac);
    }

    int64_t offset_minutes = 0;
    if (m[8].matched && m[8].str() != "Z") {
        const std::string tz = m[8].str();
        const int tz_hour = digits(tz.substr(1, 2));
        const int tz_minute = digits(tz.substr(4, 2));
        if (tz_hour > 23 || tz_minute > 59) return std::nullopt;
        offset_minutes = tz_hour * 60 + tz_minute;
        if (tz[0] == '-') offset_minutes = -offset_minutes;
    }

    const int64_t seconds = days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second;
    return Instant{seconds * 1000 + millis - offset_minutes * 60000};
}

std::string format_iso8601(Instant t) {
    int64_t days = t.millis / 86400000;
    int64_t rem = t.millis % 86400000;
    if (rem < 0) {
        rem += 86400000;
        --days;
    }
    int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    const int hour = static_cast<int>(rem / 3600000);
    const int minute = static_cast<int>(rem / 60000 % 60);
    const int second = static_cast<int>(rem / 1000 % 60);
    const int millis = static_cast<int>(rem % 1000);

    char buf[40];
    if (year >= 0 && year <= 9999) {
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<long long>(year), month, day, hour, minute, second, millis);
    } else {
        // expanded years carry a sign and six digits
        std::snprintf(buf, sizeof(buf), "%c%06lld-%02u-%02uT%02d:%02d:%02d.%03dZ", year < 0 ? '-' : '+',
                      static_cast<long long>(year < 0 ? -year : year), month, day, hour, minute, second,
                      millis);
    }
    return buf;
}

}  // namespace sc
