//===== time_utils.cpp =====

#include "bar_catalog/core/time_utils.hpp"
#include <cctype>
#include <cstdio>

namespace bar_catalog {
namespace core {

namespace {

constexpr int64_t NANOS_PER_SECOND = 1000000000LL;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t NANOS_PER_DAY = NANOS_PER_SECOND * SECONDS_PER_DAY;

// Proleptic Gregorian conversions (H. Hinnant's civil calendar algorithms)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

struct CivilTime {
    int64_t year;
    unsigned month;
    unsigned day;
    unsigned hour;
    unsigned minute;
    unsigned second;
    int64_t nanos;
};

CivilTime to_civil(const Timestamp& ts) {
    const int64_t total = to_unix_nanos(ts);
    const int64_t days = floor_div(total, NANOS_PER_DAY);
    int64_t rem = total - days * NANOS_PER_DAY;

    CivilTime ct{};
    civil_from_days(days, ct.year, ct.month, ct.day);
    const int64_t secs = rem / NANOS_PER_SECOND;
    ct.nanos = rem % NANOS_PER_SECOND;
    ct.hour = static_cast<unsigned>(secs / 3600);
    ct.minute = static_cast<unsigned>((secs % 3600) / 60);
    ct.second = static_cast<unsigned>(secs % 60);
    return ct;
}

bool read_number(const std::string& text, size_t& pos, size_t digits, int64_t& out) {
    if (pos + digits > text.size()) {
        return false;
    }
    out = 0;
    for (size_t i = 0; i < digits; ++i) {
        const char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    pos += digits;
    return true;
}

bool expect_char(const std::string& text, size_t& pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

int64_t days_in_month(int64_t year, unsigned month) {
    const int64_t next_year = month == 12 ? year + 1 : year;
    const unsigned next_month = month == 12 ? 1 : month + 1;
    return days_from_civil(next_year, next_month, 1) - days_from_civil(year, month, 1);
}

bool valid_fields(int64_t year, int64_t month, int64_t day, int64_t hour, int64_t minute,
                  int64_t second) {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= days_in_month(year, static_cast<unsigned>(month)) && hour >= 0 && hour <= 23 &&
           minute >= 0 && minute <= 59 && second >= 0 && second <= 60;
}

}  // namespace

Timestamp make_utc(int year, unsigned month, unsigned day, unsigned hour, unsigned minute,
                   unsigned second, uint32_t nanos) {
    const int64_t days = days_from_civil(year, month, day);
    const int64_t secs = days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
    return from_unix_nanos(secs * NANOS_PER_SECOND + nanos);
}

int64_t utc_day_number(const Timestamp& ts) {
    return floor_div(to_unix_nanos(ts), NANOS_PER_DAY);
}

bool is_midnight_utc(const Timestamp& ts) {
    return to_unix_nanos(ts) - utc_day_number(ts) * NANOS_PER_DAY == 0;
}

std::string format_iso8601(const Timestamp& ts) {
    const CivilTime ct = to_civil(ts);
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02u:%02u:%02u.%09lldZ",
                  static_cast<long long>(ct.year), ct.month, ct.day, ct.hour, ct.minute,
                  ct.second, static_cast<long long>(ct.nanos));
    return std::string(buffer);
}

std::string format_file_timestamp(const Timestamp& ts) {
    const CivilTime ct = to_civil(ts);
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02u-%02u-%02u-%09lldZ",
                  static_cast<long long>(ct.year), ct.month, ct.day, ct.hour, ct.minute,
                  ct.second, static_cast<long long>(ct.nanos));
    return std::string(buffer);
}

std::optional<Timestamp> parse_file_timestamp(const std::string& text) {
    // YYYY-MM-DDTHH-MM-SS-NNNNNNNNNZ
    if (text.size() != 30) {
        return std::nullopt;
    }
    size_t pos = 0;
    int64_t year, month, day, hour, minute, second, nanos;
    if (!read_number(text, pos, 4, year) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, month) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, day) || !expect_char(text, pos, 'T') ||
        !read_number(text, pos, 2, hour) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, minute) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, second) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 9, nanos) || !expect_char(text, pos, 'Z')) {
        return std::nullopt;
    }
    if (!valid_fields(year, month, day, hour, minute, second)) {
        return std::nullopt;
    }
    return make_utc(static_cast<int>(year), static_cast<unsigned>(month),
                    static_cast<unsigned>(day), static_cast<unsigned>(hour),
                    static_cast<unsigned>(minute), static_cast<unsigned>(second),
                    static_cast<uint32_t>(nanos));
}

std::optional<Timestamp> parse_datetime(const std::string& input) {
    // Trim surrounding whitespace and quotes
    size_t first = 0;
    size_t last = input.size();
    while (first < last && (std::isspace(static_cast<unsigned char>(input[first])) ||
                            input[first] == '"')) {
        ++first;
    }
    while (last > first && (std::isspace(static_cast<unsigned char>(input[last - 1])) ||
                            input[last - 1] == '"')) {
        --last;
    }
    const std::string text = input.substr(first, last - first);

    size_t pos = 0;
    int64_t year, month, day;
    if (!read_number(text, pos, 4, year) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, month) || !expect_char(text, pos, '-') ||
        !read_number(text, pos, 2, day)) {
        return std::nullopt;
    }

    int64_t hour = 0, minute = 0, second = 0, nanos = 0, offset_seconds = 0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == ' ')) {
        ++pos;
        if (!read_number(text, pos, 2, hour) || !expect_char(text, pos, ':') ||
            !read_number(text, pos, 2, minute)) {
            return std::nullopt;
        }
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!read_number(text, pos, 2, second)) {
                return std::nullopt;
            }
        }
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 9) {
                    nanos = nanos * 10 + (text[pos] - '0');
                    ++digits;
                }
                ++pos;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (; digits < 9; ++digits) {
                nanos *= 10;
            }
        }
        if (pos < text.size() && text[pos] == 'Z') {
            ++pos;
        } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            const int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int64_t off_h = 0, off_m = 0;
            if (!read_number(text, pos, 2, off_h)) {
                return std::nullopt;
            }
            if (pos < text.size() && text[pos] == ':') {
                ++pos;
            }
            if (pos < text.size() && !read_number(text, pos, 2, off_m)) {
                return std::nullopt;
            }
            offset_seconds = sign * (off_h * 3600 + off_m * 60);
        }
    }

    if (pos != text.size() || !valid_fields(year, month, day, hour, minute, second)) {
        return std::nullopt;
    }

    Timestamp ts = make_utc(static_cast<int>(year), static_cast<unsigned>(month),
                            static_cast<unsigned>(day), static_cast<unsigned>(hour),
                            static_cast<unsigned>(minute), static_cast<unsigned>(second),
                            static_cast<uint32_t>(nanos));
    return ts - std::chrono::seconds(offset_seconds);
}

}  // namespace core
}  // namespace bar_catalog
