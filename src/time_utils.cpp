#include "time_utils.hpp"
#include <cctype>
#include <cstdint>
#include <cstdio>

namespace receipt_assistant {

namespace {

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
    y += (m <= 2);
}

bool is_leap(int64_t y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : table[m - 1];
}

// Reads exactly `width` digits at `pos`.
bool read_digits(const std::string& s, size_t& pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < width; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    pos += width;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

std::optional<ParsedTimestamp> parse_timestamp(const std::string& raw) {
    size_t first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    size_t last = raw.find_last_not_of(" \t\r\n");
    const std::string s = raw.substr(first, last - first + 1);

    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!read_digits(s, pos, 4, year) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, month) || !expect(s, pos, '-') ||
        !read_digits(s, pos, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));

    if (pos == s.size()) {
        return ParsedTimestamp{Timestamp(std::chrono::seconds(days * 86400)), true};
    }

    if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
    ++pos;

    int hour = 0, minute = 0, second = 0;
    if (!read_digits(s, pos, 2, hour) || !expect(s, pos, ':') || !read_digits(s, pos, 2, minute)) {
        return std::nullopt;
    }
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!read_digits(s, pos, 2, second)) return std::nullopt;
        if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
            ++pos;
            size_t digits = 0;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                ++pos;
                ++digits;
            }
            if (digits == 0) return std::nullopt;
        }
    }
    if (hour > 23 || minute > 59 || second > 59) return std::nullopt;

    int64_t offset_seconds = 0;
    if (pos < s.size()) {
        char sign = s[pos];
        if (sign == 'Z' || sign == 'z') {
            ++pos;
        } else if (sign == '+' || sign == '-') {
            ++pos;
            int off_h = 0, off_m = 0;
            if (!read_digits(s, pos, 2, off_h)) return std::nullopt;
            if (pos < s.size() && s[pos] == ':') ++pos;
            if (!read_digits(s, pos, 2, off_m)) return std::nullopt;
            if (off_h > 23 || off_m > 59) return std::nullopt;
            offset_seconds = (off_h * 3600 + off_m * 60) * (sign == '+' ? 1 : -1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != s.size()) return std::nullopt;

    int64_t total = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return ParsedTimestamp{Timestamp(std::chrono::seconds(total)), false};
}

std::string format_timestamp(Timestamp ts) {
    int64_t total = ts.time_since_epoch().count();
    int64_t days = total / 86400;
    int64_t rem = total % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    int64_t y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lldZ",
                  static_cast<long long>(y), m, d,
                  static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60),
                  static_cast<long long>(rem % 60));
    return buf;
}

Timestamp end_of_day(Timestamp ts) {
    int64_t total = ts.time_since_epoch().count();
    int64_t days = total / 86400;
    if (total % 86400 < 0) days -= 1;
    return Timestamp(std::chrono::seconds(days * 86400 + 86399));
}

} // namespace receipt_assistant
