#include "time_utils.hpp"
#include "constants.hpp"
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <ctime>

int64_t round_half_away_from_zero(double x) {
    double result;
    if (x < 0) {
        result = std::ceil(x - 0.5);
    } else {
        result = std::floor(x + 0.5);
    }

    // Only the integral part is wanted
    double integral = 0.0;
    std::modf(result, &integral);
    return static_cast<int64_t>(integral);
}

RemainingDuration decompose_remaining(int64_t secs_to_go) {
    const int64_t days_per_month = DAYS_PER_YEAR / 12;

    int64_t minutes = secs_to_go / 60;
    int64_t hours = minutes / 60;
    int64_t days = hours / 24;
    int64_t years = days / DAYS_PER_YEAR;
    int64_t months = days / days_per_month;

    months -= years * 12;
    days -= years * DAYS_PER_YEAR;
    if (months < 0) months = 0;

    days -= months * days_per_month;
    if (days < 0) days = 0;

    // Guard against a 30-day remainder; months may still read 12 for 360-364 days
    if (days > 29) {
        days -= 30;
        months += 1;
        if (months >= 12) {
            months -= 12;
            years += 1;
        }
    }

    RemainingDuration d;
    d.seconds = secs_to_go;
    d.years = years;
    d.months = months;
    d.days = days;
    return d;
}

static void append_unit(std::string& out, int64_t count, const char* unit) {
    if (count <= 0) return;
    out += fmt::format(" {} {}", count, unit);
    if (count != 1) out += "s";
}

std::string format_remaining(int64_t secs_to_go) {
    RemainingDuration d = decompose_remaining(secs_to_go);

    std::string out;
    append_unit(out, d.years, "year");
    append_unit(out, d.months, "month");
    append_unit(out, d.days, "day");
    return out;
}

// ── RFC 3339 ────────────────────────────────────────────────

static bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = pos; i < pos + count; i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

static bool char_at(const std::string& s, size_t pos, char c) {
    return pos < s.size() && s[pos] == c;
}

static bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap(year)) return 29;
    return days[month - 1];
}

// Days since 1970-01-01 in the proleptic Gregorian calendar
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

Result<Instant> parse_rfc3339(const std::string& text) {
    auto fail = [&text](const std::string& why) {
        return Result<Instant>::Err(fmt::format("invalid timestamp \"{}\": {}", text, why));
    };

    int year = 0, month = 0, day = 0;
    if (!read_digits(text, 0, 4, year) || !char_at(text, 4, '-') ||
        !read_digits(text, 5, 2, month) || !char_at(text, 7, '-') ||
        !read_digits(text, 8, 2, day)) {
        return fail("expected date as YYYY-MM-DD");
    }
    if (!char_at(text, 10, 'T') && !char_at(text, 10, 't')) {
        return fail("expected 'T' between date and time");
    }

    int hour = 0, minute = 0, second = 0;
    if (!read_digits(text, 11, 2, hour) || !char_at(text, 13, ':') ||
        !read_digits(text, 14, 2, minute) || !char_at(text, 16, ':') ||
        !read_digits(text, 17, 2, second)) {
        return fail("expected time as HH:MM:SS");
    }

    if (month < 1 || month > 12) return fail("month out of range");
    if (day < 1 || day > days_in_month(year, month)) return fail("day out of range");
    if (hour > 23) return fail("hour out of range");
    if (minute > 59) return fail("minute out of range");
    if (second > 59) return fail("second out of range");

    size_t pos = 19;
    int64_t nanos = 0;
    if (char_at(text, pos, '.')) {
        pos++;
        size_t start = pos;
        int64_t scale = 100000000;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            nanos += (text[pos] - '0') * scale;
            scale /= 10;
            pos++;
        }
        if (pos == start) return fail("expected digits after '.'");
    }

    int64_t offset_secs = 0;
    if (char_at(text, pos, 'Z') || char_at(text, pos, 'z')) {
        pos++;
    } else if (char_at(text, pos, '+') || char_at(text, pos, '-')) {
        int off_h = 0, off_m = 0;
        if (!read_digits(text, pos + 1, 2, off_h) || !char_at(text, pos + 3, ':') ||
            !read_digits(text, pos + 4, 2, off_m)) {
            return fail("expected offset as +HH:MM");
        }
        if (off_h > 23 || off_m > 59) return fail("offset out of range");
        offset_secs = off_h * 3600 + off_m * 60;
        if (text[pos] == '-') offset_secs = -offset_secs;
        pos += 6;
    } else {
        return fail("missing time zone offset");
    }

    if (pos != text.size()) return fail("unexpected trailing text");

    int64_t secs = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400
                 + hour * 3600 + minute * 60 + second - offset_secs;

    // Clock::duration may be nanoseconds in 64 bits (about 1677..2262)
    const int64_t max_secs = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();
    const int64_t min_secs = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::min()).count();
    if (secs >= max_secs || secs < min_secs) return fail("out of range");

    auto since_epoch = std::chrono::seconds(secs) + std::chrono::nanoseconds(nanos);
    return Result<Instant>::Ok(Instant(std::chrono::duration_cast<Clock::duration>(since_epoch)));
}

std::string format_rfc3339(Instant t) {
    std::time_t tt = Clock::to_time_t(t);
    struct tm tm_buf = {};
#ifdef _WIN32
    gmtime_s(&tm_buf, &tt);
#else
    gmtime_r(&tt, &tm_buf);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}
