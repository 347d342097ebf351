#include "calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace finsight {

namespace {

constexpr const char* kMonthAbbreviations[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

constexpr const char* kMonthNames[] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

Timestamp from_day_number(int64_t days) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(Days(days)));
}

Clock::duration time_of_day(Timestamp t) {
    return t - start_of_day(t);
}

int parse_digits(const std::string& text, size_t pos, size_t count, bool& ok) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) {
            ok = false;
            return 0;
        }
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// Civil date conversion (days since the Unix epoch)
// ============================================================================

int64_t days_from_civil(int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate civil_from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{static_cast<int>(y + (m <= 2 ? 1 : 0)), m, d};
}

Timestamp make_date(int year, unsigned month, unsigned day) {
    return from_day_number(days_from_civil(year, month, day));
}

int64_t day_number(Timestamp t) {
    auto since_epoch = t.time_since_epoch();
    return floor_div(std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count(), 86400);
}

CivilDate to_civil(Timestamp t) {
    return civil_from_days(day_number(t));
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[(month - 1) % 12];
}

unsigned days_in_year(int year) {
    return is_leap_year(year) ? 366 : 365;
}

// ============================================================================
// Weeks
// ============================================================================

unsigned weekday(Timestamp t) {
    // 1970-01-01 was a Thursday
    int64_t d = day_number(t);
    return static_cast<unsigned>(((d % 7) + 7 + 3) % 7);
}

IsoWeek iso_week(Timestamp t) {
    int64_t d = day_number(t);
    int64_t thursday = d - static_cast<int64_t>(weekday(t)) + 3;
    int iso_year = civil_from_days(thursday).year;
    int64_t first_day = days_from_civil(iso_year, 1, 1);
    return IsoWeek{iso_year, static_cast<unsigned>((thursday - first_day) / 7 + 1)};
}

Timestamp iso_week_start(int iso_year, unsigned week) {
    int64_t jan4 = days_from_civil(iso_year, 1, 4);
    unsigned jan4_weekday = static_cast<unsigned>(((jan4 % 7) + 7 + 3) % 7);
    int64_t week1_monday = jan4 - jan4_weekday;
    return from_day_number(week1_monday + static_cast<int64_t>(week - 1) * 7);
}

// ============================================================================
// Period starts
// ============================================================================

Timestamp start_of_day(Timestamp t) {
    return from_day_number(day_number(t));
}

Timestamp start_of_week(Timestamp t) {
    return from_day_number(day_number(t) - weekday(t));
}

Timestamp start_of_month(Timestamp t) {
    CivilDate c = to_civil(t);
    return make_date(c.year, c.month, 1);
}

Timestamp start_of_quarter(Timestamp t) {
    CivilDate c = to_civil(t);
    unsigned first_month = ((c.month - 1) / 3) * 3 + 1;
    return make_date(c.year, first_month, 1);
}

Timestamp start_of_year(Timestamp t) {
    return make_date(to_civil(t).year, 1, 1);
}

// ============================================================================
// Arithmetic
// ============================================================================

Timestamp add_days(Timestamp t, int64_t days) {
    return t + std::chrono::duration_cast<Clock::duration>(Days(days));
}

Timestamp add_weeks(Timestamp t, int64_t weeks) {
    return add_days(t, weeks * 7);
}

Timestamp add_months(Timestamp t, int64_t months) {
    CivilDate c = to_civil(t);
    int64_t total = static_cast<int64_t>(c.year) * 12 + (c.month - 1) + months;
    int year = static_cast<int>(floor_div(total, 12));
    unsigned month = static_cast<unsigned>(total - static_cast<int64_t>(year) * 12) + 1;
    unsigned day = std::min(c.day, days_in_month(year, month));
    return make_date(year, month, day) + time_of_day(t);
}

Timestamp add_years(Timestamp t, int64_t years) {
    return add_months(t, years * 12);
}

int64_t days_between(Timestamp from, Timestamp to) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(to - from).count();
    return floor_div(seconds, 86400);
}

int64_t to_epoch_seconds(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(seconds)));
}

// ============================================================================
// Text
// ============================================================================

std::optional<Timestamp> parse_date(const std::string& text) {
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        return std::nullopt;
    }

    bool ok = true;
    int year = parse_digits(text, 0, 4, ok);
    int month = parse_digits(text, 5, 2, ok);
    int day = parse_digits(text, 8, 2, ok);
    if (!ok || month < 1 || month > 12 || day < 1) {
        return std::nullopt;
    }
    if (static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }
    return make_date(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string format_date(Timestamp t) {
    CivilDate c = to_civil(t);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", c.year, c.month, c.day);
    return buffer;
}

const char* month_abbreviation(unsigned month) {
    return kMonthAbbreviations[(month - 1) % 12];
}

const char* month_name(unsigned month) {
    return kMonthNames[(month - 1) % 12];
}

} // namespace finsight
