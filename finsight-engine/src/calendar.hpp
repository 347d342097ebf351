#ifndef FINSIGHT_CALENDAR_HPP
#define FINSIGHT_CALENDAR_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace finsight {

// All calendar arithmetic is done in UTC on the proleptic Gregorian calendar.
// Weeks start on Monday and week numbers follow ISO 8601.

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using ClockFn = std::function<Timestamp()>;
using Days = std::chrono::duration<int64_t, std::ratio<86400>>;

struct CivilDate {
    int year;
    unsigned month;  // 1..12
    unsigned day;    // 1..31
};

struct IsoWeek {
    int year;        // ISO week-numbering year
    unsigned week;   // 1..53
};

// Half-open date window [start, end)
struct DateWindow {
    Timestamp start;
    Timestamp end;

    bool empty() const { return !(start < end); }
    bool contains(Timestamp t) const { return t >= start && t < end; }
};

// Days since 1970-01-01 for a civil date, and the inverse
int64_t days_from_civil(int64_t year, unsigned month, unsigned day);
CivilDate civil_from_days(int64_t days);

Timestamp make_date(int year, unsigned month, unsigned day);
CivilDate to_civil(Timestamp t);
int64_t day_number(Timestamp t);

bool is_leap_year(int year);
unsigned days_in_month(int year, unsigned month);
unsigned days_in_year(int year);

// 0 = Monday ... 6 = Sunday
unsigned weekday(Timestamp t);
IsoWeek iso_week(Timestamp t);
Timestamp iso_week_start(int iso_year, unsigned week);

Timestamp start_of_day(Timestamp t);
Timestamp start_of_week(Timestamp t);
Timestamp start_of_month(Timestamp t);
Timestamp start_of_quarter(Timestamp t);
Timestamp start_of_year(Timestamp t);

Timestamp add_days(Timestamp t, int64_t days);
Timestamp add_weeks(Timestamp t, int64_t weeks);
// Keeps the time of day; the day of month is clamped to the target month's length
Timestamp add_months(Timestamp t, int64_t months);
Timestamp add_years(Timestamp t, int64_t years);

// Whole days between two instants, floored
int64_t days_between(Timestamp from, Timestamp to);

int64_t to_epoch_seconds(Timestamp t);
Timestamp from_epoch_seconds(int64_t seconds);

// "YYYY-MM-DD", optionally followed by a time part that is ignored
std::optional<Timestamp> parse_date(const std::string& text);
std::string format_date(Timestamp t);

const char* month_abbreviation(unsigned month);
const char* month_name(unsigned month);

} // namespace finsight

#endif // FINSIGHT_CALENDAR_HPP
