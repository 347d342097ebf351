#include "time_filter.hpp"
#include <stdexcept>

namespace finsight {

std::string to_string(TimeFilterPreset preset) {
    switch (preset) {
        case TimeFilterPreset::Today: return "today";
        case TimeFilterPreset::Yesterday: return "yesterday";
        case TimeFilterPreset::ThisWeek: return "thisWeek";
        case TimeFilterPreset::Last30Days: return "last30Days";
        case TimeFilterPreset::ThisMonth: return "thisMonth";
        case TimeFilterPreset::LastMonth: return "lastMonth";
        case TimeFilterPreset::ThisYear: return "thisYear";
        case TimeFilterPreset::LastYear: return "lastYear";
        case TimeFilterPreset::AllTime: return "allTime";
        case TimeFilterPreset::Custom: return "custom";
    }
    return "unknown";
}

TimeFilterPreset time_filter_preset_from_string(const std::string& text) {
    if (text == "today") return TimeFilterPreset::Today;
    if (text == "yesterday") return TimeFilterPreset::Yesterday;
    if (text == "thisWeek") return TimeFilterPreset::ThisWeek;
    if (text == "last30Days") return TimeFilterPreset::Last30Days;
    if (text == "thisMonth") return TimeFilterPreset::ThisMonth;
    if (text == "lastMonth") return TimeFilterPreset::LastMonth;
    if (text == "thisYear") return TimeFilterPreset::ThisYear;
    if (text == "lastYear") return TimeFilterPreset::LastYear;
    if (text == "allTime") return TimeFilterPreset::AllTime;
    if (text == "custom") return TimeFilterPreset::Custom;
    throw std::invalid_argument("Unknown time filter preset: " + text);
}

TimeFilter::TimeFilter()
    : preset(TimeFilterPreset::AllTime)
    , start(from_epoch_seconds(0))
    , end(from_epoch_seconds(0))
{}

TimeFilter TimeFilter::from_preset(TimeFilterPreset preset, Timestamp now) {
    TimeFilter filter;
    filter.preset = preset;

    Timestamp today = start_of_day(now);

    switch (preset) {
        case TimeFilterPreset::Today:
            filter.start = today;
            filter.end = add_days(today, 1);
            break;
        case TimeFilterPreset::Yesterday:
            filter.start = add_days(today, -1);
            filter.end = today;
            break;
        case TimeFilterPreset::ThisWeek:
            filter.start = start_of_week(now);
            filter.end = add_days(filter.start, 7);
            break;
        case TimeFilterPreset::Last30Days:
            filter.start = add_days(today, -30);
            filter.end = add_days(today, 1);
            break;
        case TimeFilterPreset::ThisMonth:
            filter.start = start_of_month(now);
            filter.end = add_months(filter.start, 1);
            break;
        case TimeFilterPreset::LastMonth:
            filter.start = start_of_month(add_months(now, -1));
            filter.end = add_months(filter.start, 1);
            break;
        case TimeFilterPreset::ThisYear:
            filter.start = start_of_year(now);
            filter.end = add_years(filter.start, 1);
            break;
        case TimeFilterPreset::LastYear:
            filter.start = start_of_year(add_years(now, -1));
            filter.end = add_years(filter.start, 1);
            break;
        case TimeFilterPreset::AllTime:
            filter.start = from_epoch_seconds(0);
            filter.end = add_days(now, 365 * 100);
            break;
        case TimeFilterPreset::Custom:
            filter.start = now;
            filter.end = now;
            break;
    }
    return filter;
}

TimeFilter TimeFilter::custom(Timestamp start, Timestamp end) {
    if (end < start) {
        throw std::invalid_argument("Custom time filter ends before it starts");
    }
    TimeFilter filter;
    filter.preset = TimeFilterPreset::Custom;
    filter.start = start;
    filter.end = end;
    return filter;
}

std::string TimeFilter::display_name() const {
    if (preset == TimeFilterPreset::Custom) {
        return format_date(start) + " - " + format_date(end);
    }
    return to_string(preset);
}

Timestamp reference_date(const TimeFilter& filter, Timestamp now) {
    if (filter.end >= start_of_day(now)) {
        return now;
    }
    return filter.end - std::chrono::seconds(1);
}

} // namespace finsight
