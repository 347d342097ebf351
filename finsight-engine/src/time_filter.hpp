#ifndef FINSIGHT_TIME_FILTER_HPP
#define FINSIGHT_TIME_FILTER_HPP

#include "calendar.hpp"
#include <string>

namespace finsight {

enum class TimeFilterPreset {
    Today,
    Yesterday,
    ThisWeek,      // Monday to Monday
    Last30Days,
    ThisMonth,
    LastMonth,
    ThisYear,
    LastYear,
    AllTime,
    Custom
};

std::string to_string(TimeFilterPreset preset);
TimeFilterPreset time_filter_preset_from_string(const std::string& text);

/**
 * Date range selected by the user, as a preset or explicit bounds.
 * The range is half-open: [start, end).
 */
struct TimeFilter {
    TimeFilterPreset preset;
    Timestamp start;
    Timestamp end;

    TimeFilter();

    // Resolves a preset against now; Custom resolves to the empty range [now, now)
    static TimeFilter from_preset(TimeFilterPreset preset, Timestamp now);

    // @throws std::invalid_argument if end is before start
    static TimeFilter custom(Timestamp start, Timestamp end);

    DateWindow range() const { return DateWindow{start, end}; }
    std::string display_name() const;
};

// Date the comparison periods are anchored to: now when the filter reaches
// today, otherwise the last instant inside the filter.
Timestamp reference_date(const TimeFilter& filter, Timestamp now);

} // namespace finsight

#endif // FINSIGHT_TIME_FILTER_HPP
