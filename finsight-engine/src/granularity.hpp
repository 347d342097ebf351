#ifndef FINSIGHT_GRANULARITY_HPP
#define FINSIGHT_GRANULARITY_HPP

#include "calendar.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finsight {

// Bucket size used to group insight data
enum class Granularity {
    Week,      // rolling 52 weeks
    Month,     // every month since the first transaction
    Quarter,   // every quarter since the first transaction
    Year,      // every year since the first transaction
    AllTime    // one bucket covering the whole history
};

std::string to_string(Granularity granularity);
Granularity granularity_from_string(const std::string& text);
const std::vector<Granularity>& all_granularities();

// Data window for a granularity. The end is always the start of tomorrow;
// the start falls back to a fixed lookback when no transactions are known.
DateWindow granularity_window(Granularity granularity,
                              std::optional<Timestamp> first_transaction_date,
                              Timestamp now);

// Stable bucket key: "2024-W03", "2024-02", "2024-Q1", "2024" or "all"
std::string period_key(Granularity granularity, Timestamp date);

// Calendar start of the period containing date (AllTime returns date unchanged)
Timestamp period_start(Granularity granularity, Timestamp date);

// One step forward; AllTime has no step and returns t unchanged
Timestamp advance_period(Granularity granularity, Timestamp t);

// Inverse of period_key for the calendar granularities
// @throws std::invalid_argument for malformed keys or AllTime
Timestamp period_start_for_key(Granularity granularity, const std::string& key);

// Human-readable bucket label; weekly labels carry a year suffix when the
// bucket's ISO year differs from the one containing now
std::string period_label(Granularity granularity, Timestamp period_start, Timestamp now);

std::string current_period_key(Granularity granularity, Timestamp reference);
std::string previous_period_key(Granularity granularity, Timestamp reference);

// Insight wording that depends on the bucket size
std::string comparison_period_name(Granularity granularity);
std::string period_over_period_title(Granularity granularity);
std::string best_period_title(Granularity granularity);
std::string worst_period_title(Granularity granularity);
std::string total_recurring_title(Granularity granularity);
std::string period_unit(Granularity granularity);

// Scale factor from a monthly amount to one period of this granularity
double monthly_to_period_multiplier(Granularity granularity);

} // namespace finsight

#endif // FINSIGHT_GRANULARITY_HPP
