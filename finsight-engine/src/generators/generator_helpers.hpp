#ifndef FINSIGHT_GENERATOR_HELPERS_HPP
#define FINSIGHT_GENERATOR_HELPERS_HPP

#include "../insight.hpp"
#include "../ledger.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace finsight {

using CategoryTotal = std::pair<std::string, double>;

// Metric formatted with format_currency_smart (or format_currency when smart is false)
InsightMetric currency_metric(double value, const std::string& currency,
                              std::optional<std::string> unit = std::nullopt,
                              bool smart = true);

// Metric with a caller-formatted value and no currency
InsightMetric plain_metric(double value, const std::string& formatted,
                           std::optional<std::string> unit = std::nullopt);

InsightTrend make_trend(TrendDirection direction,
                        std::optional<double> change_percent,
                        std::optional<double> change_absolute,
                        const std::string& comparison_period);

// Totals sorted by amount, largest first; ties keep name order
std::vector<CategoryTotal> sorted_totals(const std::map<std::string, double>& totals);

// Transactions dated inside [from, to)
std::vector<Transaction> transactions_between(const std::vector<Transaction>& transactions,
                                              Timestamp from, Timestamp to);

// Whole months only: both ends fall on the first of a month at midnight
bool month_aligned(Timestamp from, Timestamp to);

} // namespace finsight

#endif // FINSIGHT_GENERATOR_HELPERS_HPP
