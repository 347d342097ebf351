#include "generator_helpers.hpp"
#include <algorithm>
#include <iterator>

namespace finsight {

InsightMetric currency_metric(double value, const std::string& currency,
                              std::optional<std::string> unit, bool smart) {
    InsightMetric metric;
    metric.value = value;
    metric.formatted_value = smart ? format_currency_smart(value, currency)
                                   : format_currency(value, currency);
    metric.currency = currency;
    metric.unit = std::move(unit);
    return metric;
}

InsightMetric plain_metric(double value, const std::string& formatted,
                           std::optional<std::string> unit) {
    InsightMetric metric;
    metric.value = value;
    metric.formatted_value = formatted;
    metric.unit = std::move(unit);
    return metric;
}

InsightTrend make_trend(TrendDirection direction,
                        std::optional<double> change_percent,
                        std::optional<double> change_absolute,
                        const std::string& comparison_period) {
    InsightTrend trend;
    trend.direction = direction;
    trend.change_percent = change_percent;
    trend.change_absolute = change_absolute;
    trend.comparison_period = comparison_period;
    return trend;
}

std::vector<CategoryTotal> sorted_totals(const std::map<std::string, double>& totals) {
    std::vector<CategoryTotal> sorted(totals.begin(), totals.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const CategoryTotal& a, const CategoryTotal& b) { return a.second > b.second; });
    return sorted;
}

std::vector<Transaction> transactions_between(const std::vector<Transaction>& transactions,
                                              Timestamp from, Timestamp to) {
    std::vector<Transaction> result;
    std::copy_if(transactions.begin(), transactions.end(), std::back_inserter(result),
                 [from, to](const Transaction& tx) { return tx.date >= from && tx.date < to; });
    return result;
}

bool month_aligned(Timestamp from, Timestamp to) {
    return from == start_of_month(from) && to == start_of_month(to);
}

} // namespace finsight
