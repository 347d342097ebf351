#ifndef FINSIGHT_DATA_SOURCES_HPP
#define FINSIGHT_DATA_SOURCES_HPP

#include "calendar.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finsight {

/**
 * Precomputed income and expense totals for one calendar month,
 * expressed in a single currency
 */
struct MonthlyAggregate {
    int year;
    unsigned month;
    double total_income;
    double total_expenses;

    double net_flow() const { return total_income - total_expenses; }
};

/**
 * Precomputed expense total for one category in one calendar month
 */
struct CategoryAggregate {
    std::string category_name;
    int year;
    unsigned month;
    double total_expenses;
};

/**
 * Read access to precomputed aggregates.
 *
 * Both calls return the months overlapping [from, to) that have data, ordered
 * by (year, month). An empty result means the aggregates are not available
 * and callers fall back to scanning transactions.
 */
class AggregateReader {
public:
    virtual ~AggregateReader() = default;

    virtual std::vector<MonthlyAggregate> fetch_monthly_aggregates(
        Timestamp from, Timestamp to, const std::string& currency) const = 0;

    virtual std::vector<CategoryAggregate> fetch_category_aggregates(
        Timestamp from, Timestamp to, const std::string& currency) const = 0;
};

/**
 * Currency conversion capability. Returns nullopt when no rate is known.
 */
class CurrencyConverter {
public:
    virtual ~CurrencyConverter() = default;

    virtual std::optional<double> convert(double amount,
                                          const std::string& from,
                                          const std::string& to) const = 0;
};

} // namespace finsight

#endif // FINSIGHT_DATA_SOURCES_HPP
