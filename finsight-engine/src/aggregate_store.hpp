#ifndef FINSIGHT_AGGREGATE_STORE_HPP
#define FINSIGHT_AGGREGATE_STORE_HPP

#include "currency.hpp"
#include "data_sources.hpp"
#include "ledger.hpp"
#include "logger.hpp"
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace finsight {

/**
 * In-memory monthly and per-category aggregates.
 *
 * Aggregates are built per currency by rebuild(); reads for a currency that
 * was never built return nothing, which sends the aggregator down the slow path.
 */
class InMemoryAggregateStore : public AggregateReader {
public:
    InMemoryAggregateStore() = default;

    /**
     * Recompute every aggregate for one currency from scratch.
     * Transfers and transactions dated after the day of `now` are ignored;
     * amounts are resolved into `currency`.
     */
    void rebuild(const std::vector<Transaction>& transactions,
                 const std::string& currency,
                 const CurrencyConverter& converter,
                 Timestamp now,
                 Logger* logger = nullptr);

    // Insert or replace a single monthly record
    void put_monthly(const std::string& currency, const MonthlyAggregate& aggregate);
    void put_category(const std::string& currency, const CategoryAggregate& aggregate);

    void clear();
    bool has_currency(const std::string& currency) const;

    std::vector<MonthlyAggregate> fetch_monthly_aggregates(
        Timestamp from, Timestamp to, const std::string& currency) const override;

    std::vector<CategoryAggregate> fetch_category_aggregates(
        Timestamp from, Timestamp to, const std::string& currency) const override;

private:
    using MonthKey = std::pair<int, unsigned>;
    using CategoryKey = std::tuple<int, unsigned, std::string>;

    std::map<std::string, std::map<MonthKey, MonthlyAggregate>> monthly_;
    std::map<std::string, std::map<CategoryKey, CategoryAggregate>> categories_;
};

} // namespace finsight

#endif // FINSIGHT_AGGREGATE_STORE_HPP
