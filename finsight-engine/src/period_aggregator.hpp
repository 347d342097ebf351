#ifndef FINSIGHT_PERIOD_AGGREGATOR_HPP
#define FINSIGHT_PERIOD_AGGREGATOR_HPP

#include "calendar.hpp"
#include "data_sources.hpp"
#include "granularity.hpp"
#include "ledger.hpp"
#include "logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finsight {

/**
 * Income and expense totals for one calendar period
 */
struct PeriodBucket {
    std::string key;                          // "2024-03", "2024-W10", "all", ...
    Granularity granularity;
    Timestamp period_start;
    Timestamp period_end;                     // exclusive
    std::string label;
    double income;
    double expenses;
    std::optional<double> cumulative_balance; // filled by the wealth generator's series

    PeriodBucket();

    double net_flow() const { return income - expenses; }
};

struct PeriodSummary {
    double total_income;
    double total_expenses;
    double net_flow;

    PeriodSummary() : total_income(0.0), total_expenses(0.0), net_flow(0.0) {}
};

enum class AggregationPath {
    Empty,   // degenerate window or no data at all
    Fast,    // folded from precomputed monthly aggregates
    Slow     // linear scan over transactions
};

std::string to_string(AggregationPath path);

struct AggregationResult {
    std::vector<PeriodBucket> buckets;
    AggregationPath path;
    DateWindow window;

    AggregationResult() : path(AggregationPath::Empty) {}
};

/**
 * Turns transactions (or monthly aggregates) into a gap-free, chronologically
 * ordered bucket sequence for one granularity.
 *
 * Year and all-time requests prefer the aggregate reader: the monthly store
 * keeps the whole history even when the transaction list is windowed. Every
 * other request, and any request the reader cannot serve, scans transactions.
 */
class PeriodAggregator {
public:
    /**
     * @param aggregates Optional precomputed aggregates (null disables the fast path)
     * @param converter Used to resolve amounts into the base currency
     * @param logger Optional logger
     */
    PeriodAggregator(const AggregateReader* aggregates,
                     const CurrencyConverter& converter,
                     Logger* logger = nullptr);

    /**
     * Buckets over the granularity's default window.
     * @param first_transaction_date Earliest transaction date if already known;
     *        computed with one scan when absent
     */
    AggregationResult aggregate(Granularity granularity,
                                const std::vector<Transaction>& transactions,
                                const std::string& base_currency,
                                Timestamp now,
                                std::optional<Timestamp> first_transaction_date = std::nullopt) const;

    /**
     * Buckets over an explicit window
     */
    AggregationResult aggregate_window(Granularity granularity,
                                       const DateWindow& window,
                                       const std::vector<Transaction>& transactions,
                                       const std::string& base_currency,
                                       Timestamp now) const;

    // Slow path: step-walk plus one linear scan
    std::vector<PeriodBucket> scan_transactions(Granularity granularity,
                                                const DateWindow& window,
                                                const std::vector<Transaction>& transactions,
                                                const std::string& base_currency,
                                                Timestamp now) const;

    // Fast path: nullopt when the reader is absent or has no data for the window
    std::optional<std::vector<PeriodBucket>> fold_monthly_aggregates(Granularity granularity,
                                                                     const DateWindow& window,
                                                                     const std::string& base_currency,
                                                                     Timestamp now) const;

    // Every bucket of the window with zero totals
    static std::vector<PeriodBucket> empty_buckets(Granularity granularity,
                                                   const DateWindow& window,
                                                   Timestamp now);

    static bool supports_fast_path(Granularity granularity);

private:
    const AggregateReader* aggregates_;
    const CurrencyConverter& converter_;
    Logger* logger_;
};

std::optional<Timestamp> first_transaction_date(const std::vector<Transaction>& transactions);

// Income and expenses of every transaction dated today or earlier
PeriodSummary compute_period_summary(const std::vector<Transaction>& transactions,
                                     const std::string& base_currency,
                                     const CurrencyConverter& converter,
                                     Timestamp now,
                                     Logger* logger = nullptr);

std::vector<Transaction> filter_by_window(const std::vector<Transaction>& transactions,
                                          const DateWindow& window);

const PeriodBucket* find_bucket(const std::vector<PeriodBucket>& buckets, const std::string& key);

} // namespace finsight

#endif // FINSIGHT_PERIOD_AGGREGATOR_HPP
