/**
 * @file insights_orchestrator.hpp
 * @brief Cached entry point that turns a ledger snapshot into insights
 *
 * The InsightsOrchestrator is responsible for:
 * - Building a deterministic cache key from the request
 * - Serving repeated requests from the ResultCache
 * - On a miss: windowing the transactions, computing the period summary and
 *   the bucket sequence once, and running every generator in a fixed order
 * - Storing complete passes and invalidating them on demand
 *
 * Error Handling:
 * - Insufficient data is never an error; generators simply produce nothing
 * - A generator that throws is logged and skipped; the pass is still returned
 *   but is not cached, so the next call recomputes it
 */

#ifndef FINSIGHT_INSIGHTS_ORCHESTRATOR_HPP
#define FINSIGHT_INSIGHTS_ORCHESTRATOR_HPP

#include "cache/result_cache.hpp"
#include "calendar.hpp"
#include "data_sources.hpp"
#include "granularity.hpp"
#include "insight.hpp"
#include "ledger.hpp"
#include "logger.hpp"
#include "period_aggregator.hpp"
#include "time_filter.hpp"
#include "generators/insight_generator.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finsight {

/**
 * @brief Insights and the bucket sequence they were computed from
 */
struct GranularityResult {
    std::vector<Insight> insights;
    std::vector<PeriodBucket> buckets;
};

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    size_t cache_capacity;            ///< Maximum cached passes (default: 20)
    std::chrono::seconds cache_ttl;   ///< Age after which a cached pass is recomputed (default: 300s)

    OrchestratorConfig()
        : cache_capacity(20),
          cache_ttl(300) {}
};

/**
 * @brief Main entry point for insight generation
 *
 * Usage Example:
 *   @code
 *   InMemoryLedger ledger = ...;
 *   RateTableConverter rates;
 *   InMemoryAggregateStore aggregates;
 *   aggregates.rebuild(ledger.transactions(), "USD", rates, Clock::now());
 *
 *   Logger logger;
 *   InsightsOrchestrator orchestrator(ledger, rates, &aggregates, OrchestratorConfig(), &logger);
 *
 *   GranularityResult monthly = orchestrator.generate_all_insights(Granularity::Month, "USD");
 *   for (const auto& insight : monthly.insights) {
 *       std::cout << insight.title << ": " << insight.metric.formatted_value << std::endl;
 *   }
 *
 *   // After the ledger changes
 *   orchestrator.invalidate_cache();
 *   @endcode
 */
class InsightsOrchestrator {
public:
    /**
     * @brief Constructor with the default generator set
     *
     * @param ledger Transaction store; read only, must outlive the orchestrator
     * @param converter Currency conversion
     * @param aggregates Precomputed aggregates (nullptr disables the fast path)
     * @param config Cache configuration (optional)
     * @param logger Logger instance (optional, nullptr disables logging)
     * @param clock Time source (optional, defaults to the system clock)
     */
    InsightsOrchestrator(
        const LedgerSource& ledger,
        const CurrencyConverter& converter,
        const AggregateReader* aggregates = nullptr,
        const OrchestratorConfig& config = OrchestratorConfig(),
        Logger* logger = nullptr,
        ClockFn clock = nullptr
    );

    /**
     * @brief Constructor with an explicit generator list, run in the given order
     */
    InsightsOrchestrator(
        const LedgerSource& ledger,
        const CurrencyConverter& converter,
        const AggregateReader* aggregates,
        std::vector<std::unique_ptr<InsightGenerator>> generators,
        const OrchestratorConfig& config = OrchestratorConfig(),
        Logger* logger = nullptr,
        ClockFn clock = nullptr
    );

    /**
     * @brief Spending, income, budget, recurring, cash flow, wealth, savings,
     *        forecasting and health score generators, in that order
     */
    static std::vector<std::unique_ptr<InsightGenerator>> default_generators();

    /**
     * @brief Insights for a user-selected date range
     *
     * Buckets are monthly over the filter window (widened to include the month
     * before the reference date so period comparisons have a baseline).
     *
     * @param filter Date range
     * @param base_currency Currency every amount is expressed in
     */
    std::vector<Insight> generate_all_insights(const TimeFilter& filter, const std::string& base_currency);

    /**
     * @brief Insights and buckets for one granularity
     *
     * @param granularity Bucket size and default window
     * @param base_currency Currency every amount is expressed in
     * @param first_transaction_date Earliest transaction if already known
     */
    GranularityResult generate_all_insights(
        Granularity granularity,
        const std::string& base_currency,
        std::optional<Timestamp> first_transaction_date = std::nullopt
    );

    /**
     * @brief Every granularity, scanning for the first transaction date only once
     */
    std::map<Granularity, GranularityResult> compute_all_granularities(const std::string& base_currency);

    /**
     * @brief Drop every cached pass
     */
    void invalidate_cache();

    /**
     * @brief Drop the cached passes computed for one base currency
     * @return Number of passes removed
     */
    size_t invalidate_currency(const std::string& base_currency);

    cache::CacheStats cache_stats() const;

    std::vector<std::string> generator_names() const;

    // "<preset>_<currency>_<windowStartEpochSeconds>"; custom ranges append the end
    // @throws std::invalid_argument if the currency is not alphanumeric
    static std::string make_cache_key(const TimeFilter& filter, const std::string& base_currency);

    // "granularity_<granularity>_<currency>"
    static std::string make_cache_key(Granularity granularity, const std::string& base_currency);

    // Base currency a cache key was built for
    static std::string currency_of_key(const std::string& key);

private:
    struct PassRequest {
        std::string key;
        Granularity granularity;
        DateWindow window;          ///< Transactions fed to the generators
        DateWindow bucket_window;   ///< Range covered by the bucket sequence
        Timestamp now;
        Timestamp reference_date;
        std::string base_currency;
    };

    struct PassResult {
        GranularityResult result;
        bool complete;              ///< False when a generator failed
    };

    const LedgerSource& ledger_;
    const CurrencyConverter& converter_;
    const AggregateReader* aggregates_;
    Logger* logger_;
    ClockFn clock_;
    cache::ResultCache<GranularityResult> cache_;
    std::vector<std::unique_ptr<InsightGenerator>> generators_;

    std::optional<GranularityResult> lookup(const std::string& key);
    PassResult run_pass(const PassRequest& request) const;
    void store(const std::string& key, const PassResult& pass);
};

} // namespace finsight

#endif // FINSIGHT_INSIGHTS_ORCHESTRATOR_HPP
