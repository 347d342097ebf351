/**
 * @file insight_generator.hpp
 * @brief Abstract interface for the insight generators
 *
 * Each generator owns one insight category (spending, income, budget, ...)
 * and turns a shared, read-only GeneratorContext into zero or more insights.
 * The orchestrator runs a fixed list of generators in order and concatenates
 * their output.
 *
 * Design Principles:
 * - Stateless: generate() depends only on the context
 * - Deterministic: same context produces the same insights
 * - Isolated: generators never call each other or mutate the context
 * - Quiet: "nothing to report" is an empty vector, never an exception
 */

#ifndef FINSIGHT_INSIGHT_GENERATOR_HPP
#define FINSIGHT_INSIGHT_GENERATOR_HPP

#include "../calendar.hpp"
#include "../data_sources.hpp"
#include "../granularity.hpp"
#include "../insight.hpp"
#include "../ledger.hpp"
#include "../logger.hpp"
#include "../period_aggregator.hpp"
#include <map>
#include <string>
#include <vector>

namespace finsight {

/**
 * @brief Everything a generator may read during one generation pass
 *
 * The referenced containers are owned by the caller and must outlive the
 * context. The aggregate reader and logger are optional (may be null).
 */
struct GeneratorContext {
    GeneratorContext(const std::vector<Transaction>& windowed,
                     const std::vector<Transaction>& all,
                     const LedgerSource& ledger,
                     const PeriodSummary& period_summary,
                     const std::vector<PeriodBucket>& period_buckets,
                     const CurrencyConverter& currency_converter);

    const std::vector<Transaction>& windowed_transactions;  ///< Transactions inside the window
    const std::vector<Transaction>& all_transactions;       ///< Full history
    const std::vector<Account>& accounts;
    const std::vector<Category>& categories;
    const std::vector<RecurringSeries>& recurring;
    const PeriodSummary& summary;                           ///< Totals over the windowed transactions
    const std::vector<PeriodBucket>& buckets;               ///< Shared bucket sequence
    const CurrencyConverter& converter;

    const AggregateReader* aggregates;   ///< Precomputed aggregates (null when unavailable)
    Logger* logger;                      ///< Optional logger

    Granularity granularity;
    std::string base_currency;
    Timestamp now;
    Timestamp reference_date;            ///< Anchor of the current/previous comparison
    DateWindow window;
    std::string current_key;             ///< Bucket key of the current period
    std::string previous_key;            ///< Bucket key of the previous period

    std::map<std::string, double> balances;  ///< Account id -> balance in the account's currency

    // Buckets
    const PeriodBucket* current_bucket() const;
    const PeriodBucket* previous_bucket() const;

    // Amounts in the base currency
    double resolve(const Transaction& tx) const;
    double series_monthly(const RecurringSeries& series) const;

    // Balances
    double balance_for(const std::string& account_id) const;
    double total_balance() const;          ///< Sum over accounts, converted to the base currency

    // Categories
    const Category* find_category(const std::string& name) const;
    bool is_income_category(const std::string& name) const;

    // Recurring
    std::vector<const RecurringSeries*> active_series() const;
    double recurring_expense_monthly() const;   ///< Active series outside income categories
    double monthly_recurring_net() const;       ///< Income series minus expense series

    // Aggregates (empty when no reader is attached)
    std::vector<MonthlyAggregate> last_months(int count, Timestamp anchor) const;
    std::vector<MonthlyAggregate> monthly_aggregates(Timestamp from, Timestamp to) const;
    std::vector<CategoryAggregate> category_aggregates(Timestamp from, Timestamp to) const;
};

/**
 * @brief Abstract insight generator
 *
 * Usage Example:
 *   @code
 *   std::vector<std::unique_ptr<InsightGenerator>> generators;
 *   generators.push_back(std::make_unique<SpendingGenerator>());
 *   for (const auto& g : generators) {
 *       auto produced = g->generate(context);
 *       insights.insert(insights.end(), produced.begin(), produced.end());
 *   }
 *   @endcode
 */
class InsightGenerator {
public:
    virtual ~InsightGenerator() = default;

    /**
     * @brief Short identifier used in logs ("spending", "cash_flow", ...)
     */
    virtual std::string name() const = 0;

    /**
     * @brief Category most of this generator's insights belong to
     */
    virtual InsightCategory category() const = 0;

    /**
     * @brief Produce insights for one pass
     *
     * @param context Shared read-only pass state
     * @return Insights in display order; empty when there is nothing to report
     */
    virtual std::vector<Insight> generate(const GeneratorContext& context) const = 0;
};

} // namespace finsight

#endif // FINSIGHT_INSIGHT_GENERATOR_HPP
