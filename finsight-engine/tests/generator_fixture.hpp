/**
 * @file generator_fixture.hpp
 * @brief Household ledger shared by the generator tests
 *
 * Six months of history (Oct 2025 - Mar 2026) evaluated on 2026-03-18:
 * - Salary 3000 on the 1st, Rent 1000 on the 3rd, Fun 50 on the 12th
 * - Food rising every month: 100, 150, 200, 250, 300, 400
 * - one Interest payment of 120 into savings on 2025-12-01
 * - budgets: Rent 1000, Food 300, Fun 500 (monthly)
 * - recurring: two streaming subscriptions, a gym and an inactive series
 */

#ifndef FINSIGHT_TESTS_GENERATOR_FIXTURE_HPP
#define FINSIGHT_TESTS_GENERATOR_FIXTURE_HPP

#include "aggregate_store.hpp"
#include "currency.hpp"
#include "generators/insight_generator.hpp"
#include "period_aggregator.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace finsight {
namespace testing {

inline Transaction ledger_tx(const std::string& id, TransactionType type, double amount,
                             const std::string& category, Timestamp date,
                             const std::string& account = "checking") {
    Transaction tx;
    tx.id = id;
    tx.type = type;
    tx.amount = amount;
    tx.currency = "USD";
    tx.category = category;
    tx.account_id = account;
    tx.date = date;
    return tx;
}

inline Category ledger_category(const std::string& name, CategoryType type,
                                std::optional<double> budget = std::nullopt) {
    Category category;
    category.id = name;
    category.name = name;
    category.type = type;
    category.budget_amount = budget;
    category.budget_period = BudgetPeriod::Monthly;
    category.budget_reset_day = 1;
    category.color = "#000000";
    return category;
}

inline RecurringSeries ledger_series(const std::string& id, double amount, const std::string& category,
                                     RecurringKind kind, Timestamp start, bool active = true) {
    RecurringSeries series;
    series.id = id;
    series.description = id;
    series.amount = amount;
    series.currency = "USD";
    series.frequency = RecurringFrequency::Monthly;
    series.kind = kind;
    series.category = category;
    series.start_date = start;
    series.is_active = active;
    return series;
}

class GeneratorFixture {
public:
    GeneratorFixture()
        : now(make_date(2026, 3, 18) + std::chrono::hours(12))
    {
    }

    void populate() {
        Account checking;
        checking.id = "checking";
        checking.name = "Checking";
        checking.currency = "USD";
        checking.initial_balance = 1000.0;
        ledger.add_account(checking);

        Account savings;
        savings.id = "savings";
        savings.name = "Savings";
        savings.currency = "USD";
        savings.initial_balance = 5000.0;
        ledger.add_account(savings);

        ledger.add_category(ledger_category("Salary", CategoryType::Income));
        ledger.add_category(ledger_category("Interest", CategoryType::Income));
        ledger.add_category(ledger_category("Rent", CategoryType::Expense, 1000.0));
        ledger.add_category(ledger_category("Food", CategoryType::Expense, 300.0));
        ledger.add_category(ledger_category("Fun", CategoryType::Expense, 500.0));

        const double food[] = {100.0, 150.0, 200.0, 250.0, 300.0, 400.0};
        Timestamp month = make_date(2025, 10, 1);
        for (int i = 0; i < 6; ++i) {
            CivilDate date = to_civil(month);
            std::string suffix = std::to_string(i);
            ledger.add_transaction(ledger_tx("salary" + suffix, TransactionType::Income, 3000.0, "Salary",
                                             make_date(date.year, date.month, 1)));
            ledger.add_transaction(ledger_tx("rent" + suffix, TransactionType::Expense, 1000.0, "Rent",
                                             make_date(date.year, date.month, 3)));
            ledger.add_transaction(ledger_tx("food" + suffix, TransactionType::Expense, food[i], "Food",
                                             make_date(date.year, date.month, 10)));
            ledger.add_transaction(ledger_tx("fun" + suffix, TransactionType::Expense, 50.0, "Fun",
                                             make_date(date.year, date.month, 12)));
            month = add_months(month, 1);
        }
        ledger.add_transaction(ledger_tx("interest", TransactionType::Income, 120.0, "Interest",
                                         make_date(2025, 12, 1), "savings"));

        ledger.add_recurring(ledger_series("Netflix", 15.99, "Streaming", RecurringKind::Subscription,
                                           make_date(2025, 1, 1)));
        ledger.add_recurring(ledger_series("Spotify", 9.99, "Streaming", RecurringKind::Subscription,
                                           make_date(2026, 2, 1)));
        ledger.add_recurring(ledger_series("Gym", 40.0, "Fitness", RecurringKind::Generic,
                                           make_date(2025, 6, 1)));
        ledger.add_recurring(ledger_series("Magazine", 100.0, "Reading", RecurringKind::Subscription,
                                           make_date(2024, 1, 1), false));

        store.rebuild(ledger.transactions(), "USD", rates, now);
    }

    // Pass state for one granularity; the context refers to members of the fixture
    GeneratorContext context(Granularity granularity = Granularity::Month, bool with_aggregates = true) {
        const AggregateReader* reader = with_aggregates ? &store : nullptr;
        PeriodAggregator aggregator(reader, rates);
        AggregationResult result = aggregator.aggregate(granularity, ledger.transactions(), "USD", now);

        buckets = result.buckets;
        windowed = filter_by_window(ledger.transactions(), result.window);
        summary = compute_period_summary(windowed, "USD", rates, now);

        GeneratorContext ctx(windowed, ledger.transactions(), ledger, summary, buckets, rates);
        ctx.aggregates = reader;
        ctx.granularity = granularity;
        ctx.base_currency = "USD";
        ctx.now = now;
        ctx.reference_date = now;
        ctx.window = result.window;
        ctx.current_key = current_period_key(granularity, now);
        ctx.previous_key = previous_period_key(granularity, now);
        ctx.balances = compute_account_balances(ledger.accounts(), ledger.transactions(), now);
        return ctx;
    }

    Timestamp now;
    InMemoryLedger ledger;
    RateTableConverter rates;
    InMemoryAggregateStore store;

    std::vector<Transaction> windowed;
    PeriodSummary summary;
    std::vector<PeriodBucket> buckets;
};

inline const Insight* find_insight(const std::vector<Insight>& insights, const std::string& id) {
    auto it = std::find_if(insights.begin(), insights.end(),
                           [&id](const Insight& insight) { return insight.id == id; });
    return it != insights.end() ? &*it : nullptr;
}

} // namespace testing
} // namespace finsight

#endif // FINSIGHT_TESTS_GENERATOR_FIXTURE_HPP
