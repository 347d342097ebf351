/**
 * @file test_insights_orchestrator.cpp
 * @brief Unit tests for InsightsOrchestrator
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "aggregate_store.hpp"
#include "currency.hpp"
#include "insights_orchestrator.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace finsight;
using Catch::Matchers::WithinAbs;

namespace {

Transaction make_tx(const std::string& id, TransactionType type, double amount,
                    const std::string& category, Timestamp date, const std::string& currency = "USD") {
    Transaction tx;
    tx.id = id;
    tx.type = type;
    tx.amount = amount;
    tx.currency = currency;
    tx.category = category;
    tx.account_id = "checking";
    tx.date = date;
    return tx;
}

// Three months of salary, rent and groceries up to 2026-03-18
InMemoryLedger make_ledger() {
    InMemoryLedger ledger;

    Account checking;
    checking.id = "checking";
    checking.name = "Checking";
    checking.currency = "USD";
    checking.initial_balance = 2000.0;
    ledger.add_account(checking);

    Category salary;
    salary.id = salary.name = "Salary";
    salary.type = CategoryType::Income;
    ledger.add_category(salary);

    Category food;
    food.id = food.name = "Food";
    food.type = CategoryType::Expense;
    food.budget_amount = 500.0;
    ledger.add_category(food);

    for (unsigned month = 1; month <= 3; ++month) {
        std::string m = std::to_string(month);
        ledger.add_transaction(make_tx("salary" + m, TransactionType::Income, 4000.0, "Salary",
                                       make_date(2026, month, 1)));
        ledger.add_transaction(make_tx("rent" + m, TransactionType::Expense, 1500.0, "Rent",
                                       make_date(2026, month, 2)));
        ledger.add_transaction(make_tx("food" + m, TransactionType::Expense, 200.0 + 50.0 * month, "Food",
                                       make_date(2026, month, 9)));
    }
    ledger.add_transaction(make_tx("trip", TransactionType::Expense, 300.0, "Travel",
                                   make_date(2026, 2, 20), "EUR"));
    return ledger;
}

// Emits one insight per pass and counts how often it ran
class CountingGenerator : public InsightGenerator {
public:
    explicit CountingGenerator(int* runs) : runs_(runs) {}

    std::string name() const override { return "counting"; }
    InsightCategory category() const override { return InsightCategory::Spending; }

    std::vector<Insight> generate(const GeneratorContext& context) const override {
        ++*runs_;
        Insight insight;
        insight.id = "count_" + context.current_key;
        insight.type = InsightType::NetCashFlow;
        insight.title = "Counted";
        insight.severity = InsightSeverity::Neutral;
        insight.category = InsightCategory::CashFlow;
        return {insight};
    }

private:
    int* runs_;
};

class FailingGenerator : public InsightGenerator {
public:
    std::string name() const override { return "failing"; }
    InsightCategory category() const override { return InsightCategory::Budget; }

    std::vector<Insight> generate(const GeneratorContext&) const override {
        throw std::runtime_error("budget table unavailable");
    }
};

bool has_insight(const std::vector<Insight>& insights, const std::string& id) {
    return std::any_of(insights.begin(), insights.end(),
                       [&id](const Insight& insight) { return insight.id == id; });
}

} // anonymous namespace

TEST_CASE("Cache keys", "[orchestrator]") {
    REQUIRE(InsightsOrchestrator::make_cache_key(Granularity::Month, "USD") == "granularity_month_USD");
    REQUIRE(InsightsOrchestrator::make_cache_key(Granularity::AllTime, "EUR") == "granularity_allTime_EUR");

    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(12);
    TimeFilter month = TimeFilter::from_preset(TimeFilterPreset::ThisMonth, now);
    REQUIRE(InsightsOrchestrator::make_cache_key(month, "USD") ==
            "thisMonth_USD_" + std::to_string(to_epoch_seconds(make_date(2026, 3, 1))));

    TimeFilter custom = TimeFilter::custom(make_date(2026, 1, 1), make_date(2026, 2, 1));
    REQUIRE(InsightsOrchestrator::make_cache_key(custom, "GBP") == "custom_GBP_1767225600_1769904000");

    SECTION("Currency is recovered from either key form") {
        REQUIRE(InsightsOrchestrator::currency_of_key("granularity_week_USD") == "USD");
        REQUIRE(InsightsOrchestrator::currency_of_key("custom_GBP_1767225600_1769904000") == "GBP");
        REQUIRE(InsightsOrchestrator::currency_of_key("thisMonth_EUR_1772323200") == "EUR");
        REQUIRE(InsightsOrchestrator::currency_of_key("garbage").empty());
    }

    SECTION("Currencies that would break the key format are rejected") {
        REQUIRE_THROWS_AS(InsightsOrchestrator::make_cache_key(Granularity::Month, "US_D"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(InsightsOrchestrator::make_cache_key(month, ""), std::invalid_argument);

        InMemoryLedger ledger = make_ledger();
        RateTableConverter rates;
        InsightsOrchestrator orchestrator(ledger, rates, nullptr, OrchestratorConfig(), nullptr,
                                          [&now] { return now; });
        REQUIRE_THROWS_AS(orchestrator.generate_all_insights(Granularity::Month, "EUR_1"),
                          std::invalid_argument);
        REQUIRE(orchestrator.cache_stats().entries_count == 0);
    }
}

TEST_CASE("Default generators run in a fixed order", "[orchestrator]") {
    InMemoryLedger ledger;
    RateTableConverter rates;
    InsightsOrchestrator orchestrator(ledger, rates);

    REQUIRE(orchestrator.generator_names() == std::vector<std::string>{
        "spending", "income", "budget", "recurring", "cash_flow",
        "wealth", "savings", "forecasting", "health_score"});
}

TEST_CASE("Repeated requests are served from cache", "[orchestrator]") {
    InMemoryLedger ledger = make_ledger();
    RateTableConverter rates;
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(12);
    ClockFn clock = [&now] { return now; };

    int runs = 0;
    std::vector<std::unique_ptr<InsightGenerator>> generators;
    generators.push_back(std::make_unique<CountingGenerator>(&runs));
    InsightsOrchestrator orchestrator(ledger, rates, nullptr, std::move(generators),
                                      OrchestratorConfig(), nullptr, clock);

    GranularityResult first = orchestrator.generate_all_insights(Granularity::Month, "USD");
    GranularityResult second = orchestrator.generate_all_insights(Granularity::Month, "USD");

    REQUIRE(runs == 1);
    REQUIRE(first.insights.size() == 1);
    REQUIRE(second.insights[0].id == first.insights[0].id);
    REQUIRE(second.buckets.size() == first.buckets.size());
    REQUIRE(orchestrator.cache_stats().hits == 1);
    REQUIRE(orchestrator.cache_stats().misses == 1);

    SECTION("Entries expire after the TTL") {
        now += std::chrono::seconds(301);
        orchestrator.generate_all_insights(Granularity::Month, "USD");
        REQUIRE(runs == 2);
        REQUIRE(orchestrator.cache_stats().expirations == 1);
    }

    SECTION("Invalidation forces a recompute") {
        orchestrator.invalidate_cache();
        REQUIRE(orchestrator.cache_stats().entries_count == 0);
        orchestrator.generate_all_insights(Granularity::Month, "USD");
        REQUIRE(runs == 2);
    }

    SECTION("Currencies are cached separately") {
        orchestrator.generate_all_insights(Granularity::Month, "EUR");
        orchestrator.generate_all_insights(TimeFilter::from_preset(TimeFilterPreset::ThisMonth, now), "EUR");
        REQUIRE(runs == 3);

        REQUIRE(orchestrator.invalidate_currency("EUR") == 2);
        REQUIRE(orchestrator.cache_stats().entries_count == 1);

        orchestrator.generate_all_insights(Granularity::Month, "USD");
        REQUIRE(runs == 3);
        orchestrator.generate_all_insights(Granularity::Month, "EUR");
        REQUIRE(runs == 4);
    }
}

TEST_CASE("A failing generator does not poison the cache", "[orchestrator]") {
    InMemoryLedger ledger = make_ledger();
    RateTableConverter rates;
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(12);

    const std::string log_path = "test_orchestrator_failure.log";
    std::filesystem::remove(log_path);
    LoggerConfig log_config;
    log_config.enable_console = false;
    log_config.enable_file = true;
    log_config.log_file_path = log_path;

    int runs = 0;
    {
        Logger logger(log_config);
        std::vector<std::unique_ptr<InsightGenerator>> generators;
        generators.push_back(std::make_unique<FailingGenerator>());
        generators.push_back(std::make_unique<CountingGenerator>(&runs));
        InsightsOrchestrator orchestrator(ledger, rates, nullptr, std::move(generators),
                                          OrchestratorConfig(), &logger, [&now] { return now; });

        GranularityResult result = orchestrator.generate_all_insights(Granularity::Month, "USD");
        REQUIRE(result.insights.size() == 1);
        REQUIRE(result.insights[0].id == "count_2026-03");
        REQUIRE(orchestrator.cache_stats().entries_count == 0);

        orchestrator.generate_all_insights(Granularity::Month, "USD");
        REQUIRE(runs == 2);
    }

    std::ifstream file(log_path);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("\"event\":\"generator_failed\"") != std::string::npos);
    REQUIRE(contents.find("budget table unavailable") != std::string::npos);
    file.close();
    std::filesystem::remove(log_path);
}

TEST_CASE("Every granularity in one call", "[orchestrator]") {
    InMemoryLedger ledger = make_ledger();
    RateTableConverter rates;
    rates.add_rate("EUR", "USD", 1.1);
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(12);
    InMemoryAggregateStore aggregates;
    aggregates.rebuild(ledger.transactions(), "USD", rates, now);

    InsightsOrchestrator orchestrator(ledger, rates, &aggregates, OrchestratorConfig(), nullptr,
                                      [&now] { return now; });

    auto results = orchestrator.compute_all_granularities("USD");
    REQUIRE(results.size() == 5);
    REQUIRE(results[Granularity::Week].buckets.size() == 53);
    REQUIRE(results[Granularity::Month].buckets.size() == 3);
    REQUIRE(results[Granularity::Quarter].buckets.size() == 1);
    REQUIRE(results[Granularity::Year].buckets.size() == 1);
    REQUIRE(results[Granularity::AllTime].buckets.size() == 1);
    REQUIRE(orchestrator.cache_stats().entries_count == 5);

    const GranularityResult& month = results[Granularity::Month];
    REQUIRE(month.buckets.back().key == "2026-03");
    REQUIRE(has_insight(month.insights, "top_spending_Rent"));
    REQUIRE(has_insight(month.insights, "health_score"));
    REQUIRE(has_insight(month.insights, "net_cashflow"));

    // The EUR trip lands in February at the table rate
    REQUIRE_THAT(month.buckets[1].expenses, WithinAbs(1500.0 + 300.0 + 330.0, 1e-9));

    SECTION("Year and all-time buckets agree") {
        REQUIRE_THAT(results[Granularity::Year].buckets[0].expenses,
                     WithinAbs(results[Granularity::AllTime].buckets[0].expenses, 1e-9));
    }

    SECTION("A second call is served entirely from cache") {
        orchestrator.compute_all_granularities("USD");
        REQUIRE(orchestrator.cache_stats().hits == 5);
    }
}

TEST_CASE("Capacity bounds the number of cached passes", "[orchestrator]") {
    InMemoryLedger ledger = make_ledger();
    RateTableConverter rates;

    OrchestratorConfig config;
    config.cache_capacity = 2;
    InsightsOrchestrator orchestrator(ledger, rates, nullptr, config);

    orchestrator.compute_all_granularities("USD");
    cache::CacheStats stats = orchestrator.cache_stats();
    REQUIRE(stats.entries_count == 2);
    REQUIRE(stats.evictions == 3);
}

TEST_CASE("Insights for a time filter", "[orchestrator]") {
    InMemoryLedger ledger = make_ledger();
    RateTableConverter rates;
    rates.add_rate("EUR", "USD", 1.1);
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(12);

    InsightsOrchestrator orchestrator(ledger, rates, nullptr, OrchestratorConfig(), nullptr,
                                      [&now] { return now; });

    SECTION("This month compares against last month") {
        auto insights = orchestrator.generate_all_insights(
            TimeFilter::from_preset(TimeFilterPreset::ThisMonth, now), "USD");
        REQUIRE(has_insight(insights, "top_spending_Rent"));
        REQUIRE(has_insight(insights, "mom_spending"));
        REQUIRE(has_insight(insights, "health_score"));

        orchestrator.generate_all_insights(TimeFilter::from_preset(TimeFilterPreset::ThisMonth, now), "USD");
        REQUIRE(orchestrator.cache_stats().hits == 1);
    }

    SECTION("A past custom range is anchored at its end") {
        TimeFilter january = TimeFilter::custom(make_date(2026, 1, 1), make_date(2026, 2, 1));
        auto insights = orchestrator.generate_all_insights(january, "USD");
        REQUIRE(has_insight(insights, "top_spending_Rent"));
        REQUIRE_FALSE(has_insight(insights, "mom_spending"));
    }

    SECTION("An empty range yields no spending insights") {
        TimeFilter future = TimeFilter::custom(make_date(2027, 1, 1), make_date(2027, 2, 1));
        auto insights = orchestrator.generate_all_insights(future, "USD");
        REQUIRE_FALSE(has_insight(insights, "top_spending_Rent"));
        REQUIRE_FALSE(has_insight(insights, "health_score"));
    }
}
