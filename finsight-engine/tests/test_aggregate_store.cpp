#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "aggregate_store.hpp"

using namespace finsight;
using Catch::Matchers::WithinAbs;

namespace {

Transaction make_tx(TransactionType type, double amount, const std::string& category, Timestamp date,
                    const std::string& currency = "USD") {
    Transaction tx;
    tx.id = category + "-" + format_date(date);
    tx.type = type;
    tx.amount = amount;
    tx.currency = currency;
    tx.category = category;
    tx.account_id = "checking";
    tx.date = date;
    return tx;
}

} // anonymous namespace

TEST_CASE("Aggregates are rebuilt per currency", "[aggregate_store]") {
    RateTableConverter rates;
    rates.add_rate("EUR", "USD", 2.0);

    std::vector<Transaction> txs = {
        make_tx(TransactionType::Income, 1000.0, "Salary", make_date(2026, 1, 3)),
        make_tx(TransactionType::Expense, 40.0, "Food", make_date(2026, 1, 10)),
        make_tx(TransactionType::Expense, 10.0, "Food", make_date(2026, 1, 20), "EUR"),
        make_tx(TransactionType::Expense, 75.0, "Rent", make_date(2026, 2, 1)),
        make_tx(TransactionType::Transfer, 500.0, "", make_date(2026, 2, 2))
    };

    InMemoryAggregateStore store;
    store.rebuild(txs, "USD", rates, make_date(2026, 2, 10));

    REQUIRE(store.has_currency("USD"));
    REQUIRE_FALSE(store.has_currency("EUR"));

    SECTION("Monthly totals resolve into the store currency and skip transfers") {
        auto months = store.fetch_monthly_aggregates(make_date(2026, 1, 1), make_date(2026, 3, 1), "USD");
        REQUIRE(months.size() == 2);
        REQUIRE(months[0].month == 1);
        REQUIRE_THAT(months[0].total_income, WithinAbs(1000.0, 1e-9));
        REQUIRE_THAT(months[0].total_expenses, WithinAbs(60.0, 1e-9));
        REQUIRE_THAT(months[1].total_expenses, WithinAbs(75.0, 1e-9));
        REQUIRE_THAT(months[1].total_income, WithinAbs(0.0, 1e-9));
    }

    SECTION("Category totals hold expenses only") {
        auto categories = store.fetch_category_aggregates(make_date(2026, 1, 1), make_date(2026, 2, 1), "USD");
        REQUIRE(categories.size() == 1);
        REQUIRE(categories[0].category_name == "Food");
        REQUIRE_THAT(categories[0].total_expenses, WithinAbs(60.0, 1e-9));
    }

    SECTION("A range overlapping part of a month returns the whole month") {
        auto months = store.fetch_monthly_aggregates(make_date(2026, 1, 25), make_date(2026, 1, 26), "USD");
        REQUIRE(months.size() == 1);
        REQUIRE(months[0].month == 1);
    }

    SECTION("Unknown currencies and empty ranges return nothing") {
        REQUIRE(store.fetch_monthly_aggregates(make_date(2026, 1, 1), make_date(2026, 3, 1), "EUR").empty());
        REQUIRE(store.fetch_monthly_aggregates(make_date(2026, 3, 1), make_date(2026, 1, 1), "USD").empty());
    }

    SECTION("Rebuilding replaces the previous data") {
        store.rebuild({}, "USD", rates, make_date(2026, 2, 10));
        REQUIRE_FALSE(store.has_currency("USD"));
    }
}

TEST_CASE("Transactions after today are left out of the aggregates", "[aggregate_store]") {
    RateTableConverter rates;
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(9);

    std::vector<Transaction> txs = {
        make_tx(TransactionType::Expense, 100.0, "Food", make_date(2025, 6, 1)),
        make_tx(TransactionType::Expense, 30.0, "Food", make_date(2026, 3, 18) + std::chrono::hours(22)),
        make_tx(TransactionType::Expense, 40.0, "Food", make_date(2026, 3, 25)),
        make_tx(TransactionType::Income, 500.0, "Salary", make_date(2026, 3, 19))
    };

    InMemoryAggregateStore store;
    store.rebuild(txs, "USD", rates, now);

    auto months = store.fetch_monthly_aggregates(make_date(2026, 3, 1), make_date(2026, 4, 1), "USD");
    REQUIRE(months.size() == 1);
    REQUIRE_THAT(months[0].total_expenses, WithinAbs(30.0, 1e-9));
    REQUIRE_THAT(months[0].total_income, WithinAbs(0.0, 1e-9));

    auto categories = store.fetch_category_aggregates(make_date(2026, 3, 1), make_date(2026, 4, 1), "USD");
    REQUIRE(categories.size() == 1);
    REQUIRE_THAT(categories[0].total_expenses, WithinAbs(30.0, 1e-9));
}

TEST_CASE("Single records can be written directly", "[aggregate_store]") {
    InMemoryAggregateStore store;
    store.put_monthly("USD", MonthlyAggregate{2025, 12, 10.0, 5.0});
    store.put_monthly("USD", MonthlyAggregate{2025, 12, 20.0, 8.0});
    store.put_category("USD", CategoryAggregate{"Food", 2025, 12, 8.0});

    auto months = store.fetch_monthly_aggregates(make_date(2025, 1, 1), make_date(2027, 1, 1), "USD");
    REQUIRE(months.size() == 1);
    REQUIRE_THAT(months[0].total_income, WithinAbs(20.0, 1e-9));

    store.clear();
    REQUIRE(store.fetch_category_aggregates(make_date(2025, 1, 1), make_date(2027, 1, 1), "USD").empty());
}
