#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "insight.hpp"

using namespace finsight;
using Catch::Matchers::WithinAbs;

TEST_CASE("Trend direction thresholds", "[insight]") {
    REQUIRE(trend_direction(2.5) == TrendDirection::Up);
    REQUIRE(trend_direction(2.0) == TrendDirection::Flat);
    REQUIRE(trend_direction(0.0) == TrendDirection::Flat);
    REQUIRE(trend_direction(-2.0) == TrendDirection::Flat);
    REQUIRE(trend_direction(-2.01) == TrendDirection::Down);
}

TEST_CASE("Percent change", "[insight]") {
    REQUIRE_THAT(*percent_change(110.0, 100.0), WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(*percent_change(50.0, 100.0), WithinAbs(-50.0, 1e-9));
    REQUIRE_FALSE(percent_change(10.0, 0.0).has_value());

    // A negative base still reports improvement as positive
    REQUIRE_THAT(*percent_change(-50.0, -100.0), WithinAbs(50.0, 1e-9));
}

TEST_CASE("Currency formatting", "[insight]") {
    SECTION("Two decimals with grouping") {
        REQUIRE(format_currency(1234.5, "USD") == "1,234.50 USD");
        REQUIRE(format_currency(1234567.891, "EUR") == "1,234,567.89 EUR");
        REQUIRE(format_currency(0.0, "USD") == "0.00 USD");
        REQUIRE(format_currency(-42.1, "USD") == "-42.10 USD");
        REQUIRE(format_currency(-0.001, "USD") == "0.00 USD");
    }

    SECTION("Smart formatting drops decimals for whole and large values") {
        REQUIRE(format_currency_smart(1500.0, "USD") == "1,500 USD");
        REQUIRE(format_currency_smart(250.75, "USD") == "251 USD");
        REQUIRE(format_currency_smart(12.5, "USD") == "12.50 USD");
        REQUIRE(format_currency_smart(-12.0, "USD") == "-12 USD");
    }

    SECTION("Plain numbers and percentages") {
        REQUIRE(format_number(3.14159, 2) == "3.14");
        REQUIRE(format_percent(12.345) == "12.3%");
        REQUIRE(format_percent(50.0, 0) == "50%");
    }
}

TEST_CASE("Detail factories set their kind", "[insight]") {
    CategoryBreakdownItem food{"Food", 300.0, 60.0, "#ff0000", {}};
    InsightDetail breakdown = InsightDetail::category_breakdown({food});
    REQUIRE(breakdown.kind == InsightDetailKind::CategoryBreakdown);
    REQUIRE(breakdown.categories.size() == 1);
    REQUIRE(breakdown.periods.empty());

    HealthScore score;
    score.score = 72;
    score.grade = "Good";
    InsightDetail health = InsightDetail::health_breakdown(score);
    REQUIRE(health.kind == InsightDetailKind::HealthScoreBreakdown);
    REQUIRE(health.health.has_value());
    REQUIRE(health.health->score == 72);

    REQUIRE(InsightDetail::wealth_breakdown({}).kind == InsightDetailKind::WealthBreakdown);
    REQUIRE(InsightDetail::account_comparison({}).kind == InsightDetailKind::AccountComparison);
}

TEST_CASE("Enum names", "[insight]") {
    REQUIRE(to_string(InsightType::TopSpendingCategory) == "topSpendingCategory");
    REQUIRE(to_string(InsightType::FinancialHealthScore) == "financialHealthScore");
    REQUIRE(to_string(InsightSeverity::Critical) == "critical");
    REQUIRE(to_string(InsightCategory::CashFlow) == "cashFlow");
    REQUIRE(to_string(TrendDirection::Flat) == "flat");
    REQUIRE(to_string(InsightDetailKind::BudgetProgress) == "budgetProgressList");
}
