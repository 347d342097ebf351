#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "granularity.hpp"
#include <stdexcept>

using namespace finsight;
using Catch::Approx;

TEST_CASE("Granularity names round trip", "[granularity]") {
    for (Granularity g : all_granularities()) {
        REQUIRE(granularity_from_string(to_string(g)) == g);
    }
    REQUIRE(granularity_from_string("all") == Granularity::AllTime);
    REQUIRE_THROWS_AS(granularity_from_string("fortnight"), std::invalid_argument);
}

TEST_CASE("Period keys", "[granularity]") {
    Timestamp t = make_date(2026, 2, 15);

    REQUIRE(period_key(Granularity::Week, t) == "2026-W07");
    REQUIRE(period_key(Granularity::Month, t) == "2026-02");
    REQUIRE(period_key(Granularity::Quarter, t) == "2026-Q1");
    REQUIRE(period_key(Granularity::Year, t) == "2026");
    REQUIRE(period_key(Granularity::AllTime, t) == "all");

    SECTION("Week keys use the ISO week-numbering year") {
        REQUIRE(period_key(Granularity::Week, make_date(2027, 1, 1)) == "2026-W53");
    }
}

TEST_CASE("Keys parse back to period starts", "[granularity]") {
    REQUIRE(period_start_for_key(Granularity::Month, "2026-02") == make_date(2026, 2, 1));
    REQUIRE(period_start_for_key(Granularity::Quarter, "2026-Q3") == make_date(2026, 7, 1));
    REQUIRE(period_start_for_key(Granularity::Year, "2025") == make_date(2025, 1, 1));
    REQUIRE(period_start_for_key(Granularity::Week, "2026-W01") == make_date(2025, 12, 29));

    REQUIRE_THROWS_AS(period_start_for_key(Granularity::Month, "2026-13"), std::invalid_argument);
    REQUIRE_THROWS_AS(period_start_for_key(Granularity::AllTime, "all"), std::invalid_argument);
}

TEST_CASE("Default windows end at the start of tomorrow", "[granularity]") {
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(10);
    Timestamp tomorrow = make_date(2026, 3, 19);
    Timestamp first = make_date(2024, 5, 20);

    SECTION("Week covers 52 weeks before the current week") {
        DateWindow w = granularity_window(Granularity::Week, first, now);
        REQUIRE(w.start == add_weeks(make_date(2026, 3, 16), -52));
        REQUIRE(w.end == tomorrow);
    }

    SECTION("Month starts at the first transaction's month") {
        DateWindow w = granularity_window(Granularity::Month, first, now);
        REQUIRE(w.start == make_date(2024, 5, 1));
        REQUIRE(w.end == tomorrow);
    }

    SECTION("Quarter and year snap to their period start") {
        REQUIRE(granularity_window(Granularity::Quarter, first, now).start == make_date(2024, 4, 1));
        REQUIRE(granularity_window(Granularity::Year, first, now).start == make_date(2024, 1, 1));
    }

    SECTION("Fallback lookbacks without transactions") {
        REQUIRE(granularity_window(Granularity::Month, std::nullopt, now).start == make_date(2025, 3, 1));
        REQUIRE(granularity_window(Granularity::Year, std::nullopt, now).start == make_date(2023, 1, 1));
    }

    SECTION("All time starts at the first transaction") {
        REQUIRE(granularity_window(Granularity::AllTime, first, now).start == first);
    }
}

TEST_CASE("Period labels", "[granularity]") {
    Timestamp now = make_date(2026, 6, 1);

    REQUIRE(period_label(Granularity::Month, make_date(2024, 1, 1), now) == "Jan 2024");
    REQUIRE(period_label(Granularity::Quarter, make_date(2026, 4, 1), now) == "Q2 2026");
    REQUIRE(period_label(Granularity::Year, make_date(2026, 1, 1), now) == "2026");
    REQUIRE(period_label(Granularity::AllTime, make_date(2026, 1, 1), now) == "All time");

    SECTION("Week labels carry a year suffix outside the current ISO year") {
        REQUIRE(period_label(Granularity::Week, make_date(2026, 3, 2), now) == "2 Mar");
        REQUIRE(period_label(Granularity::Week, make_date(2025, 3, 3), now) == "3 Mar'25");
    }
}

TEST_CASE("Current and previous keys", "[granularity]") {
    Timestamp reference = make_date(2026, 1, 15);

    REQUIRE(current_period_key(Granularity::Month, reference) == "2026-01");
    REQUIRE(previous_period_key(Granularity::Month, reference) == "2025-12");
    REQUIRE(previous_period_key(Granularity::Quarter, reference) == "2025-Q4");
    REQUIRE(previous_period_key(Granularity::Year, reference) == "2025");
    REQUIRE(previous_period_key(Granularity::Week, reference) == "2026-W02");
    REQUIRE(previous_period_key(Granularity::AllTime, reference) == "all");
}

TEST_CASE("Granularity wording", "[granularity]") {
    REQUIRE(comparison_period_name(Granularity::Week) == "vs prev. week");
    REQUIRE(period_over_period_title(Granularity::Quarter) == "Quarterly Spending Change");
    REQUIRE(best_period_title(Granularity::Month) == "Best Month");
    REQUIRE(worst_period_title(Granularity::Year) == "Worst Year");
    REQUIRE(total_recurring_title(Granularity::Week) == "Weekly Recurring");
    REQUIRE(period_unit(Granularity::Quarter) == "per quarter");

    REQUIRE(monthly_to_period_multiplier(Granularity::Week) == Approx(7.0 / 30.0));
    REQUIRE(monthly_to_period_multiplier(Granularity::Year) == Approx(12.0));
}
