#include <catch2/catch_test_macros.hpp>
#include "time_filter.hpp"
#include <stdexcept>

using namespace finsight;

TEST_CASE("Preset names round trip", "[time_filter]") {
    REQUIRE(time_filter_preset_from_string("last30Days") == TimeFilterPreset::Last30Days);
    REQUIRE(to_string(TimeFilterPreset::ThisMonth) == "thisMonth");
    REQUIRE_THROWS_AS(time_filter_preset_from_string("nextYear"), std::invalid_argument);
}

TEST_CASE("Presets resolve against now", "[time_filter]") {
    // Wednesday
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(14);

    SECTION("Today and yesterday") {
        TimeFilter today = TimeFilter::from_preset(TimeFilterPreset::Today, now);
        REQUIRE(today.start == make_date(2026, 3, 18));
        REQUIRE(today.end == make_date(2026, 3, 19));

        TimeFilter yesterday = TimeFilter::from_preset(TimeFilterPreset::Yesterday, now);
        REQUIRE(yesterday.start == make_date(2026, 3, 17));
        REQUIRE(yesterday.end == make_date(2026, 3, 18));
    }

    SECTION("This week runs Monday to Monday") {
        TimeFilter week = TimeFilter::from_preset(TimeFilterPreset::ThisWeek, now);
        REQUIRE(week.start == make_date(2026, 3, 16));
        REQUIRE(week.end == make_date(2026, 3, 23));
    }

    SECTION("Last 30 days includes today") {
        TimeFilter last30 = TimeFilter::from_preset(TimeFilterPreset::Last30Days, now);
        REQUIRE(last30.start == make_date(2026, 2, 16));
        REQUIRE(last30.end == make_date(2026, 3, 19));
    }

    SECTION("Calendar months and years") {
        TimeFilter this_month = TimeFilter::from_preset(TimeFilterPreset::ThisMonth, now);
        REQUIRE(this_month.start == make_date(2026, 3, 1));
        REQUIRE(this_month.end == make_date(2026, 4, 1));

        TimeFilter last_month = TimeFilter::from_preset(TimeFilterPreset::LastMonth, now);
        REQUIRE(last_month.start == make_date(2026, 2, 1));
        REQUIRE(last_month.end == make_date(2026, 3, 1));

        TimeFilter last_year = TimeFilter::from_preset(TimeFilterPreset::LastYear, now);
        REQUIRE(last_year.start == make_date(2025, 1, 1));
        REQUIRE(last_year.end == make_date(2026, 1, 1));
    }

    SECTION("All time covers everything up to now") {
        TimeFilter all = TimeFilter::from_preset(TimeFilterPreset::AllTime, now);
        REQUIRE(all.range().contains(make_date(1990, 1, 1)));
        REQUIRE(all.range().contains(now));
    }
}

TEST_CASE("Custom ranges", "[time_filter]") {
    TimeFilter filter = TimeFilter::custom(make_date(2026, 1, 1), make_date(2026, 4, 1));
    REQUIRE(filter.preset == TimeFilterPreset::Custom);
    REQUIRE(filter.display_name() == "2026-01-01 - 2026-04-01");

    REQUIRE_THROWS_AS(TimeFilter::custom(make_date(2026, 4, 1), make_date(2026, 1, 1)),
                      std::invalid_argument);
}

TEST_CASE("Reference date", "[time_filter]") {
    Timestamp now = make_date(2026, 3, 18) + std::chrono::hours(14);

    SECTION("Filters reaching today anchor on now") {
        TimeFilter filter = TimeFilter::from_preset(TimeFilterPreset::ThisMonth, now);
        REQUIRE(reference_date(filter, now) == now);
    }

    SECTION("Past filters anchor on their last instant") {
        TimeFilter filter = TimeFilter::from_preset(TimeFilterPreset::LastMonth, now);
        Timestamp reference = reference_date(filter, now);
        REQUIRE(reference < make_date(2026, 3, 1));
        REQUIRE(reference >= make_date(2026, 2, 28));
    }
}
