#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "currency.hpp"
#include <stdexcept>

using namespace finsight;
using Catch::Matchers::WithinAbs;

TEST_CASE("Rate table lookups", "[currency]") {
    RateTableConverter rates;
    rates.add_rate("EUR", "USD", 1.10);
    rates.add_rate("GBP", "EUR", 1.20);

    SECTION("Same currency is identity") {
        REQUIRE_THAT(*rates.rate("USD", "USD"), WithinAbs(1.0, 1e-12));
    }

    SECTION("Direct and inverse rates") {
        REQUIRE_THAT(*rates.rate("EUR", "USD"), WithinAbs(1.10, 1e-12));
        REQUIRE_THAT(*rates.rate("USD", "EUR"), WithinAbs(1.0 / 1.10, 1e-12));
    }

    SECTION("One hop through a pivot currency") {
        REQUIRE_THAT(*rates.rate("GBP", "USD"), WithinAbs(1.20 * 1.10, 1e-12));
        REQUIRE_THAT(*rates.convert(100.0, "USD", "GBP"), WithinAbs(100.0 / (1.20 * 1.10), 1e-9));
    }

    SECTION("Unknown currencies have no rate") {
        REQUIRE_FALSE(rates.rate("JPY", "USD").has_value());
        REQUIRE_FALSE(rates.convert(10.0, "USD", "JPY").has_value());
    }

    SECTION("Rates must be positive") {
        REQUIRE_THROWS_AS(rates.add_rate("USD", "CHF", 0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(rates.add_rate("USD", "CHF", -1.0), std::invalid_argument);
    }
}

TEST_CASE("Currency codes", "[currency]") {
    REQUIRE(is_valid_currency_code("USD"));
    REQUIRE(is_valid_currency_code("usdt"));
    REQUIRE(is_valid_currency_code("X1"));
    REQUIRE_FALSE(is_valid_currency_code(""));
    REQUIRE_FALSE(is_valid_currency_code("USD_EUR"));
    REQUIRE_FALSE(is_valid_currency_code("EU-R"));
    REQUIRE_FALSE(is_valid_currency_code(" USD"));
}

TEST_CASE("Resolving transaction amounts", "[currency]") {
    RateTableConverter rates;
    rates.add_rate("EUR", "USD", 1.10);

    Transaction tx;
    tx.id = "t1";
    tx.amount = 100.0;

    SECTION("Base currency amounts are used as is") {
        tx.currency = "USD";
        tx.converted_amount = 999.0;
        REQUIRE_THAT(resolve_amount(tx, "USD", rates), WithinAbs(100.0, 1e-12));
    }

    SECTION("Stored conversion wins over the rate table") {
        tx.currency = "EUR";
        tx.converted_amount = 105.0;
        REQUIRE_THAT(resolve_amount(tx, "USD", rates), WithinAbs(105.0, 1e-12));
    }

    SECTION("Rate table conversion") {
        tx.currency = "EUR";
        REQUIRE_THAT(resolve_amount(tx, "USD", rates), WithinAbs(110.0, 1e-9));
    }

    SECTION("Missing rate falls back to the raw amount") {
        tx.currency = "JPY";
        REQUIRE_THAT(resolve_amount(tx, "USD", rates), WithinAbs(100.0, 1e-12));
    }
}

TEST_CASE("Monthly equivalents", "[currency]") {
    REQUIRE_THAT(monthly_equivalent(10.0, RecurringFrequency::Daily), WithinAbs(300.0, 1e-9));
    REQUIRE_THAT(monthly_equivalent(10.0, RecurringFrequency::Weekly), WithinAbs(43.3, 1e-9));
    REQUIRE_THAT(monthly_equivalent(10.0, RecurringFrequency::Monthly), WithinAbs(10.0, 1e-9));
    REQUIRE_THAT(monthly_equivalent(120.0, RecurringFrequency::Yearly), WithinAbs(10.0, 1e-9));

    SECTION("Series are converted into the base currency") {
        RateTableConverter rates;
        rates.add_rate("EUR", "USD", 1.10);

        RecurringSeries series;
        series.id = "r1";
        series.amount = 120.0;
        series.currency = "EUR";
        series.frequency = RecurringFrequency::Yearly;

        REQUIRE_THAT(monthly_equivalent(series, "USD", rates), WithinAbs(11.0, 1e-9));
        REQUIRE_THAT(monthly_equivalent(series, "EUR", rates), WithinAbs(10.0, 1e-9));
    }
}
