#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/json_writer.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace finsight;
using namespace finsight::io;
using json = nlohmann::json;

namespace {

PeriodBucket make_bucket() {
    PeriodBucket bucket;
    bucket.key = "2026-02";
    bucket.granularity = Granularity::Month;
    bucket.period_start = make_date(2026, 2, 1);
    bucket.period_end = make_date(2026, 3, 1);
    bucket.label = "Feb 2026";
    bucket.income = 3000.0;
    bucket.expenses = 1250.0;
    return bucket;
}

Insight make_insight() {
    Insight insight;
    insight.id = "net_cashflow";
    insight.type = InsightType::NetCashFlow;
    insight.title = "Net Cash Flow";
    insight.subtitle = "Feb 2026";
    insight.metric.value = 1750.0;
    insight.metric.formatted_value = "1,750 USD";
    insight.metric.currency = "USD";
    insight.severity = InsightSeverity::Positive;
    insight.category = InsightCategory::CashFlow;
    return insight;
}

} // anonymous namespace

TEST_CASE("Bucket JSON", "[json_writer]") {
    PeriodBucket bucket = make_bucket();
    json j = to_json(bucket);

    REQUIRE(j["key"] == "2026-02");
    REQUIRE(j["granularity"] == "month");
    REQUIRE(j["period_start"] == "2026-02-01");
    REQUIRE(j["period_end"] == "2026-03-01");
    REQUIRE(j["net_flow"].get<double>() == 1750.0);
    REQUIRE_FALSE(j.contains("cumulative_balance"));

    bucket.cumulative_balance = 9000.0;
    REQUIRE(to_json(bucket)["cumulative_balance"].get<double>() == 9000.0);
}

TEST_CASE("Insight JSON omits empty optionals", "[json_writer]") {
    Insight insight = make_insight();
    json j = to_json(insight);

    REQUIRE(j["type"] == "netCashFlow");
    REQUIRE(j["severity"] == "positive");
    REQUIRE(j["category"] == "cashFlow");
    REQUIRE(j["metric"]["currency"] == "USD");
    REQUIRE_FALSE(j["metric"].contains("unit"));
    REQUIRE_FALSE(j.contains("trend"));
    REQUIRE_FALSE(j.contains("detail"));

    SECTION("Trend and period detail") {
        InsightTrend trend;
        trend.direction = TrendDirection::Down;
        trend.change_absolute = -120.0;
        trend.comparison_period = "vs average";
        insight.trend = trend;
        insight.detail = InsightDetail::period_trend({make_bucket()});

        json full = to_json(insight);
        REQUIRE(full["trend"]["direction"] == "down");
        REQUIRE(full["trend"]["change_absolute"].get<double>() == -120.0);
        REQUIRE_FALSE(full["trend"].contains("change_percent"));
        REQUIRE(full["detail"]["kind"] == "periodTrend");
        REQUIRE(full["detail"]["items"].size() == 1);
        REQUIRE(full["detail"]["items"][0]["label"] == "Feb 2026");
    }

    SECTION("Health detail") {
        HealthScore score;
        score.score = 64;
        score.grade = "Good";
        score.cashflow_score = 100;
        insight.detail = InsightDetail::health_breakdown(score);

        json full = to_json(insight);
        REQUIRE(full["detail"]["kind"] == "healthScore");
        REQUIRE(full["detail"]["health"]["grade"] == "Good");
        REQUIRE(full["detail"]["health"]["cashflow_score"] == 100);
        REQUIRE_FALSE(full["detail"].contains("items"));
    }

    SECTION("Account detail carries the last activity date") {
        AccountItem account;
        account.id = "savings";
        account.account_name = "Savings";
        account.currency = "USD";
        account.balance = 5120.0;
        account.transaction_count = 1;
        account.last_activity_date = make_date(2025, 12, 1);
        insight.detail = InsightDetail::account_comparison({account});

        json items = to_json(insight)["detail"]["items"];
        REQUIRE(items[0]["last_activity_date"] == "2025-12-01");
        REQUIRE(items[0]["transaction_count"] == 1);
    }
}

TEST_CASE("Writing documents", "[json_writer]") {
    json document = {{"insights", insights_to_json({make_insight()})},
                     {"buckets", buckets_to_json({make_bucket()})}};

    SECTION("Compact and pretty output parse back to the same document") {
        std::ostringstream compact;
        write_json(compact, document, false);
        REQUIRE(compact.str().find('\n') == compact.str().size() - 1);
        REQUIRE(json::parse(compact.str()) == document);

        std::ostringstream pretty;
        write_json(pretty, document);
        REQUIRE(pretty.str().find("\n  \"buckets\"") != std::string::npos);
    }

    SECTION("File output") {
        const std::string path = "test_json_writer_output.json";
        write_json(path, document);
        std::ifstream file(path);
        REQUIRE(json::parse(file)["insights"][0]["id"] == "net_cashflow");
        file.close();
        std::filesystem::remove(path);
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_WITH(write_json(std::string("no_such_dir/out.json"), document),
                            Catch::Matchers::ContainsSubstring("Failed to open output file"));
    }
}
