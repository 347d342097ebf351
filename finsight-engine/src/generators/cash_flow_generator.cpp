#include "cash_flow_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>

namespace finsight {

namespace {

Insight net_flow_insight(const std::string& id, InsightType type, const std::string& title,
                         const PeriodBucket& bucket, InsightSeverity severity,
                         const GeneratorContext& context) {
    Insight insight;
    insight.id = id;
    insight.type = type;
    insight.title = title;
    insight.subtitle = bucket.label;
    insight.metric = currency_metric(bucket.net_flow(), context.base_currency);
    insight.severity = severity;
    insight.category = InsightCategory::CashFlow;
    insight.detail = InsightDetail::period_trend(context.buckets);
    return insight;
}

} // anonymous namespace

std::vector<Insight> CashFlowGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;
    const std::vector<PeriodBucket>& buckets = context.buckets;
    if (buckets.size() < 2) {
        return insights;
    }

    const PeriodBucket* latest = context.current_bucket();
    if (!latest) {
        latest = &buckets.back();
    }
    double total_net = 0.0;
    for (const auto& bucket : buckets) {
        total_net += bucket.net_flow();
    }
    double average_net = total_net / static_cast<double>(buckets.size());
    double latest_net = latest->net_flow();

    // Net cash flow of the latest period against the average
    Insight net = net_flow_insight("net_cashflow", InsightType::NetCashFlow, "Net Cash Flow", *latest,
                                   latest_net > 0.0 ? InsightSeverity::Positive
                                   : latest_net < 0.0 ? InsightSeverity::Critical
                                   : InsightSeverity::Neutral,
                                   context);
    net.trend = make_trend(latest_net > average_net ? TrendDirection::Up
                           : latest_net < average_net ? TrendDirection::Down
                           : TrendDirection::Flat,
                           std::nullopt, latest_net - average_net, "vs average");
    insights.push_back(std::move(net));

    auto by_net = [](const PeriodBucket& a, const PeriodBucket& b) { return a.net_flow() < b.net_flow(); };
    const PeriodBucket& best = *std::max_element(buckets.begin(), buckets.end(), by_net);
    const PeriodBucket& worst = *std::min_element(buckets.begin(), buckets.end(), by_net);

    insights.push_back(net_flow_insight("best_month", InsightType::BestMonth,
                                        best_period_title(context.granularity), best,
                                        InsightSeverity::Positive, context));

    if (worst.net_flow() < 0.0 && worst.key != best.key) {
        insights.push_back(net_flow_insight("worst_month", InsightType::WorstMonth,
                                            worst_period_title(context.granularity), worst,
                                            InsightSeverity::Warning, context));
    }

    // Projected balance one period ahead
    double current_balance = context.total_balance();
    double period_recurring_net = context.monthly_recurring_net() *
                                  monthly_to_period_multiplier(context.granularity);
    double projected = current_balance + period_recurring_net;
    std::string unit = period_unit(context.granularity);

    Insight projection;
    projection.id = "projected_balance";
    projection.type = InsightType::ProjectedBalance;
    projection.title = "Projected Balance";
    projection.subtitle = unit;
    projection.metric = currency_metric(period_recurring_net, context.base_currency, unit);
    if (period_recurring_net >= 0.0) {
        projection.metric.formatted_value = "+" + projection.metric.formatted_value;
    }
    std::optional<double> change_percent;
    if (current_balance > 0.0) {
        change_percent = period_recurring_net / current_balance * 100.0;
    }
    projection.trend = make_trend(period_recurring_net >= 0.0 ? TrendDirection::Up : TrendDirection::Down,
                                  change_percent, period_recurring_net,
                                  "Current balance: " + format_currency_smart(current_balance, context.base_currency));
    projection.severity = projected >= 0.0 ? InsightSeverity::Positive : InsightSeverity::Critical;
    projection.category = InsightCategory::CashFlow;
    insights.push_back(std::move(projection));

    return insights;
}

} // namespace finsight
