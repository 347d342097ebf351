#include "recurring_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>
#include <cmath>

namespace finsight {

std::vector<Insight> RecurringGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;
    for (auto insight : {total_recurring(context), subscription_growth(context),
                         duplicate_subscriptions(context)}) {
        if (insight) {
            insights.push_back(std::move(*insight));
        }
    }
    return insights;
}

std::optional<Insight> RecurringGenerator::total_recurring(const GeneratorContext& context) const {
    std::vector<const RecurringSeries*> active = context.active_series();
    if (active.empty()) {
        if (context.logger) {
            context.logger->debug("Recurring insights skipped: no active series");
        }
        return std::nullopt;
    }

    std::vector<RecurringItem> items;
    double total_monthly = 0.0;
    for (const RecurringSeries* series : active) {
        RecurringItem item;
        item.id = series->id;
        item.name = series->description.empty() ? series->category : series->description;
        item.amount = series->amount;
        item.currency = series->currency;
        item.frequency = series->frequency;
        item.kind = series->kind;
        item.monthly_equivalent = context.series_monthly(*series);
        total_monthly += item.monthly_equivalent;
        items.push_back(std::move(item));
    }
    std::stable_sort(items.begin(), items.end(), [](const RecurringItem& a, const RecurringItem& b) {
        return a.monthly_equivalent > b.monthly_equivalent;
    });

    double period_total = total_monthly * monthly_to_period_multiplier(context.granularity);

    Insight insight;
    insight.id = "total_recurring";
    insight.type = InsightType::TotalRecurringCost;
    insight.title = total_recurring_title(context.granularity);
    insight.subtitle = std::to_string(active.size()) + " active";
    insight.metric = currency_metric(period_total, context.base_currency, period_unit(context.granularity));
    insight.severity = period_total > 0.0 ? InsightSeverity::Neutral : InsightSeverity::Positive;
    insight.category = InsightCategory::Recurring;
    insight.detail = InsightDetail::recurring_list(std::move(items));
    return insight;
}

std::optional<Insight> RecurringGenerator::subscription_growth(const GeneratorContext& context) const {
    std::vector<const RecurringSeries*> active = context.active_series();
    if (active.size() < 2) {
        return std::nullopt;
    }

    // Series that already existed three months ago form the baseline
    Timestamp three_months_ago = add_months(context.now, -3);
    double current_total = 0.0;
    double previous_total = 0.0;
    for (const RecurringSeries* series : active) {
        double monthly = context.series_monthly(*series);
        current_total += monthly;
        if (series->start_date < three_months_ago) {
            previous_total += monthly;
        }
    }

    if (previous_total <= 0.0 || current_total <= 0.0) {
        return std::nullopt;
    }
    double change = (current_total - previous_total) / previous_total * 100.0;
    if (std::abs(change) <= 5.0) {
        return std::nullopt;
    }

    Insight insight;
    insight.id = "subscription_growth";
    insight.type = InsightType::SubscriptionGrowth;
    insight.title = "Subscription Growth";
    insight.subtitle = "vs 3 months ago";
    insight.metric = currency_metric(current_total, context.base_currency, std::string("per month"));
    insight.trend = make_trend(change > 0.0 ? TrendDirection::Up : TrendDirection::Down,
                               change, current_total - previous_total, "vs 3 months ago");
    insight.severity = change > 10.0 ? InsightSeverity::Warning
                     : change < -10.0 ? InsightSeverity::Positive
                     : InsightSeverity::Neutral;
    insight.category = InsightCategory::Recurring;
    return insight;
}

std::optional<Insight> RecurringGenerator::duplicate_subscriptions(const GeneratorContext& context) const {
    std::vector<const RecurringSeries*> subscriptions;
    for (const RecurringSeries* series : context.active_series()) {
        if (series->kind == RecurringKind::Subscription) {
            subscriptions.push_back(series);
        }
    }
    if (subscriptions.size() < 2) {
        return std::nullopt;
    }

    std::map<std::string, std::vector<const RecurringSeries*>> by_category;
    for (const RecurringSeries* series : subscriptions) {
        by_category[series->category].push_back(series);
    }

    size_t duplicate_count = 0;
    double duplicate_cost = 0.0;
    for (const auto& entry : by_category) {
        if (entry.second.size() < 2) {
            continue;
        }
        duplicate_count += entry.second.size();
        for (const RecurringSeries* series : entry.second) {
            duplicate_cost += context.series_monthly(*series);
        }
    }

    Insight insight;
    insight.id = "duplicateSubscriptions";
    insight.type = InsightType::DuplicateSubscriptions;
    insight.title = "Possible Duplicate Subscriptions";
    insight.severity = InsightSeverity::Warning;
    insight.category = InsightCategory::Recurring;

    if (duplicate_count > 0) {
        insight.subtitle = std::to_string(duplicate_count) + " possible duplicates";
        insight.metric = currency_metric(duplicate_cost, context.base_currency, std::nullopt, false);
        return insight;
    }

    // No shared category: look for two subscriptions within 15 % of each other
    std::vector<double> costs;
    for (const RecurringSeries* series : subscriptions) {
        costs.push_back(context.series_monthly(*series));
    }
    std::sort(costs.begin(), costs.end());

    bool similar = false;
    for (size_t i = 0; i + 1 < costs.size(); ++i) {
        double a = costs[i];
        double b = costs[i + 1];
        if (a > 0.0 && std::abs(a - b) / a < 0.15) {
            similar = true;
            break;
        }
    }
    if (!similar) {
        return std::nullopt;
    }

    // Rough estimate: everything except the cheapest subscription
    double estimate = 0.0;
    for (size_t i = 1; i < costs.size(); ++i) {
        estimate += costs[i];
    }

    insight.subtitle = "Similar monthly cost";
    insight.metric = currency_metric(estimate, context.base_currency, std::nullopt, false);
    return insight;
}

} // namespace finsight
