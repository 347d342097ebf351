#include "spending_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>

namespace finsight {

namespace {

const char* kDefaultCategoryColor = "#5856D6";

std::vector<PeriodBucket> existing_pair(const PeriodBucket* previous, const PeriodBucket* current) {
    std::vector<PeriodBucket> points;
    if (previous) points.push_back(*previous);
    if (current) points.push_back(*current);
    return points;
}

std::vector<SubcategoryBreakdownItem> subcategory_breakdown(const GeneratorContext& context,
                                                            const std::vector<Transaction>& expenses,
                                                            const std::string& category,
                                                            double category_total) {
    std::map<std::string, double> totals;
    for (const auto& tx : expenses) {
        if (tx.category == category && !tx.subcategory.empty()) {
            totals[tx.subcategory] += context.resolve(tx);
        }
    }

    std::vector<SubcategoryBreakdownItem> items;
    for (const auto& entry : sorted_totals(totals)) {
        double pct = category_total > 0.0 ? entry.second / category_total * 100.0 : 0.0;
        items.push_back(SubcategoryBreakdownItem{entry.first, entry.second, pct});
    }
    return items;
}

bool same_month(const CategoryAggregate& record, const CivilDate& date) {
    return record.year == date.year && record.month == date.month;
}

} // anonymous namespace

std::vector<Insight> SpendingGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;

    bool has_expenses = std::any_of(context.windowed_transactions.begin(),
                                    context.windowed_transactions.end(),
                                    [](const Transaction& tx) { return tx.is_expense(); });
    if (!has_expenses) {
        if (context.logger) {
            context.logger->debug("Spending insights skipped: no expenses in window");
        }
        return insights;
    }

    for (auto insight : {top_category(context), period_over_period(context), average_daily(context),
                         spending_spike(context), category_trend(context)}) {
        if (insight) {
            insights.push_back(std::move(*insight));
        }
    }
    return insights;
}

// ============================================================================
// Top spending category
// ============================================================================

std::optional<Insight> SpendingGenerator::top_category(const GeneratorContext& context) const {
    // Narrow to the current bucket when it exists, otherwise the whole window
    const PeriodBucket* current = context.current_bucket();
    Timestamp from = current ? current->period_start : context.window.start;
    Timestamp to = current ? current->period_end : context.window.end;
    double total_expenses = current ? current->expenses : context.summary.total_expenses;

    std::vector<Transaction> expenses;
    for (const auto& tx : transactions_between(context.windowed_transactions, from, to)) {
        if (tx.is_expense()) {
            expenses.push_back(tx);
        }
    }

    std::map<std::string, double> totals;
    if (month_aligned(from, to)) {
        for (const auto& record : context.category_aggregates(from, to)) {
            totals[record.category_name] += record.total_expenses;
        }
    }
    if (totals.empty()) {
        for (const auto& tx : expenses) {
            totals[tx.category] += context.resolve(tx);
        }
    }
    if (totals.empty()) {
        return std::nullopt;
    }

    std::vector<CategoryTotal> sorted = sorted_totals(totals);
    const CategoryTotal& top = sorted.front();
    double percentage = total_expenses > 0.0 ? top.second / total_expenses * 100.0 : 0.0;

    std::vector<CategoryBreakdownItem> breakdown;
    for (const auto& entry : sorted) {
        const Category* category = context.find_category(entry.first);

        CategoryBreakdownItem item;
        item.category_name = entry.first;
        item.amount = entry.second;
        item.percentage = total_expenses > 0.0 ? entry.second / total_expenses * 100.0 : 0.0;
        item.color = category ? category->color : kDefaultCategoryColor;
        item.subcategories = subcategory_breakdown(context, expenses, entry.first, entry.second);
        breakdown.push_back(std::move(item));
    }

    if (context.logger) {
        context.logger->debug("Top spending category", {
            {"category", top.first},
            {"amount", format_number(top.second, 2)},
            {"categories", std::to_string(sorted.size())}
        });
    }

    Insight insight;
    insight.id = "top_spending_" + top.first;
    insight.type = InsightType::TopSpendingCategory;
    insight.title = "Top Spending Category";
    insight.subtitle = top.first;
    insight.metric = currency_metric(top.second, context.base_currency);
    insight.trend = make_trend(TrendDirection::Down, percentage, std::nullopt,
                               format_number(percentage, 0) + "% of total");
    insight.severity = percentage > 50.0 ? InsightSeverity::Warning : InsightSeverity::Neutral;
    insight.category = InsightCategory::Spending;
    insight.detail = InsightDetail::category_breakdown(std::move(breakdown));
    return insight;
}

// ============================================================================
// Period-over-period change and daily average
// ============================================================================

std::optional<Insight> SpendingGenerator::period_over_period(const GeneratorContext& context) const {
    // All time has no previous period to compare against
    if (context.granularity == Granularity::AllTime) {
        return std::nullopt;
    }

    const PeriodBucket* previous = context.previous_bucket();
    if (!previous || previous->expenses <= 0.0) {
        return std::nullopt;
    }
    const PeriodBucket* current = context.current_bucket();
    double this_total = current ? current->expenses : 0.0;
    double prev_total = previous->expenses;
    double change = (this_total - prev_total) / prev_total * 100.0;

    Insight insight;
    insight.id = "mom_spending";
    insight.type = InsightType::MonthOverMonthChange;
    insight.title = period_over_period_title(context.granularity);
    insight.subtitle = comparison_period_name(context.granularity);
    insight.metric = currency_metric(this_total, context.base_currency);
    insight.trend = make_trend(trend_direction(change), change, this_total - prev_total,
                               comparison_period_name(context.granularity));
    insight.severity = change > 20.0 ? InsightSeverity::Warning
                     : change < -10.0 ? InsightSeverity::Positive
                     : InsightSeverity::Neutral;
    insight.category = InsightCategory::Spending;
    insight.detail = InsightDetail::period_trend(existing_pair(previous, current));
    return insight;
}

std::optional<Insight> SpendingGenerator::average_daily(const GeneratorContext& context) const {
    Insight insight;
    insight.id = "avg_daily";
    insight.type = InsightType::AverageDailySpending;
    insight.title = "Average Daily Spending";
    insight.severity = InsightSeverity::Neutral;
    insight.category = InsightCategory::Spending;

    if (context.buckets.empty()) {
        // No buckets: average over the days elapsed in the window
        Timestamp end = std::min(context.window.end, context.reference_date);
        int64_t days = std::max<int64_t>(1, days_between(context.window.start, end));
        double average = context.summary.total_expenses / static_cast<double>(days);

        insight.subtitle = std::to_string(days) + " days";
        insight.metric = currency_metric(average, context.base_currency);
        return insight;
    }

    const PeriodBucket* current = context.current_bucket();
    const PeriodBucket* previous = context.previous_bucket();
    auto bucket_days = [](const PeriodBucket* bucket) {
        return bucket ? std::max<int64_t>(1, days_between(bucket->period_start, bucket->period_end)) : 1;
    };

    double current_avg = (current ? current->expenses : 0.0) / static_cast<double>(bucket_days(current));
    double previous_avg = (previous ? previous->expenses : 0.0) / static_cast<double>(bucket_days(previous));

    insight.subtitle = current ? current->label : "";
    insight.metric = currency_metric(current_avg, context.base_currency);
    if (previous_avg > 0.0) {
        double change = (current_avg - previous_avg) / previous_avg * 100.0;
        insight.trend = make_trend(trend_direction(change), change, current_avg - previous_avg,
                                   comparison_period_name(context.granularity));
    }
    insight.detail = InsightDetail::period_trend(existing_pair(previous, current));
    return insight;
}

// ============================================================================
// Month-level category signals
// ============================================================================

std::optional<Insight> SpendingGenerator::spending_spike(const GeneratorContext& context) const {
    Timestamp from = add_months(start_of_month(context.now), -3);
    std::vector<CategoryAggregate> records = context.category_aggregates(from, context.now);
    if (records.empty()) {
        return std::nullopt;
    }

    CivilDate today = to_civil(context.now);
    std::map<std::string, std::vector<CategoryAggregate>> by_category;
    for (const auto& record : records) {
        by_category[record.category_name].push_back(record);
    }

    std::string spike_category;
    double spike_amount = 0.0;
    double spike_multiplier = 1.5;

    for (const auto& entry : by_category) {
        double current_amount = 0.0;
        bool has_current = false;
        double historical_sum = 0.0;
        size_t historical_count = 0;
        for (const auto& record : entry.second) {
            if (same_month(record, today)) {
                if (!has_current) {
                    current_amount = record.total_expenses;
                    has_current = true;
                }
            } else {
                historical_sum += record.total_expenses;
                historical_count++;
            }
        }
        if (!has_current || current_amount <= 0.0 || historical_count == 0) {
            continue;
        }

        double historical_avg = historical_sum / static_cast<double>(historical_count);
        if (historical_avg <= 100.0) {
            continue;
        }

        double multiplier = current_amount / historical_avg;
        if (multiplier > spike_multiplier) {
            spike_multiplier = multiplier;
            spike_category = entry.first;
            spike_amount = current_amount;
        }
    }

    if (spike_category.empty()) {
        return std::nullopt;
    }

    Insight insight;
    insight.id = "spending_spike";
    insight.type = InsightType::SpendingSpike;
    insight.title = "Spending Spike";
    insight.subtitle = spike_category;
    insight.metric = currency_metric(spike_amount, context.base_currency);
    insight.trend = make_trend(TrendDirection::Up, (spike_multiplier - 1.0) * 100.0, std::nullopt,
                               "vs average");
    insight.severity = spike_multiplier > 2.0 ? InsightSeverity::Critical : InsightSeverity::Warning;
    insight.category = InsightCategory::Spending;
    return insight;
}

std::optional<Insight> SpendingGenerator::category_trend(const GeneratorContext& context) const {
    Timestamp from = add_months(start_of_month(context.now), -6);
    std::vector<CategoryAggregate> records = context.category_aggregates(from, context.now);
    if (records.size() < 4) {
        return std::nullopt;
    }

    std::map<std::string, std::vector<CategoryAggregate>> by_category;
    for (const auto& record : records) {
        by_category[record.category_name].push_back(record);
    }

    std::string best_category;
    int best_streak = 1;
    double best_latest = 0.0;
    double best_change = 0.0;

    for (auto& entry : by_category) {
        std::vector<CategoryAggregate>& series = entry.second;
        if (series.size() < 3) {
            continue;
        }
        std::sort(series.begin(), series.end(), [](const CategoryAggregate& a, const CategoryAggregate& b) {
            return a.year != b.year ? a.year < b.year : a.month < b.month;
        });

        // Consecutive increases counted back from the latest month
        int streak = 0;
        for (size_t i = series.size() - 1; i >= 1; --i) {
            if (series[i].total_expenses > series[i - 1].total_expenses) {
                streak++;
            } else {
                break;
            }
        }

        if (streak >= 2 && streak > best_streak) {
            best_streak = streak;
            best_category = entry.first;
            best_latest = series.back().total_expenses;
            double previous = series[series.size() - 2].total_expenses;
            best_change = previous > 0.0 ? (best_latest - previous) / previous * 100.0 : 0.0;
        }
    }

    if (best_category.empty()) {
        return std::nullopt;
    }

    Insight insight;
    insight.id = "category_trend_" + best_category;
    insight.type = InsightType::CategoryTrend;
    insight.title = "Category Trend";
    insight.subtitle = "Rising for " + std::to_string(best_streak + 1) + " months";
    insight.metric = currency_metric(best_latest, context.base_currency);
    insight.trend = make_trend(TrendDirection::Up, best_change, std::nullopt, "vs previous period");
    insight.severity = InsightSeverity::Warning;
    insight.category = InsightCategory::Spending;
    return insight;
}

} // namespace finsight
