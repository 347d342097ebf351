#include "income_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>

namespace finsight {

std::vector<Insight> IncomeGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;

    bool has_income = std::any_of(context.windowed_transactions.begin(),
                                  context.windowed_transactions.end(),
                                  [](const Transaction& tx) { return tx.is_income(); });
    if (!has_income) {
        if (context.logger) {
            context.logger->debug("Income insights skipped: no income in window");
        }
        return insights;
    }

    for (auto insight : {income_growth(context), income_vs_expense(context), source_breakdown(context)}) {
        if (insight) {
            insights.push_back(std::move(*insight));
        }
    }
    return insights;
}

std::optional<Insight> IncomeGenerator::income_growth(const GeneratorContext& context) const {
    if (context.granularity == Granularity::AllTime) {
        return std::nullopt;
    }

    const PeriodBucket* previous = context.previous_bucket();
    if (!previous || previous->income <= 0.0) {
        return std::nullopt;
    }
    const PeriodBucket* current = context.current_bucket();
    double this_total = current ? current->income : 0.0;
    double change = (this_total - previous->income) / previous->income * 100.0;

    std::vector<PeriodBucket> points{*previous};
    if (current) {
        points.push_back(*current);
    }

    Insight insight;
    insight.id = "income_growth";
    insight.type = InsightType::IncomeGrowth;
    insight.title = "Income Growth";
    insight.subtitle = comparison_period_name(context.granularity);
    insight.metric = currency_metric(this_total, context.base_currency);
    insight.trend = make_trend(trend_direction(change), change, this_total - previous->income,
                               comparison_period_name(context.granularity));
    insight.severity = change > 10.0 ? InsightSeverity::Positive
                     : change < -10.0 ? InsightSeverity::Warning
                     : InsightSeverity::Neutral;
    insight.category = InsightCategory::Income;
    insight.detail = InsightDetail::period_trend(std::move(points));
    return insight;
}

std::optional<Insight> IncomeGenerator::income_vs_expense(const GeneratorContext& context) const {
    const PeriodSummary& summary = context.summary;
    if (summary.total_expenses <= 0.0) {
        return std::nullopt;
    }

    double ratio = summary.total_income / summary.total_expenses;

    Insight insight;
    insight.id = "income_vs_expense";
    insight.type = InsightType::IncomeVsExpenseRatio;
    insight.title = "Income vs Expenses";
    insight.subtitle = "Ratio";
    insight.metric = plain_metric(ratio, format_number(ratio, 1) + "x");
    insight.trend = make_trend(ratio >= 1.0 ? TrendDirection::Up : TrendDirection::Down,
                               std::nullopt, summary.net_flow,
                               format_currency_smart(summary.net_flow, context.base_currency));
    insight.severity = ratio >= 1.5 ? InsightSeverity::Positive
                     : ratio >= 1.0 ? InsightSeverity::Neutral
                     : InsightSeverity::Critical;
    insight.category = InsightCategory::Income;
    if (!context.buckets.empty()) {
        insight.detail = InsightDetail::period_trend(context.buckets);
    }
    return insight;
}

std::optional<Insight> IncomeGenerator::source_breakdown(const GeneratorContext& context) const {
    size_t income_categories = std::count_if(context.categories.begin(), context.categories.end(),
                                             [](const Category& c) { return c.type == CategoryType::Income; });
    if (income_categories < 2) {
        return std::nullopt;
    }

    // Sources earned in the current bucket, or across the window without one
    const PeriodBucket* current = context.current_bucket();
    std::vector<Transaction> source = current
        ? transactions_between(context.all_transactions, current->period_start, current->period_end)
        : context.windowed_transactions;

    std::map<std::string, double> totals;
    double total_income = 0.0;
    for (const auto& tx : source) {
        if (!tx.is_income()) {
            continue;
        }
        double amount = context.resolve(tx);
        totals[tx.category] += amount;
        total_income += amount;
    }
    if (totals.empty() || total_income <= 0.0) {
        return std::nullopt;
    }

    std::vector<CategoryBreakdownItem> breakdown;
    for (const auto& entry : sorted_totals(totals)) {
        const Category* category = context.find_category(entry.first);

        CategoryBreakdownItem item;
        item.category_name = entry.first;
        item.amount = entry.second;
        item.percentage = entry.second / total_income * 100.0;
        item.color = category ? category->color : "#5856D6";
        breakdown.push_back(std::move(item));
    }

    double top_percent = breakdown.front().percentage;
    std::string top_name = breakdown.front().category_name;

    Insight insight;
    insight.id = "income_source_breakdown";
    insight.type = InsightType::IncomeSourceBreakdown;
    insight.title = "Income Sources";
    insight.subtitle = top_name;
    insight.metric = plain_metric(top_percent, format_percent(top_percent, 0));
    insight.severity = InsightSeverity::Neutral;
    insight.category = InsightCategory::Income;
    insight.detail = InsightDetail::category_breakdown(std::move(breakdown));
    return insight;
}

} // namespace finsight
