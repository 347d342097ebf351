#include "budget_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>

namespace finsight {

Timestamp budget_period_start(const Category& category, Timestamp now) {
    switch (category.budget_period) {
        case BudgetPeriod::Weekly:
            return start_of_week(now);
        case BudgetPeriod::Yearly:
            return start_of_year(now);
        case BudgetPeriod::Monthly:
            break;
    }

    unsigned reset_day = std::max(1u, category.budget_reset_day);
    CivilDate today = to_civil(now);
    Timestamp start = make_date(today.year, today.month,
                                std::min(reset_day, days_in_month(today.year, today.month)));
    if (start > now) {
        CivilDate previous = to_civil(add_months(start_of_month(now), -1));
        start = make_date(previous.year, previous.month,
                          std::min(reset_day, days_in_month(previous.year, previous.month)));
    }
    return start;
}

int budget_period_days(const Category& category, Timestamp now) {
    CivilDate today = to_civil(now);
    switch (category.budget_period) {
        case BudgetPeriod::Weekly: return 7;
        case BudgetPeriod::Monthly: return static_cast<int>(days_in_month(today.year, today.month));
        case BudgetPeriod::Yearly: return static_cast<int>(days_in_year(today.year));
    }
    return 30;
}

std::vector<BudgetItem> BudgetGenerator::budget_items(const GeneratorContext& context) const {
    std::vector<BudgetItem> items;

    for (const auto& category : context.categories) {
        if (category.type != CategoryType::Expense || !category.has_budget()) {
            continue;
        }

        Timestamp period_start = budget_period_start(category, context.now);
        double spent = 0.0;
        for (const auto& tx : context.windowed_transactions) {
            if (tx.is_expense() && tx.category == category.name &&
                tx.date >= period_start && tx.date <= context.now) {
                spent += context.resolve(tx);
            }
        }

        int64_t days_elapsed = std::max<int64_t>(1, days_between(period_start, context.now));
        int total_days = budget_period_days(category, context.now);
        double budget = *category.budget_amount;

        BudgetItem item;
        item.category_name = category.name;
        item.budget_amount = budget;
        item.spent = spent;
        item.percentage = spent / budget * 100.0;
        item.is_over_budget = spent > budget;
        item.days_remaining = static_cast<int>(std::max<int64_t>(0, total_days - days_elapsed));
        item.projected_spend = spent / static_cast<double>(days_elapsed) * total_days;
        item.color = category.color;
        items.push_back(item);

        if (context.logger) {
            context.logger->debug("Budget progress", {
                {"category", category.name},
                {"budget", format_number(budget, 2)},
                {"spent", format_number(spent, 2)},
                {"projected", format_number(item.projected_spend, 2)},
                {"days_remaining", std::to_string(item.days_remaining)}
            });
        }
    }
    return items;
}

std::vector<Insight> BudgetGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;

    std::vector<BudgetItem> items = budget_items(context);
    if (items.empty()) {
        return insights;
    }

    std::vector<BudgetItem> over;
    std::vector<BudgetItem> at_risk;
    std::vector<BudgetItem> under;
    for (const auto& item : items) {
        if (item.is_over_budget) {
            over.push_back(item);
        } else if (item.projected_spend > item.budget_amount) {
            at_risk.push_back(item);
        } else if (item.percentage < 80.0 && item.percentage > 0.0) {
            under.push_back(item);
        }
    }

    auto count_insight = [](const std::string& id, InsightType type, const std::string& title,
                            const std::string& subtitle_suffix, size_t count, InsightSeverity severity,
                            std::vector<BudgetItem> detail) {
        Insight insight;
        insight.id = id;
        insight.type = type;
        insight.title = title;
        insight.subtitle = std::to_string(count) + " " + subtitle_suffix;
        insight.metric = plain_metric(static_cast<double>(count), std::to_string(count),
                                      std::string("categories"));
        insight.severity = severity;
        insight.category = InsightCategory::Budget;
        insight.detail = InsightDetail::budget_progress(std::move(detail));
        return insight;
    };

    if (!over.empty()) {
        // The detail lists every budget, most consumed first
        std::vector<BudgetItem> all = items;
        std::stable_sort(all.begin(), all.end(), [](const BudgetItem& a, const BudgetItem& b) {
            return a.percentage > b.percentage;
        });
        insights.push_back(count_insight("budget_over", InsightType::BudgetOverspend, "Over Budget",
                                         "over budget", over.size(), InsightSeverity::Critical,
                                         std::move(all)));
    }

    if (!at_risk.empty()) {
        std::stable_sort(at_risk.begin(), at_risk.end(), [](const BudgetItem& a, const BudgetItem& b) {
            return a.projected_spend / a.budget_amount > b.projected_spend / b.budget_amount;
        });
        size_t count = at_risk.size();
        insights.push_back(count_insight("budget_projected_over", InsightType::ProjectedOverspend,
                                         "Projected Overspend", "at risk", count,
                                         InsightSeverity::Warning, std::move(at_risk)));
    }

    if (!under.empty()) {
        std::stable_sort(under.begin(), under.end(), [](const BudgetItem& a, const BudgetItem& b) {
            return a.percentage < b.percentage;
        });
        size_t count = under.size();
        insights.push_back(count_insight("budget_under", InsightType::BudgetUnderutilized,
                                         "Under Budget", "under budget", count,
                                         InsightSeverity::Positive, std::move(under)));
    }

    return insights;
}

} // namespace finsight
