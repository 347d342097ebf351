#include "health_score_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>
#include <cmath>

namespace finsight {

namespace {

int clamp_score(int value) {
    return std::max(0, std::min(value, 100));
}

// Expenses per category for the current calendar month
std::map<std::string, double> current_month_spend(const GeneratorContext& context) {
    Timestamp month_start = start_of_month(context.now);
    std::map<std::string, double> spent;

    if (context.aggregates) {
        for (const auto& record : context.category_aggregates(month_start, context.now)) {
            spent[record.category_name] += record.total_expenses;
        }
        return spent;
    }

    for (const auto& tx : context.all_transactions) {
        if (tx.is_expense() && tx.date >= month_start && tx.date <= context.now) {
            spent[tx.category] += context.resolve(tx);
        }
    }
    return spent;
}

double latest_net_flow(const GeneratorContext& context) {
    if (const PeriodBucket* current = context.current_bucket()) {
        return current->net_flow();
    }
    return context.buckets.empty() ? 0.0 : context.buckets.back().net_flow();
}

} // anonymous namespace

std::string health_grade(int score) {
    if (score >= 80) return "Excellent";
    if (score >= 60) return "Good";
    if (score >= 40) return "Fair";
    return "Needs Attention";
}

std::optional<HealthScore> HealthScoreGenerator::compute(const GeneratorContext& context) const {
    double income = context.summary.total_income;
    double expenses = context.summary.total_expenses;
    if (income <= 0.0) {
        return std::nullopt;
    }

    // Savings rate
    double savings_rate = (income - expenses) / income * 100.0;
    int savings_score = static_cast<int>(std::round(std::min(savings_rate / 20.0 * 100.0, 100.0)));

    // Budget adherence
    std::map<std::string, double> spent = current_month_spend(context);
    int budgeted = 0;
    int on_budget = 0;
    for (const auto& category : context.categories) {
        if (!category.has_budget()) {
            continue;
        }
        budgeted++;
        auto it = spent.find(category.name);
        double amount = it != spent.end() ? it->second : 0.0;
        if (amount <= *category.budget_amount) {
            on_budget++;
        }
    }
    int budget_score = budgeted > 0
        ? static_cast<int>(std::round(static_cast<double>(on_budget) / budgeted * 100.0))
        : 50;

    // Recurring ratio
    double recurring_cost = context.recurring_expense_monthly();
    int recurring_score = static_cast<int>(
        std::round(std::max(0.0, (1.0 - recurring_cost / std::max(income, 1.0)) * 100.0)));

    // Emergency fund
    double balance = context.total_balance();
    std::vector<MonthlyAggregate> recent = context.last_months(3, context.now);
    double average_expenses = expenses / 12.0;
    if (!recent.empty()) {
        double total = 0.0;
        for (const auto& month : recent) {
            total += month.total_expenses;
        }
        average_expenses = total / static_cast<double>(recent.size());
    }
    double months_covered = average_expenses > 0.0 ? balance / average_expenses : 0.0;
    int emergency_score = static_cast<int>(std::round(std::min(months_covered / 6.0 * 100.0, 100.0)));

    // Cash flow
    int cashflow_score = latest_net_flow(context) > 0.0 ? 100 : 0;

    double weighted = savings_score * 0.30
                    + budget_score * 0.25
                    + recurring_score * 0.20
                    + emergency_score * 0.15
                    + cashflow_score * 0.10;

    HealthScore score;
    score.score = clamp_score(static_cast<int>(std::round(weighted)));
    score.grade = health_grade(score.score);
    score.savings_rate_score = clamp_score(savings_score);
    score.budget_adherence_score = clamp_score(budget_score);
    score.recurring_ratio_score = clamp_score(recurring_score);
    score.emergency_fund_score = clamp_score(emergency_score);
    score.cashflow_score = cashflow_score;
    return score;
}

std::vector<Insight> HealthScoreGenerator::generate(const GeneratorContext& context) const {
    std::optional<HealthScore> score = compute(context);
    if (!score) {
        return {};
    }

    if (context.logger) {
        context.logger->debug("Financial health score", {
            {"score", std::to_string(score->score)},
            {"savings", std::to_string(score->savings_rate_score)},
            {"budget", std::to_string(score->budget_adherence_score)},
            {"recurring", std::to_string(score->recurring_ratio_score)},
            {"emergency_fund", std::to_string(score->emergency_fund_score)},
            {"cashflow", std::to_string(score->cashflow_score)}
        });
    }

    Insight insight;
    insight.id = "health_score";
    insight.type = InsightType::FinancialHealthScore;
    insight.title = "Financial Health";
    insight.subtitle = score->grade;
    insight.metric = plain_metric(score->score, std::to_string(score->score), std::string("of 100"));
    insight.severity = score->score >= 80 ? InsightSeverity::Positive
                     : score->score >= 60 ? InsightSeverity::Neutral
                     : score->score >= 40 ? InsightSeverity::Warning
                     : InsightSeverity::Critical;
    insight.category = InsightCategory::Savings;
    insight.detail = InsightDetail::health_breakdown(*score);
    return {insight};
}

} // namespace finsight
