#include "insight.hpp"
#include <cmath>
#include <cstdio>

namespace finsight {

std::string to_string(InsightType type) {
    switch (type) {
        case InsightType::TopSpendingCategory: return "topSpendingCategory";
        case InsightType::SpendingSpike: return "spendingSpike";
        case InsightType::MonthOverMonthChange: return "monthOverMonthChange";
        case InsightType::AverageDailySpending: return "averageDailySpending";
        case InsightType::IncomeGrowth: return "incomeGrowth";
        case InsightType::IncomeSourceBreakdown: return "incomeSourceBreakdown";
        case InsightType::IncomeVsExpenseRatio: return "incomeVsExpenseRatio";
        case InsightType::BudgetOverspend: return "budgetOverspend";
        case InsightType::BudgetUnderutilized: return "budgetUnderutilized";
        case InsightType::ProjectedOverspend: return "projectedOverspend";
        case InsightType::CategoryTrend: return "categoryTrend";
        case InsightType::TotalRecurringCost: return "totalRecurringCost";
        case InsightType::SubscriptionGrowth: return "subscriptionGrowth";
        case InsightType::DuplicateSubscriptions: return "duplicateSubscriptions";
        case InsightType::NetCashFlow: return "netCashFlow";
        case InsightType::BestMonth: return "bestMonth";
        case InsightType::WorstMonth: return "worstMonth";
        case InsightType::ProjectedBalance: return "projectedBalance";
        case InsightType::TotalWealth: return "totalWealth";
        case InsightType::WealthGrowth: return "wealthGrowth";
        case InsightType::AccountDormancy: return "accountDormancy";
        case InsightType::SavingsRate: return "savingsRate";
        case InsightType::EmergencyFund: return "emergencyFund";
        case InsightType::SavingsMomentum: return "savingsMomentum";
        case InsightType::SpendingForecast: return "spendingForecast";
        case InsightType::BalanceRunway: return "balanceRunway";
        case InsightType::YearOverYear: return "yearOverYear";
        case InsightType::IncomeSeasonality: return "incomeSeasonality";
        case InsightType::SpendingVelocity: return "spendingVelocity";
        case InsightType::FinancialHealthScore: return "financialHealthScore";
    }
    return "unknown";
}

std::string to_string(InsightSeverity severity) {
    switch (severity) {
        case InsightSeverity::Positive: return "positive";
        case InsightSeverity::Neutral: return "neutral";
        case InsightSeverity::Warning: return "warning";
        case InsightSeverity::Critical: return "critical";
    }
    return "unknown";
}

std::string to_string(InsightCategory category) {
    switch (category) {
        case InsightCategory::Spending: return "spending";
        case InsightCategory::Income: return "income";
        case InsightCategory::Budget: return "budget";
        case InsightCategory::Recurring: return "recurring";
        case InsightCategory::CashFlow: return "cashFlow";
        case InsightCategory::Wealth: return "wealth";
        case InsightCategory::Savings: return "savings";
        case InsightCategory::Forecasting: return "forecasting";
    }
    return "unknown";
}

std::string to_string(TrendDirection direction) {
    switch (direction) {
        case TrendDirection::Up: return "up";
        case TrendDirection::Down: return "down";
        case TrendDirection::Flat: return "flat";
    }
    return "unknown";
}

std::string to_string(InsightDetailKind kind) {
    switch (kind) {
        case InsightDetailKind::CategoryBreakdown: return "categoryBreakdown";
        case InsightDetailKind::PeriodTrend: return "periodTrend";
        case InsightDetailKind::BudgetProgress: return "budgetProgressList";
        case InsightDetailKind::RecurringList: return "recurringList";
        case InsightDetailKind::AccountComparison: return "accountComparison";
        case InsightDetailKind::WealthBreakdown: return "wealthBreakdown";
        case InsightDetailKind::HealthScoreBreakdown: return "healthScore";
    }
    return "unknown";
}

// ============================================================================
// InsightDetail factories
// ============================================================================

InsightDetail InsightDetail::category_breakdown(std::vector<CategoryBreakdownItem> items) {
    InsightDetail detail(InsightDetailKind::CategoryBreakdown);
    detail.categories = std::move(items);
    return detail;
}

InsightDetail InsightDetail::period_trend(std::vector<PeriodBucket> buckets) {
    InsightDetail detail(InsightDetailKind::PeriodTrend);
    detail.periods = std::move(buckets);
    return detail;
}

InsightDetail InsightDetail::budget_progress(std::vector<BudgetItem> items) {
    InsightDetail detail(InsightDetailKind::BudgetProgress);
    detail.budgets = std::move(items);
    return detail;
}

InsightDetail InsightDetail::recurring_list(std::vector<RecurringItem> items) {
    InsightDetail detail(InsightDetailKind::RecurringList);
    detail.recurring = std::move(items);
    return detail;
}

InsightDetail InsightDetail::account_comparison(std::vector<AccountItem> items) {
    InsightDetail detail(InsightDetailKind::AccountComparison);
    detail.accounts = std::move(items);
    return detail;
}

InsightDetail InsightDetail::wealth_breakdown(std::vector<AccountItem> items) {
    InsightDetail detail(InsightDetailKind::WealthBreakdown);
    detail.accounts = std::move(items);
    return detail;
}

InsightDetail InsightDetail::health_breakdown(const HealthScore& score) {
    InsightDetail detail(InsightDetailKind::HealthScoreBreakdown);
    detail.health = score;
    return detail;
}

Insight::Insight()
    : type(InsightType::NetCashFlow)
    , severity(InsightSeverity::Neutral)
    , category(InsightCategory::Spending)
{}

// ============================================================================
// Conventions and formatting
// ============================================================================

TrendDirection trend_direction(double change_percent) {
    if (change_percent > 2.0) return TrendDirection::Up;
    if (change_percent < -2.0) return TrendDirection::Down;
    return TrendDirection::Flat;
}

std::optional<double> percent_change(double current, double previous) {
    if (previous == 0.0) {
        return std::nullopt;
    }
    return (current - previous) / std::abs(previous) * 100.0;
}

namespace {

// Inserts a comma every three digits of the integer part
std::string group_thousands(const std::string& digits) {
    size_t dot = digits.find('.');
    std::string integer = digits.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : digits.substr(dot);

    std::string grouped;
    int count = 0;
    for (auto it = integer.rbegin(); it != integer.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }
    return grouped + fraction;
}

std::string format_grouped(double value, int decimals, const std::string& currency) {
    double magnitude = std::abs(value);
    std::string digits = format_number(magnitude, decimals);
    // Avoid "-0.00" after rounding
    bool negative = value < 0.0 && digits.find_first_not_of("0.") != std::string::npos;
    std::string result = (negative ? "-" : "") + group_thousands(digits);
    if (!currency.empty()) {
        result += " " + currency;
    }
    return result;
}

} // anonymous namespace

std::string format_number(double value, int decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return buffer;
}

std::string format_currency(double value, const std::string& currency) {
    return format_grouped(value, 2, currency);
}

std::string format_currency_smart(double value, const std::string& currency) {
    bool whole = std::abs(value - std::round(value)) < 0.005;
    int decimals = (whole || std::abs(value) >= 100.0) ? 0 : 2;
    return format_grouped(value, decimals, currency);
}

std::string format_percent(double value, int decimals) {
    return format_number(value, decimals) + "%";
}

} // namespace finsight
