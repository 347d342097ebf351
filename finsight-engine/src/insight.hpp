#ifndef FINSIGHT_INSIGHT_HPP
#define FINSIGHT_INSIGHT_HPP

#include "calendar.hpp"
#include "ledger.hpp"
#include "period_aggregator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finsight {

enum class InsightType {
    TopSpendingCategory,
    SpendingSpike,
    MonthOverMonthChange,
    AverageDailySpending,
    IncomeGrowth,
    IncomeSourceBreakdown,
    IncomeVsExpenseRatio,
    BudgetOverspend,
    BudgetUnderutilized,
    ProjectedOverspend,
    CategoryTrend,
    TotalRecurringCost,
    SubscriptionGrowth,
    DuplicateSubscriptions,
    NetCashFlow,
    BestMonth,
    WorstMonth,
    ProjectedBalance,
    TotalWealth,
    WealthGrowth,
    AccountDormancy,
    SavingsRate,
    EmergencyFund,
    SavingsMomentum,
    SpendingForecast,
    BalanceRunway,
    YearOverYear,
    IncomeSeasonality,
    SpendingVelocity,
    FinancialHealthScore
};

enum class InsightSeverity {
    Positive,
    Neutral,
    Warning,
    Critical
};

enum class InsightCategory {
    Spending,
    Income,
    Budget,
    Recurring,
    CashFlow,
    Wealth,
    Savings,
    Forecasting
};

enum class TrendDirection {
    Up,
    Down,
    Flat
};

std::string to_string(InsightType type);
std::string to_string(InsightSeverity severity);
std::string to_string(InsightCategory category);
std::string to_string(TrendDirection direction);

// ============================================================================
// Metric and trend
// ============================================================================

struct InsightMetric {
    double value;
    std::string formatted_value;
    std::optional<std::string> currency;
    std::optional<std::string> unit;

    InsightMetric() : value(0.0) {}
};

struct InsightTrend {
    TrendDirection direction;
    std::optional<double> change_percent;
    std::optional<double> change_absolute;
    std::string comparison_period;

    InsightTrend() : direction(TrendDirection::Flat) {}
};

// ============================================================================
// Detail payloads
// ============================================================================

struct SubcategoryBreakdownItem {
    std::string name;
    double amount;
    double percentage;
};

struct CategoryBreakdownItem {
    std::string category_name;
    double amount;
    double percentage;
    std::string color;
    std::vector<SubcategoryBreakdownItem> subcategories;
};

struct BudgetItem {
    std::string category_name;
    double budget_amount;
    double spent;
    double percentage;
    bool is_over_budget;
    int days_remaining;
    double projected_spend;
    std::string color;
};

struct RecurringItem {
    std::string id;
    std::string name;
    double amount;
    std::string currency;
    RecurringFrequency frequency;
    RecurringKind kind;
    double monthly_equivalent;   // in the base currency
};

struct AccountItem {
    std::string id;
    std::string account_name;
    std::string currency;
    double balance;
    size_t transaction_count;
    std::optional<Timestamp> last_activity_date;
};

/**
 * Composite 0-100 score of financial wellness.
 * Each component is 0-100 before weighting.
 */
struct HealthScore {
    int score;
    std::string grade;            // "Excellent", "Good", "Fair" or "Needs Attention"
    int savings_rate_score;       // weight 0.30
    int budget_adherence_score;   // weight 0.25
    int recurring_ratio_score;    // weight 0.20
    int emergency_fund_score;     // weight 0.15
    int cashflow_score;           // weight 0.10, either 0 or 100

    HealthScore()
        : score(0), savings_rate_score(0), budget_adherence_score(0),
          recurring_ratio_score(0), emergency_fund_score(0), cashflow_score(0) {}
};

enum class InsightDetailKind {
    CategoryBreakdown,
    PeriodTrend,
    BudgetProgress,
    RecurringList,
    AccountComparison,
    WealthBreakdown,
    HealthScoreBreakdown
};

std::string to_string(InsightDetailKind kind);

// Supporting data for an insight; only the vector matching `kind` is filled
struct InsightDetail {
    InsightDetailKind kind;
    std::vector<CategoryBreakdownItem> categories;
    std::vector<PeriodBucket> periods;
    std::vector<BudgetItem> budgets;
    std::vector<RecurringItem> recurring;
    std::vector<AccountItem> accounts;
    std::optional<HealthScore> health;

    explicit InsightDetail(InsightDetailKind k = InsightDetailKind::PeriodTrend) : kind(k) {}

    static InsightDetail category_breakdown(std::vector<CategoryBreakdownItem> items);
    static InsightDetail period_trend(std::vector<PeriodBucket> buckets);
    static InsightDetail budget_progress(std::vector<BudgetItem> items);
    static InsightDetail recurring_list(std::vector<RecurringItem> items);
    static InsightDetail account_comparison(std::vector<AccountItem> items);
    static InsightDetail wealth_breakdown(std::vector<AccountItem> items);
    static InsightDetail health_breakdown(const HealthScore& score);
};

// ============================================================================
// Insight
// ============================================================================

/**
 * One actionable observation about the user's finances.
 * Built once by a generator and not modified afterwards.
 */
struct Insight {
    std::string id;
    InsightType type;
    std::string title;
    std::string subtitle;
    InsightMetric metric;
    std::optional<InsightTrend> trend;
    InsightSeverity severity;
    InsightCategory category;
    std::optional<InsightDetail> detail;

    Insight();
};

// ============================================================================
// Shared conventions
// ============================================================================

// up above +2 %, down below -2 %, flat in between
TrendDirection trend_direction(double change_percent);

// Percentage change from previous to current; nullopt when previous is zero
std::optional<double> percent_change(double current, double previous);

// "1,234.56 USD"
std::string format_currency(double value, const std::string& currency);

// Like format_currency but drops the decimals for whole values and |value| >= 100
std::string format_currency_smart(double value, const std::string& currency);

// printf-style "%.<decimals>f%%"
std::string format_percent(double value, int decimals = 1);

std::string format_number(double value, int decimals);

} // namespace finsight

#endif // FINSIGHT_INSIGHT_HPP
