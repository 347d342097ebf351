#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace finsight {
namespace io {

namespace {

json category_item_json(const CategoryBreakdownItem& item) {
    json subcategories = json::array();
    for (const auto& sub : item.subcategories) {
        subcategories.push_back({
            {"name", sub.name},
            {"amount", sub.amount},
            {"percentage", sub.percentage}
        });
    }
    return {
        {"category_name", item.category_name},
        {"amount", item.amount},
        {"percentage", item.percentage},
        {"color", item.color},
        {"subcategories", subcategories}
    };
}

json budget_item_json(const BudgetItem& item) {
    return {
        {"category_name", item.category_name},
        {"budget_amount", item.budget_amount},
        {"spent", item.spent},
        {"percentage", item.percentage},
        {"is_over_budget", item.is_over_budget},
        {"days_remaining", item.days_remaining},
        {"projected_spend", item.projected_spend},
        {"color", item.color}
    };
}

json recurring_item_json(const RecurringItem& item) {
    return {
        {"id", item.id},
        {"name", item.name},
        {"amount", item.amount},
        {"currency", item.currency},
        {"frequency", to_string(item.frequency)},
        {"kind", to_string(item.kind)},
        {"monthly_equivalent", item.monthly_equivalent}
    };
}

json account_item_json(const AccountItem& item) {
    json j = {
        {"id", item.id},
        {"account_name", item.account_name},
        {"currency", item.currency},
        {"balance", item.balance},
        {"transaction_count", item.transaction_count}
    };
    if (item.last_activity_date) {
        j["last_activity_date"] = format_date(*item.last_activity_date);
    }
    return j;
}

} // anonymous namespace

json to_json(const PeriodBucket& bucket) {
    json j = {
        {"key", bucket.key},
        {"granularity", to_string(bucket.granularity)},
        {"period_start", format_date(bucket.period_start)},
        {"period_end", format_date(bucket.period_end)},
        {"label", bucket.label},
        {"income", bucket.income},
        {"expenses", bucket.expenses},
        {"net_flow", bucket.net_flow()}
    };
    if (bucket.cumulative_balance) {
        j["cumulative_balance"] = *bucket.cumulative_balance;
    }
    return j;
}

json to_json(const HealthScore& score) {
    return {
        {"score", score.score},
        {"grade", score.grade},
        {"savings_rate_score", score.savings_rate_score},
        {"budget_adherence_score", score.budget_adherence_score},
        {"recurring_ratio_score", score.recurring_ratio_score},
        {"emergency_fund_score", score.emergency_fund_score},
        {"cashflow_score", score.cashflow_score}
    };
}

json to_json(const InsightDetail& detail) {
    json j = {{"kind", to_string(detail.kind)}};
    json items = json::array();

    switch (detail.kind) {
        case InsightDetailKind::CategoryBreakdown:
            for (const auto& item : detail.categories) items.push_back(category_item_json(item));
            break;
        case InsightDetailKind::PeriodTrend:
            items = buckets_to_json(detail.periods);
            break;
        case InsightDetailKind::BudgetProgress:
            for (const auto& item : detail.budgets) items.push_back(budget_item_json(item));
            break;
        case InsightDetailKind::RecurringList:
            for (const auto& item : detail.recurring) items.push_back(recurring_item_json(item));
            break;
        case InsightDetailKind::AccountComparison:
        case InsightDetailKind::WealthBreakdown:
            for (const auto& item : detail.accounts) items.push_back(account_item_json(item));
            break;
        case InsightDetailKind::HealthScoreBreakdown:
            if (detail.health) {
                j["health"] = to_json(*detail.health);
            }
            return j;
    }

    j["items"] = items;
    return j;
}

json to_json(const Insight& insight) {
    json metric = {
        {"value", insight.metric.value},
        {"formatted_value", insight.metric.formatted_value}
    };
    if (insight.metric.currency) metric["currency"] = *insight.metric.currency;
    if (insight.metric.unit) metric["unit"] = *insight.metric.unit;

    json j = {
        {"id", insight.id},
        {"type", to_string(insight.type)},
        {"title", insight.title},
        {"subtitle", insight.subtitle},
        {"metric", metric},
        {"severity", to_string(insight.severity)},
        {"category", to_string(insight.category)}
    };

    if (insight.trend) {
        json trend = {
            {"direction", to_string(insight.trend->direction)},
            {"comparison_period", insight.trend->comparison_period}
        };
        if (insight.trend->change_percent) trend["change_percent"] = *insight.trend->change_percent;
        if (insight.trend->change_absolute) trend["change_absolute"] = *insight.trend->change_absolute;
        j["trend"] = trend;
    }

    if (insight.detail) {
        j["detail"] = to_json(*insight.detail);
    }
    return j;
}

json insights_to_json(const std::vector<Insight>& insights) {
    json array = json::array();
    for (const auto& insight : insights) {
        array.push_back(to_json(insight));
    }
    return array;
}

json buckets_to_json(const std::vector<PeriodBucket>& buckets) {
    json array = json::array();
    for (const auto& bucket : buckets) {
        array.push_back(to_json(bucket));
    }
    return array;
}

void write_json(std::ostream& os, const json& document, bool pretty_print) {
    os << document.dump(pretty_print ? 2 : -1) << "\n";
}

void write_json(const std::string& filepath, const json& document, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_json(file, document, pretty_print);
}

} // namespace io
} // namespace finsight
