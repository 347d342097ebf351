#include "wealth_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>
#include <cmath>

namespace finsight {

std::vector<PeriodBucket> WealthGenerator::cumulative_series(const std::vector<PeriodBucket>& buckets,
                                                             double current_total) {
    double total_net = 0.0;
    for (const auto& bucket : buckets) {
        total_net += bucket.net_flow();
    }

    // Start from the implied opening balance and accumulate each period's net flow
    double running = current_total - total_net;
    std::vector<PeriodBucket> series;
    series.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        running += bucket.net_flow();
        PeriodBucket point = bucket;
        point.cumulative_balance = running;
        series.push_back(std::move(point));
    }
    return series;
}

std::vector<Insight> WealthGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;
    if (context.accounts.empty()) {
        return insights;
    }

    double total_wealth = context.total_balance();

    std::vector<AccountItem> accounts;
    for (const auto& account : context.accounts) {
        AccountItem item;
        item.id = account.id;
        item.account_name = account.name;
        item.currency = account.currency;
        item.balance = context.balance_for(account.id);
        item.transaction_count = static_cast<size_t>(std::count_if(
            context.all_transactions.begin(), context.all_transactions.end(),
            [&account](const Transaction& tx) { return tx.account_id == account.id; }));
        accounts.push_back(std::move(item));
    }
    std::stable_sort(accounts.begin(), accounts.end(), [](const AccountItem& a, const AccountItem& b) {
        return a.balance > b.balance;
    });

    const PeriodBucket* current = context.current_bucket();
    const PeriodBucket* previous = context.previous_bucket();
    double current_net = current ? current->net_flow() : 0.0;
    double previous_net = previous ? previous->net_flow() : 0.0;
    std::optional<double> change = percent_change(current_net, previous_net);
    TrendDirection direction = current_net > 0.0 ? TrendDirection::Up
                             : current_net < 0.0 ? TrendDirection::Down
                             : TrendDirection::Flat;
    std::string comparison = comparison_period_name(context.granularity);

    Insight wealth;
    wealth.id = "total_wealth";
    wealth.type = InsightType::TotalWealth;
    wealth.title = "Total Wealth";
    wealth.subtitle = "Across all accounts";
    wealth.metric = currency_metric(total_wealth, context.base_currency);
    wealth.trend = make_trend(direction, change, current_net, comparison);
    wealth.severity = total_wealth >= 0.0 ? InsightSeverity::Positive : InsightSeverity::Critical;
    wealth.category = InsightCategory::Wealth;
    wealth.detail = InsightDetail::wealth_breakdown(std::move(accounts));
    insights.push_back(std::move(wealth));

    if (change && std::abs(*change) > 1.0) {
        Insight growth;
        growth.id = "wealth_growth";
        growth.type = InsightType::WealthGrowth;
        growth.title = "Wealth Growth";
        growth.subtitle = comparison;
        growth.metric = currency_metric(current_net, context.base_currency);
        growth.trend = make_trend(direction, *change, std::nullopt, comparison);
        growth.severity = current_net > 0.0 ? InsightSeverity::Positive : InsightSeverity::Warning;
        growth.category = InsightCategory::Wealth;
        growth.detail = InsightDetail::period_trend(cumulative_series(context.buckets, total_wealth));
        insights.push_back(std::move(growth));
    }

    if (auto dormancy = account_dormancy(context)) {
        insights.push_back(std::move(*dormancy));
    }
    return insights;
}

std::optional<Insight> WealthGenerator::account_dormancy(const GeneratorContext& context) const {
    Timestamp cutoff = add_days(context.now, -30);

    std::vector<AccountItem> dormant;
    for (const auto& account : context.accounts) {
        double balance = context.balance_for(account.id);
        if (balance <= 0.0) {
            continue;
        }

        std::optional<Timestamp> last_activity;
        size_t count = 0;
        for (const auto& tx : context.all_transactions) {
            if (tx.account_id != account.id) {
                continue;
            }
            count++;
            if (!last_activity || tx.date > *last_activity) {
                last_activity = tx.date;
            }
        }
        if (!last_activity || !(*last_activity < cutoff)) {
            continue;
        }

        AccountItem item;
        item.id = account.id;
        item.account_name = account.name;
        item.currency = account.currency;
        item.balance = balance;
        item.transaction_count = count;
        item.last_activity_date = last_activity;
        dormant.push_back(std::move(item));
    }

    if (dormant.empty()) {
        return std::nullopt;
    }

    size_t count = dormant.size();
    Insight insight;
    insight.id = "accountDormancy";
    insight.type = InsightType::AccountDormancy;
    insight.title = "Dormant Accounts";
    insight.subtitle = std::to_string(count) + " idle for 30+ days";
    insight.metric = plain_metric(static_cast<double>(count), std::to_string(count));
    insight.severity = InsightSeverity::Neutral;
    insight.category = InsightCategory::Wealth;
    insight.detail = InsightDetail::account_comparison(std::move(dormant));
    return insight;
}

} // namespace finsight
