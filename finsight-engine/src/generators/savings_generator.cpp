#include "savings_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>
#include <cmath>

namespace finsight {

std::vector<Insight> SavingsGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;
    for (auto insight : {savings_rate(context), emergency_fund(context), savings_momentum(context)}) {
        if (insight) {
            insights.push_back(std::move(*insight));
        }
    }
    return insights;
}

std::optional<Insight> SavingsGenerator::savings_rate(const GeneratorContext& context) const {
    double income = context.summary.total_income;
    double expenses = context.summary.total_expenses;
    if (income <= 0.0) {
        return std::nullopt;
    }

    double saved = income - expenses;
    double rate = saved / income * 100.0;

    Insight insight;
    insight.id = "savings_rate";
    insight.type = InsightType::SavingsRate;
    insight.title = "Savings Rate";
    insight.subtitle = format_currency_smart(std::max(0.0, saved), context.base_currency);
    insight.metric = plain_metric(rate, format_percent(rate, 1));
    insight.severity = rate > 20.0 ? InsightSeverity::Positive
                     : rate >= 10.0 ? InsightSeverity::Warning
                     : InsightSeverity::Critical;
    insight.category = InsightCategory::Savings;
    return insight;
}

std::optional<Insight> SavingsGenerator::emergency_fund(const GeneratorContext& context) const {
    double balance = context.total_balance();
    if (balance <= 0.0) {
        return std::nullopt;
    }

    std::vector<MonthlyAggregate> recent = context.last_months(3, context.now);
    if (recent.empty()) {
        return std::nullopt;
    }
    double total_expenses = 0.0;
    for (const auto& month : recent) {
        total_expenses += month.total_expenses;
    }
    double average_expenses = total_expenses / static_cast<double>(recent.size());
    if (average_expenses <= 0.0) {
        return std::nullopt;
    }

    double months = balance / average_expenses;

    Insight insight;
    insight.id = "emergency_fund";
    insight.type = InsightType::EmergencyFund;
    insight.title = "Emergency Fund";
    insight.subtitle = std::to_string(static_cast<long long>(std::floor(months))) + " months covered";
    insight.metric = plain_metric(months, format_number(months, 1), std::string("months"));
    insight.severity = months >= 3.0 ? InsightSeverity::Positive
                     : months >= 1.0 ? InsightSeverity::Warning
                     : InsightSeverity::Critical;
    insight.category = InsightCategory::Savings;
    return insight;
}

std::optional<Insight> SavingsGenerator::savings_momentum(const GeneratorContext& context) const {
    std::vector<MonthlyAggregate> recent = context.last_months(4, context.now);
    if (recent.size() < 2) {
        return std::nullopt;
    }

    std::vector<double> rates;
    for (const auto& month : recent) {
        rates.push_back(month.total_income > 0.0 ? month.net_flow() / month.total_income * 100.0 : 0.0);
    }

    double current_rate = rates.back();
    double previous_sum = 0.0;
    for (size_t i = 0; i + 1 < rates.size(); ++i) {
        previous_sum += rates[i];
    }
    double previous_avg = previous_sum / static_cast<double>(rates.size() - 1);
    double delta = current_rate - previous_avg;
    if (std::abs(delta) <= 1.0) {
        return std::nullopt;
    }

    Insight insight;
    insight.id = "savings_momentum";
    insight.type = InsightType::SavingsMomentum;
    insight.title = "Savings Momentum";
    insight.subtitle = "vs previous 3 months";
    insight.metric = plain_metric(current_rate, format_percent(current_rate, 1));
    insight.trend = make_trend(delta > 0.0 ? TrendDirection::Up : TrendDirection::Down,
                               delta, std::nullopt, "vs previous 3 months");
    insight.severity = delta > 2.0 ? InsightSeverity::Positive
                     : delta < -2.0 ? InsightSeverity::Warning
                     : InsightSeverity::Neutral;
    insight.category = InsightCategory::Savings;
    return insight;
}

} // namespace finsight
