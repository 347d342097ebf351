#include "forecasting_generator.hpp"
#include "generator_helpers.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace finsight {

namespace {

// "+12%" / "-8%"
std::string signed_percent(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%+.0f%%", value);
    return buffer;
}

std::optional<MonthlyAggregate> month_aggregate(const GeneratorContext& context, Timestamp date) {
    Timestamp month = start_of_month(date);
    std::vector<MonthlyAggregate> records = context.monthly_aggregates(month, add_months(month, 1));
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

} // anonymous namespace

std::vector<Insight> ForecastingGenerator::generate(const GeneratorContext& context) const {
    std::vector<Insight> insights;
    for (auto insight : {spending_forecast(context), balance_runway(context), year_over_year(context),
                         income_seasonality(context), spending_velocity(context)}) {
        if (insight) {
            insights.push_back(std::move(*insight));
        }
    }
    return insights;
}

std::optional<Insight> ForecastingGenerator::spending_forecast(const GeneratorContext& context) const {
    if (!context.aggregates) {
        return std::nullopt;
    }

    double last30_spent = 0.0;
    for (const auto& record : context.category_aggregates(add_days(context.now, -30), context.now)) {
        last30_spent += record.total_expenses;
    }
    double average_daily = last30_spent / 30.0;

    CivilDate today = to_civil(context.now);
    int month_days = static_cast<int>(days_in_month(today.year, today.month));
    int days_remaining = month_days - static_cast<int>(today.day);

    // Recurring expenses already running by now
    double recurring_monthly = 0.0;
    for (const RecurringSeries* series : context.active_series()) {
        if (context.is_income_category(series->category) || series->start_date > context.now) {
            continue;
        }
        recurring_monthly += context.series_monthly(*series);
    }

    std::optional<MonthlyAggregate> this_month = month_aggregate(context, context.now);
    double spent_so_far = this_month ? this_month->total_expenses : 0.0;
    double monthly_income = this_month ? this_month->total_income : 0.0;

    double pending_recurring = std::max(0.0, recurring_monthly / month_days * days_remaining);
    double forecast = spent_so_far + average_daily * days_remaining + pending_recurring;

    if (context.logger) {
        context.logger->debug("Spending forecast", {
            {"spent_so_far", format_number(spent_so_far, 2)},
            {"average_daily", format_number(average_daily, 2)},
            {"days_remaining", std::to_string(days_remaining)},
            {"forecast", format_number(forecast, 2)}
        });
    }

    Insight insight;
    insight.id = "spending_forecast";
    insight.type = InsightType::SpendingForecast;
    insight.title = "Spending Forecast";
    insight.subtitle = std::to_string(days_remaining) + " days remaining";
    insight.metric = currency_metric(forecast, context.base_currency);
    insight.severity = monthly_income > 0.0
        ? (forecast > monthly_income ? InsightSeverity::Warning : InsightSeverity::Positive)
        : InsightSeverity::Neutral;
    insight.category = InsightCategory::Forecasting;
    return insight;
}

std::optional<Insight> ForecastingGenerator::balance_runway(const GeneratorContext& context) const {
    double balance = context.total_balance();
    if (balance <= 0.0) {
        return std::nullopt;
    }

    std::vector<MonthlyAggregate> recent = context.last_months(3, context.now);
    if (recent.empty()) {
        return std::nullopt;
    }
    double total_net = 0.0;
    for (const auto& month : recent) {
        total_net += month.net_flow();
    }
    double average_net = total_net / static_cast<double>(recent.size());

    Insight insight;
    insight.id = "balance_runway";
    insight.type = InsightType::BalanceRunway;
    insight.title = "Balance Runway";
    insight.category = InsightCategory::Forecasting;

    if (average_net >= 0.0) {
        // Not burning the balance: report the monthly surplus instead of a runway
        insight.subtitle = format_currency_smart(average_net, context.base_currency) + " per month";
        insight.metric = currency_metric(average_net, context.base_currency, std::string("per month"));
        insight.metric.formatted_value = "+" + insight.metric.formatted_value;
        insight.severity = InsightSeverity::Positive;
        return insight;
    }

    double runway = balance / std::abs(average_net);
    insight.subtitle = format_number(runway, 1) + " months";
    insight.metric = plain_metric(runway, format_number(runway, 1), std::string("months"));
    insight.severity = runway >= 3.0 ? InsightSeverity::Positive
                     : runway >= 1.0 ? InsightSeverity::Warning
                     : InsightSeverity::Critical;
    return insight;
}

std::optional<Insight> ForecastingGenerator::year_over_year(const GeneratorContext& context) const {
    std::optional<MonthlyAggregate> this_month = month_aggregate(context, context.now);
    std::optional<MonthlyAggregate> last_year = month_aggregate(context, add_years(context.now, -1));
    if (!this_month || !last_year || last_year->total_expenses <= 0.0) {
        return std::nullopt;
    }

    double current = this_month->total_expenses;
    double previous = last_year->total_expenses;
    double delta = (current - previous) / previous * 100.0;
    if (std::abs(delta) <= 3.0) {
        return std::nullopt;
    }

    Insight insight;
    insight.id = "year_over_year";
    insight.type = InsightType::YearOverYear;
    insight.title = "Year over Year";
    insight.subtitle = period_label(Granularity::Month, start_of_month(context.now), context.now);
    insight.metric = currency_metric(current, context.base_currency);
    insight.trend = make_trend(delta > 0.0 ? TrendDirection::Up : TrendDirection::Down,
                               delta, current - previous, "vs same month last year");
    insight.severity = delta <= -10.0 ? InsightSeverity::Positive
                     : delta >= 15.0 ? InsightSeverity::Warning
                     : InsightSeverity::Neutral;
    insight.category = InsightCategory::Forecasting;
    return insight;
}

std::optional<Insight> ForecastingGenerator::income_seasonality(const GeneratorContext& context) const {
    std::vector<MonthlyAggregate> history = context.monthly_aggregates(add_years(context.now, -5), context.now);
    if (history.size() < 12) {
        return std::nullopt;
    }

    std::map<unsigned, std::pair<double, int>> by_month;
    for (const auto& record : history) {
        if (record.total_income > 0.0) {
            by_month[record.month].first += record.total_income;
            by_month[record.month].second++;
        }
    }
    if (by_month.size() < 6) {
        return std::nullopt;
    }

    double sum_of_averages = 0.0;
    unsigned peak_month = 0;
    double peak_average = 0.0;
    for (const auto& entry : by_month) {
        double average = entry.second.first / entry.second.second;
        sum_of_averages += average;
        if (peak_month == 0 || average > peak_average) {
            peak_month = entry.first;
            peak_average = average;
        }
    }
    double overall = sum_of_averages / static_cast<double>(by_month.size());
    if (overall <= 0.0) {
        return std::nullopt;
    }

    double peak_percent = (peak_average - overall) / overall * 100.0;
    if (peak_percent <= 10.0) {
        return std::nullopt;
    }

    Insight insight;
    insight.id = "income_seasonality";
    insight.type = InsightType::IncomeSeasonality;
    insight.title = "Income Seasonality";
    insight.subtitle = month_name(peak_month);
    insight.metric = plain_metric(peak_percent, signed_percent(peak_percent));
    insight.severity = InsightSeverity::Neutral;
    insight.category = InsightCategory::Forecasting;
    return insight;
}

std::optional<Insight> ForecastingGenerator::spending_velocity(const GeneratorContext& context) const {
    CivilDate today = to_civil(context.now);
    if (today.day <= 3) {
        return std::nullopt;
    }

    Timestamp last_month_date = add_months(start_of_month(context.now), -1);
    std::optional<MonthlyAggregate> this_month = month_aggregate(context, context.now);
    std::optional<MonthlyAggregate> last_month = month_aggregate(context, last_month_date);
    if (!this_month || this_month->total_expenses <= 0.0) {
        return std::nullopt;
    }
    if (!last_month || last_month->total_expenses <= 0.0) {
        return std::nullopt;
    }

    CivilDate previous = to_civil(last_month_date);
    double current_rate = this_month->total_expenses / static_cast<double>(today.day);
    double previous_rate = last_month->total_expenses / days_in_month(previous.year, previous.month);
    double ratio = current_rate / previous_rate;
    if (std::abs(ratio - 1.0) <= 0.1) {
        return std::nullopt;
    }

    double change = (ratio - 1.0) * 100.0;

    Insight insight;
    insight.id = "spending_velocity";
    insight.type = InsightType::SpendingVelocity;
    insight.title = "Spending Velocity";
    insight.subtitle = signed_percent(change);
    insight.metric = plain_metric(ratio, format_number(ratio, 1) + "x");
    insight.trend = make_trend(ratio > 1.0 ? TrendDirection::Up : TrendDirection::Down,
                               change, current_rate - previous_rate, "vs previous period");
    insight.severity = ratio > 1.3 ? InsightSeverity::Warning
                     : ratio < 0.8 ? InsightSeverity::Positive
                     : InsightSeverity::Neutral;
    insight.category = InsightCategory::Forecasting;
    return insight;
}

} // namespace finsight
