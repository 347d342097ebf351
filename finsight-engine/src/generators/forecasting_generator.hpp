#ifndef FINSIGHT_FORECASTING_GENERATOR_HPP
#define FINSIGHT_FORECASTING_GENERATOR_HPP

#include "insight_generator.hpp"
#include <optional>

namespace finsight {

/**
 * Forward-looking insights built on the monthly aggregates:
 * - spending forecast for the rest of the month
 * - balance runway at the recent net burn rate
 * - this month against the same month last year
 * - income seasonality (peak calendar month)
 * - spending velocity: daily rate this month against last month
 */
class ForecastingGenerator : public InsightGenerator {
public:
    std::string name() const override { return "forecasting"; }
    InsightCategory category() const override { return InsightCategory::Forecasting; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    std::optional<Insight> spending_forecast(const GeneratorContext& context) const;
    std::optional<Insight> balance_runway(const GeneratorContext& context) const;
    std::optional<Insight> year_over_year(const GeneratorContext& context) const;
    std::optional<Insight> income_seasonality(const GeneratorContext& context) const;
    std::optional<Insight> spending_velocity(const GeneratorContext& context) const;
};

} // namespace finsight

#endif // FINSIGHT_FORECASTING_GENERATOR_HPP
