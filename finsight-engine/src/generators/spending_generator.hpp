#ifndef FINSIGHT_SPENDING_GENERATOR_HPP
#define FINSIGHT_SPENDING_GENERATOR_HPP

#include "insight_generator.hpp"
#include <optional>

namespace finsight {

/**
 * Spending insights:
 * - top spending category of the current bucket, with a full breakdown
 * - period-over-period spending change (not for all time)
 * - average daily spending
 * - spending spike: this month vs the previous three months, per category
 * - category trend: longest run of month-on-month increases
 *
 * Produces nothing when the window holds no expenses.
 */
class SpendingGenerator : public InsightGenerator {
public:
    std::string name() const override { return "spending"; }
    InsightCategory category() const override { return InsightCategory::Spending; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    std::optional<Insight> top_category(const GeneratorContext& context) const;
    std::optional<Insight> period_over_period(const GeneratorContext& context) const;
    std::optional<Insight> average_daily(const GeneratorContext& context) const;
    std::optional<Insight> spending_spike(const GeneratorContext& context) const;
    std::optional<Insight> category_trend(const GeneratorContext& context) const;
};

} // namespace finsight

#endif // FINSIGHT_SPENDING_GENERATOR_HPP
