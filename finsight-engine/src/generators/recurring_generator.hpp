#ifndef FINSIGHT_RECURRING_GENERATOR_HPP
#define FINSIGHT_RECURRING_GENERATOR_HPP

#include "insight_generator.hpp"
#include <optional>

namespace finsight {

/**
 * Recurring payment insights:
 * - total recurring cost, scaled from monthly to the granularity's period
 * - subscription growth against the set of series active three months ago
 * - possible duplicate subscriptions (same category, or near-identical cost)
 */
class RecurringGenerator : public InsightGenerator {
public:
    std::string name() const override { return "recurring"; }
    InsightCategory category() const override { return InsightCategory::Recurring; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    std::optional<Insight> total_recurring(const GeneratorContext& context) const;
    std::optional<Insight> subscription_growth(const GeneratorContext& context) const;
    std::optional<Insight> duplicate_subscriptions(const GeneratorContext& context) const;
};

} // namespace finsight

#endif // FINSIGHT_RECURRING_GENERATOR_HPP
