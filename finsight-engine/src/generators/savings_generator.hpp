#ifndef FINSIGHT_SAVINGS_GENERATOR_HPP
#define FINSIGHT_SAVINGS_GENERATOR_HPP

#include "insight_generator.hpp"
#include <optional>

namespace finsight {

/**
 * Savings insights:
 * - savings rate over the window (>20 % positive, >=10 % warning, else critical)
 * - emergency fund: months of recent average expenses covered by the balance
 * - savings momentum: this month's rate against the preceding months
 */
class SavingsGenerator : public InsightGenerator {
public:
    std::string name() const override { return "savings"; }
    InsightCategory category() const override { return InsightCategory::Savings; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    std::optional<Insight> savings_rate(const GeneratorContext& context) const;
    std::optional<Insight> emergency_fund(const GeneratorContext& context) const;
    std::optional<Insight> savings_momentum(const GeneratorContext& context) const;
};

} // namespace finsight

#endif // FINSIGHT_SAVINGS_GENERATOR_HPP
