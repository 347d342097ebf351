#ifndef FINSIGHT_INCOME_GENERATOR_HPP
#define FINSIGHT_INCOME_GENERATOR_HPP

#include "insight_generator.hpp"
#include <optional>

namespace finsight {

/**
 * Income insights: period-over-period growth, income to expense ratio and
 * the split of income by source category. Produces nothing when the window
 * holds no income.
 */
class IncomeGenerator : public InsightGenerator {
public:
    std::string name() const override { return "income"; }
    InsightCategory category() const override { return InsightCategory::Income; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    std::optional<Insight> income_growth(const GeneratorContext& context) const;
    std::optional<Insight> income_vs_expense(const GeneratorContext& context) const;
    std::optional<Insight> source_breakdown(const GeneratorContext& context) const;
};

} // namespace finsight

#endif // FINSIGHT_INCOME_GENERATOR_HPP
