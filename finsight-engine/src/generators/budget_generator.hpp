#ifndef FINSIGHT_BUDGET_GENERATOR_HPP
#define FINSIGHT_BUDGET_GENERATOR_HPP

#include "insight_generator.hpp"

namespace finsight {

// Start of the budget period containing now. Monthly budgets restart on the
// category's reset day, clamped to the length of the month.
Timestamp budget_period_start(const Category& category, Timestamp now);

// Number of days in the budget period containing now
int budget_period_days(const Category& category, Timestamp now);

/**
 * Budget insights over expense categories with a budget:
 * categories already over budget, categories projected to overspend by the
 * end of their period, and categories using less than 80 % of their budget.
 */
class BudgetGenerator : public InsightGenerator {
public:
    std::string name() const override { return "budget"; }
    InsightCategory category() const override { return InsightCategory::Budget; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    // Progress of every budgeted expense category, in category order
    std::vector<BudgetItem> budget_items(const GeneratorContext& context) const;
};

} // namespace finsight

#endif // FINSIGHT_BUDGET_GENERATOR_HPP
