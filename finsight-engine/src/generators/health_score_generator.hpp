#ifndef FINSIGHT_HEALTH_SCORE_GENERATOR_HPP
#define FINSIGHT_HEALTH_SCORE_GENERATOR_HPP

#include "insight_generator.hpp"
#include <optional>

namespace finsight {

// "Excellent" (>= 80), "Good" (>= 60), "Fair" (>= 40) or "Needs Attention"
std::string health_grade(int score);

/**
 * Composite financial health score.
 *
 * Components (each 0-100 before weighting):
 *   savings rate      0.30   rate / 20 % of income, capped at 100
 *   budget adherence  0.25   share of budgets not exceeded this month (50 without budgets)
 *   recurring ratio   0.20   1 - recurring expenses / income
 *   emergency fund    0.15   months covered / 6, capped at 100
 *   cash flow         0.10   100 when the latest period's net flow is positive
 *
 * Nothing is produced when the window holds no income.
 */
class HealthScoreGenerator : public InsightGenerator {
public:
    std::string name() const override { return "health_score"; }
    InsightCategory category() const override { return InsightCategory::Savings; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    std::optional<HealthScore> compute(const GeneratorContext& context) const;
};

} // namespace finsight

#endif // FINSIGHT_HEALTH_SCORE_GENERATOR_HPP
