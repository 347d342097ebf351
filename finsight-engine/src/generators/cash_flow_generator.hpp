#ifndef FINSIGHT_CASH_FLOW_GENERATOR_HPP
#define FINSIGHT_CASH_FLOW_GENERATOR_HPP

#include "insight_generator.hpp"

namespace finsight {

/**
 * Cash flow insights over the bucket sequence (needs at least two buckets):
 * latest net flow against the average, best and worst period, and the
 * balance projected one period ahead from active recurring series.
 */
class CashFlowGenerator : public InsightGenerator {
public:
    std::string name() const override { return "cash_flow"; }
    InsightCategory category() const override { return InsightCategory::CashFlow; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;
};

} // namespace finsight

#endif // FINSIGHT_CASH_FLOW_GENERATOR_HPP
