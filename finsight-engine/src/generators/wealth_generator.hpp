#ifndef FINSIGHT_WEALTH_GENERATOR_HPP
#define FINSIGHT_WEALTH_GENERATOR_HPP

#include "insight_generator.hpp"
#include <optional>

namespace finsight {

/**
 * Wealth insights (needs at least one account):
 * - total wealth with a per-account breakdown
 * - wealth growth against the previous period, with a cumulative balance series
 * - dormant accounts: positive balance and no activity for 30 days
 */
class WealthGenerator : public InsightGenerator {
public:
    std::string name() const override { return "wealth"; }
    InsightCategory category() const override { return InsightCategory::Wealth; }
    std::vector<Insight> generate(const GeneratorContext& context) const override;

    std::optional<Insight> account_dormancy(const GeneratorContext& context) const;

    // Buckets with cumulative_balance filled, ending at the current total balance
    static std::vector<PeriodBucket> cumulative_series(const std::vector<PeriodBucket>& buckets,
                                                       double current_total);
};

} // namespace finsight

#endif // FINSIGHT_WEALTH_GENERATOR_HPP
