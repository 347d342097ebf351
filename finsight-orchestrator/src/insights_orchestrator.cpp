#include "insights_orchestrator.hpp"
#include "currency.hpp"
#include "generators/budget_generator.hpp"
#include "generators/cash_flow_generator.hpp"
#include "generators/forecasting_generator.hpp"
#include "generators/health_score_generator.hpp"
#include "generators/income_generator.hpp"
#include "generators/recurring_generator.hpp"
#include "generators/savings_generator.hpp"
#include "generators/spending_generator.hpp"
#include "generators/wealth_generator.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace finsight {

namespace {

void require_currency_code(const std::string& base_currency) {
    if (!is_valid_currency_code(base_currency)) {
        throw std::invalid_argument("Invalid base currency: '" + base_currency + "'");
    }
}

std::vector<std::string> split_key(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '_')) {
        parts.push_back(part);
    }
    return parts;
}

} // anonymous namespace

InsightsOrchestrator::InsightsOrchestrator(
    const LedgerSource& ledger,
    const CurrencyConverter& converter,
    const AggregateReader* aggregates,
    const OrchestratorConfig& config,
    Logger* logger,
    ClockFn clock
) : InsightsOrchestrator(ledger, converter, aggregates, default_generators(),
                         config, logger, std::move(clock)) {}

InsightsOrchestrator::InsightsOrchestrator(
    const LedgerSource& ledger,
    const CurrencyConverter& converter,
    const AggregateReader* aggregates,
    std::vector<std::unique_ptr<InsightGenerator>> generators,
    const OrchestratorConfig& config,
    Logger* logger,
    ClockFn clock
) : ledger_(ledger),
    converter_(converter),
    aggregates_(aggregates),
    logger_(logger),
    clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
    cache_(config.cache_capacity, config.cache_ttl, clock_),
    generators_(std::move(generators)) {}

std::vector<std::unique_ptr<InsightGenerator>> InsightsOrchestrator::default_generators() {
    std::vector<std::unique_ptr<InsightGenerator>> generators;
    generators.push_back(std::make_unique<SpendingGenerator>());
    generators.push_back(std::make_unique<IncomeGenerator>());
    generators.push_back(std::make_unique<BudgetGenerator>());
    generators.push_back(std::make_unique<RecurringGenerator>());
    generators.push_back(std::make_unique<CashFlowGenerator>());
    generators.push_back(std::make_unique<WealthGenerator>());
    generators.push_back(std::make_unique<SavingsGenerator>());
    generators.push_back(std::make_unique<ForecastingGenerator>());
    generators.push_back(std::make_unique<HealthScoreGenerator>());
    return generators;
}

// ============================================================================
// Cache keys
// ============================================================================

std::string InsightsOrchestrator::make_cache_key(const TimeFilter& filter, const std::string& base_currency) {
    require_currency_code(base_currency);
    std::string key = to_string(filter.preset) + "_" + base_currency + "_" +
                      std::to_string(to_epoch_seconds(filter.start));
    if (filter.preset == TimeFilterPreset::Custom) {
        key += "_" + std::to_string(to_epoch_seconds(filter.end));
    }
    return key;
}

std::string InsightsOrchestrator::make_cache_key(Granularity granularity, const std::string& base_currency) {
    require_currency_code(base_currency);
    return "granularity_" + to_string(granularity) + "_" + base_currency;
}

std::string InsightsOrchestrator::currency_of_key(const std::string& key) {
    std::vector<std::string> parts = split_key(key);
    if (!parts.empty() && parts[0] == "granularity") {
        return parts.size() > 2 ? parts[2] : "";
    }
    return parts.size() > 1 ? parts[1] : "";
}

// ============================================================================
// Entry points
// ============================================================================

std::vector<Insight> InsightsOrchestrator::generate_all_insights(const TimeFilter& filter,
                                                                 const std::string& base_currency) {
    std::string key = make_cache_key(filter, base_currency);
    if (auto cached = lookup(key)) {
        return cached->insights;
    }

    Timestamp now = clock_();
    Timestamp reference = reference_date(filter, now);

    // Monthly buckets over the filter, starting no later than the month before
    // the reference date and no earlier than the first transaction's month
    Timestamp bucket_start = start_of_month(filter.start);
    if (auto first = first_transaction_date(ledger_.transactions())) {
        bucket_start = std::max(bucket_start, start_of_month(*first));
    }
    bucket_start = std::min(bucket_start, add_months(start_of_month(reference), -1));
    Timestamp bucket_end = std::min(filter.end, add_days(start_of_day(now), 1));

    PassRequest request;
    request.key = key;
    request.granularity = Granularity::Month;
    request.window = filter.range();
    request.bucket_window = DateWindow{bucket_start, std::max(bucket_start, bucket_end)};
    request.now = now;
    request.reference_date = reference;
    request.base_currency = base_currency;

    PassResult pass = run_pass(request);
    store(key, pass);
    return pass.result.insights;
}

GranularityResult InsightsOrchestrator::generate_all_insights(Granularity granularity,
                                                              const std::string& base_currency,
                                                              std::optional<Timestamp> first_date) {
    std::string key = make_cache_key(granularity, base_currency);
    if (auto cached = lookup(key)) {
        return *cached;
    }

    Timestamp now = clock_();
    if (!first_date) {
        first_date = first_transaction_date(ledger_.transactions());
    }

    PassRequest request;
    request.key = key;
    request.granularity = granularity;
    request.window = granularity_window(granularity, first_date, now);
    request.bucket_window = request.window;
    request.now = now;
    request.reference_date = now;
    request.base_currency = base_currency;

    PassResult pass = run_pass(request);
    store(key, pass);
    return pass.result;
}

std::map<Granularity, GranularityResult> InsightsOrchestrator::compute_all_granularities(
    const std::string& base_currency) {
    std::optional<Timestamp> first_date = first_transaction_date(ledger_.transactions());

    std::map<Granularity, GranularityResult> results;
    for (Granularity granularity : all_granularities()) {
        results[granularity] = generate_all_insights(granularity, base_currency, first_date);
    }
    return results;
}

// ============================================================================
// Cache management
// ============================================================================

void InsightsOrchestrator::invalidate_cache() {
    size_t removed = cache_.size();
    cache_.invalidate_all();
    if (logger_) {
        logger_->log_cache_invalidation("all", removed);
    }
}

size_t InsightsOrchestrator::invalidate_currency(const std::string& base_currency) {
    size_t removed = cache_.invalidate([&base_currency](const std::string& key) {
        return currency_of_key(key) == base_currency;
    });
    if (logger_) {
        logger_->log_cache_invalidation(base_currency, removed);
    }
    return removed;
}

cache::CacheStats InsightsOrchestrator::cache_stats() const {
    return cache_.get_stats();
}

std::vector<std::string> InsightsOrchestrator::generator_names() const {
    std::vector<std::string> names;
    for (const auto& generator : generators_) {
        names.push_back(generator->name());
    }
    return names;
}

std::optional<GranularityResult> InsightsOrchestrator::lookup(const std::string& key) {
    std::optional<GranularityResult> cached = cache_.get(key);
    if (logger_) {
        logger_->log_cache_lookup(key, cached.has_value());
    }
    return cached;
}

void InsightsOrchestrator::store(const std::string& key, const PassResult& pass) {
    if (!pass.complete) {
        if (logger_) {
            logger_->warn("Incomplete insights pass not cached", {{"cache_key", key}});
        }
        return;
    }
    cache_.set(key, pass.result);
    if (logger_) {
        logger_->log_cache_store(key, pass.result.insights.size());
    }
}

// ============================================================================
// Generation pass
// ============================================================================

InsightsOrchestrator::PassResult InsightsOrchestrator::run_pass(const PassRequest& request) const {
    auto started = std::chrono::steady_clock::now();

    const std::vector<Transaction>& all = ledger_.transactions();
    std::vector<Transaction> windowed = filter_by_window(all, request.window);

    if (logger_) {
        logger_->log_generation_start(request.key, windowed.size());
    }

    PeriodSummary summary = compute_period_summary(windowed, request.base_currency, converter_,
                                                   request.now, logger_);

    PeriodAggregator aggregator(aggregates_, converter_, logger_);
    AggregationResult aggregation = aggregator.aggregate_window(
        request.granularity, request.bucket_window, all, request.base_currency, request.now);

    PassResult pass;
    pass.complete = true;
    pass.result.buckets = std::move(aggregation.buckets);

    GeneratorContext context(windowed, all, ledger_, summary, pass.result.buckets, converter_);
    context.aggregates = aggregates_;
    context.logger = logger_;
    context.granularity = request.granularity;
    context.base_currency = request.base_currency;
    context.now = request.now;
    context.reference_date = request.reference_date;
    context.window = request.window;
    context.current_key = current_period_key(request.granularity, request.reference_date);
    context.previous_key = previous_period_key(request.granularity, request.reference_date);
    context.balances = compute_account_balances(ledger_.accounts(), all, request.now);

    for (const auto& generator : generators_) {
        try {
            std::vector<Insight> produced = generator->generate(context);
            if (logger_) {
                logger_->debug("Generator finished", {
                    {"generator", generator->name()},
                    {"insight_count", std::to_string(produced.size())}
                });
            }
            pass.result.insights.insert(pass.result.insights.end(),
                                        std::make_move_iterator(produced.begin()),
                                        std::make_move_iterator(produced.end()));
        } catch (const std::exception& e) {
            pass.complete = false;
            if (logger_) {
                logger_->log_generator_failed(generator->name(), e.what());
            }
        }
    }

    if (logger_) {
        std::map<std::string, size_t> category_counts;
        for (const auto& insight : pass.result.insights) {
            category_counts[to_string(insight.category)]++;
        }
        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        logger_->log_generation_complete(request.key, pass.result.insights.size(),
                                         category_counts, elapsed_ms);
    }

    return pass;
}

} // namespace finsight
