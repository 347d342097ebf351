#include "period_aggregator.hpp"
#include "currency.hpp"
#include <algorithm>
#include <chrono>
#include <iterator>
#include <unordered_map>

namespace finsight {

PeriodBucket::PeriodBucket()
    : granularity(Granularity::Month)
    , period_start(from_epoch_seconds(0))
    , period_end(from_epoch_seconds(0))
    , income(0.0)
    , expenses(0.0)
{}

std::string to_string(AggregationPath path) {
    switch (path) {
        case AggregationPath::Empty: return "empty";
        case AggregationPath::Fast: return "fast";
        case AggregationPath::Slow: return "slow";
    }
    return "unknown";
}

PeriodAggregator::PeriodAggregator(const AggregateReader* aggregates,
                                   const CurrencyConverter& converter,
                                   Logger* logger)
    : aggregates_(aggregates)
    , converter_(converter)
    , logger_(logger)
{}

bool PeriodAggregator::supports_fast_path(Granularity granularity) {
    return granularity == Granularity::Year || granularity == Granularity::AllTime;
}

AggregationResult PeriodAggregator::aggregate(Granularity granularity,
                                              const std::vector<Transaction>& transactions,
                                              const std::string& base_currency,
                                              Timestamp now,
                                              std::optional<Timestamp> first_date) const {
    if (!first_date) {
        first_date = first_transaction_date(transactions);
    }
    DateWindow window = granularity_window(granularity, first_date, now);
    return aggregate_window(granularity, window, transactions, base_currency, now);
}

AggregationResult PeriodAggregator::aggregate_window(Granularity granularity,
                                                     const DateWindow& window,
                                                     const std::vector<Transaction>& transactions,
                                                     const std::string& base_currency,
                                                     Timestamp now) const {
    auto started = std::chrono::steady_clock::now();

    AggregationResult result;
    result.window = window;

    if (!window.empty()) {
        std::optional<std::vector<PeriodBucket>> folded;
        if (supports_fast_path(granularity)) {
            folded = fold_monthly_aggregates(granularity, window, base_currency, now);
        }

        if (folded) {
            result.buckets = std::move(*folded);
            result.path = AggregationPath::Fast;
        } else if (!transactions.empty()) {
            result.buckets = scan_transactions(granularity, window, transactions, base_currency, now);
            result.path = AggregationPath::Slow;
        }
    }

    if (logger_) {
        double elapsed_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        logger_->log_aggregation(to_string(granularity), to_string(result.path),
                                 result.buckets.size(), elapsed_ms);
    }
    return result;
}

std::vector<PeriodBucket> PeriodAggregator::empty_buckets(Granularity granularity,
                                                          const DateWindow& window,
                                                          Timestamp now) {
    std::vector<PeriodBucket> buckets;
    if (window.empty()) {
        return buckets;
    }

    if (granularity == Granularity::AllTime) {
        PeriodBucket bucket;
        bucket.key = period_key(granularity, window.start);
        bucket.granularity = granularity;
        bucket.period_start = window.start;
        bucket.period_end = window.end;
        bucket.label = period_label(granularity, window.start, now);
        buckets.push_back(bucket);
        return buckets;
    }

    for (Timestamp cursor = period_start(granularity, window.start);
         cursor < window.end;
         cursor = advance_period(granularity, cursor)) {
        PeriodBucket bucket;
        bucket.key = period_key(granularity, cursor);
        bucket.granularity = granularity;
        bucket.period_start = cursor;
        bucket.period_end = advance_period(granularity, cursor);
        bucket.label = period_label(granularity, cursor, now);
        buckets.push_back(bucket);
    }
    return buckets;
}

std::vector<PeriodBucket> PeriodAggregator::scan_transactions(Granularity granularity,
                                                              const DateWindow& window,
                                                              const std::vector<Transaction>& transactions,
                                                              const std::string& base_currency,
                                                              Timestamp now) const {
    std::vector<PeriodBucket> buckets = empty_buckets(granularity, window, now);

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < buckets.size(); ++i) {
        index[buckets[i].key] = i;
    }

    for (const auto& tx : transactions) {
        if (tx.type == TransactionType::Transfer || !window.contains(tx.date)) {
            continue;
        }

        auto it = index.find(period_key(granularity, tx.date));
        if (it == index.end()) {
            continue;
        }

        PeriodBucket& bucket = buckets[it->second];
        double amount = resolve_amount(tx, base_currency, converter_, logger_);
        if (tx.is_income()) {
            bucket.income += amount;
        } else {
            bucket.expenses += amount;
        }
    }
    return buckets;
}

std::optional<std::vector<PeriodBucket>> PeriodAggregator::fold_monthly_aggregates(Granularity granularity,
                                                                                   const DateWindow& window,
                                                                                   const std::string& base_currency,
                                                                                   Timestamp now) const {
    if (!aggregates_ || window.empty()) {
        return std::nullopt;
    }

    std::vector<MonthlyAggregate> monthly =
        aggregates_->fetch_monthly_aggregates(window.start, window.end, base_currency);
    if (monthly.empty()) {
        return std::nullopt;
    }

    std::vector<PeriodBucket> buckets = empty_buckets(granularity, window, now);

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < buckets.size(); ++i) {
        index[buckets[i].key] = i;
    }

    for (const auto& record : monthly) {
        Timestamp month_start = make_date(record.year, record.month, 1);
        auto it = index.find(period_key(granularity, month_start));
        if (it == index.end()) {
            continue;
        }
        buckets[it->second].income += record.total_income;
        buckets[it->second].expenses += record.total_expenses;
    }
    return buckets;
}

// ============================================================================
// Free helpers
// ============================================================================

std::optional<Timestamp> first_transaction_date(const std::vector<Transaction>& transactions) {
    std::optional<Timestamp> first;
    for (const auto& tx : transactions) {
        if (!first || tx.date < *first) {
            first = tx.date;
        }
    }
    return first;
}

PeriodSummary compute_period_summary(const std::vector<Transaction>& transactions,
                                     const std::string& base_currency,
                                     const CurrencyConverter& converter,
                                     Timestamp now,
                                     Logger* logger) {
    PeriodSummary summary;
    Timestamp cutoff = add_days(start_of_day(now), 1);

    for (const auto& tx : transactions) {
        if (tx.date >= cutoff || tx.type == TransactionType::Transfer) {
            continue;
        }
        double amount = resolve_amount(tx, base_currency, converter, logger);
        if (tx.is_income()) {
            summary.total_income += amount;
        } else {
            summary.total_expenses += amount;
        }
    }

    summary.net_flow = summary.total_income - summary.total_expenses;
    return summary;
}

std::vector<Transaction> filter_by_window(const std::vector<Transaction>& transactions,
                                          const DateWindow& window) {
    std::vector<Transaction> result;
    std::copy_if(transactions.begin(), transactions.end(), std::back_inserter(result),
                 [&window](const Transaction& tx) { return window.contains(tx.date); });
    return result;
}

const PeriodBucket* find_bucket(const std::vector<PeriodBucket>& buckets, const std::string& key) {
    auto it = std::find_if(buckets.begin(), buckets.end(),
                           [&key](const PeriodBucket& b) { return b.key == key; });
    return it == buckets.end() ? nullptr : &*it;
}

} // namespace finsight
