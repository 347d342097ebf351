#include "aggregate_store.hpp"

namespace finsight {

namespace {

// Calendar month [start, start + 1 month) overlaps [from, to)
bool month_overlaps(int year, unsigned month, Timestamp from, Timestamp to) {
    Timestamp month_start = make_date(year, month, 1);
    Timestamp month_end = add_months(month_start, 1);
    return month_start < to && month_end > from;
}

} // anonymous namespace

void InMemoryAggregateStore::rebuild(const std::vector<Transaction>& transactions,
                                     const std::string& currency,
                                     const CurrencyConverter& converter,
                                     Timestamp now,
                                     Logger* logger) {
    auto& monthly = monthly_[currency];
    auto& categories = categories_[currency];
    monthly.clear();
    categories.clear();

    // Same cutoff as compute_period_summary and the slow path
    Timestamp cutoff = add_days(start_of_day(now), 1);
    size_t skipped_future = 0;

    for (const auto& tx : transactions) {
        if (tx.type == TransactionType::Transfer) {
            continue;
        }
        if (tx.date >= cutoff) {
            skipped_future++;
            continue;
        }

        CivilDate c = to_civil(tx.date);
        double amount = resolve_amount(tx, currency, converter, logger);

        auto it = monthly.find({c.year, c.month});
        if (it == monthly.end()) {
            it = monthly.emplace(MonthKey{c.year, c.month},
                                 MonthlyAggregate{c.year, c.month, 0.0, 0.0}).first;
        }

        if (tx.is_income()) {
            it->second.total_income += amount;
        } else {
            it->second.total_expenses += amount;

            CategoryKey key{c.year, c.month, tx.category};
            auto cat = categories.find(key);
            if (cat == categories.end()) {
                cat = categories.emplace(key, CategoryAggregate{tx.category, c.year, c.month, 0.0}).first;
            }
            cat->second.total_expenses += amount;
        }
    }

    if (logger) {
        logger->debug("Aggregates rebuilt", {
            {"currency", currency},
            {"months", std::to_string(monthly.size())},
            {"category_records", std::to_string(categories.size())},
            {"skipped_future", std::to_string(skipped_future)}
        });
    }
}

void InMemoryAggregateStore::put_monthly(const std::string& currency, const MonthlyAggregate& aggregate) {
    monthly_[currency][{aggregate.year, aggregate.month}] = aggregate;
}

void InMemoryAggregateStore::put_category(const std::string& currency, const CategoryAggregate& aggregate) {
    categories_[currency][CategoryKey{aggregate.year, aggregate.month, aggregate.category_name}] = aggregate;
}

void InMemoryAggregateStore::clear() {
    monthly_.clear();
    categories_.clear();
}

bool InMemoryAggregateStore::has_currency(const std::string& currency) const {
    auto it = monthly_.find(currency);
    return it != monthly_.end() && !it->second.empty();
}

std::vector<MonthlyAggregate> InMemoryAggregateStore::fetch_monthly_aggregates(
    Timestamp from, Timestamp to, const std::string& currency) const {
    std::vector<MonthlyAggregate> result;

    auto it = monthly_.find(currency);
    if (it == monthly_.end() || !(from < to)) {
        return result;
    }

    for (const auto& [key, aggregate] : it->second) {
        if (month_overlaps(key.first, key.second, from, to)) {
            result.push_back(aggregate);
        }
    }
    return result;
}

std::vector<CategoryAggregate> InMemoryAggregateStore::fetch_category_aggregates(
    Timestamp from, Timestamp to, const std::string& currency) const {
    std::vector<CategoryAggregate> result;

    auto it = categories_.find(currency);
    if (it == categories_.end() || !(from < to)) {
        return result;
    }

    for (const auto& [key, aggregate] : it->second) {
        if (month_overlaps(std::get<0>(key), std::get<1>(key), from, to)) {
            result.push_back(aggregate);
        }
    }
    return result;
}

} // namespace finsight
