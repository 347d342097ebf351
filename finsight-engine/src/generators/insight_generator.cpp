#include "insight_generator.hpp"
#include "../currency.hpp"

namespace finsight {

GeneratorContext::GeneratorContext(const std::vector<Transaction>& windowed,
                                   const std::vector<Transaction>& all,
                                   const LedgerSource& ledger,
                                   const PeriodSummary& period_summary,
                                   const std::vector<PeriodBucket>& period_buckets,
                                   const CurrencyConverter& currency_converter)
    : windowed_transactions(windowed)
    , all_transactions(all)
    , accounts(ledger.accounts())
    , categories(ledger.categories())
    , recurring(ledger.recurring_series())
    , summary(period_summary)
    , buckets(period_buckets)
    , converter(currency_converter)
    , aggregates(nullptr)
    , logger(nullptr)
    , granularity(Granularity::Month)
    , now()
    , reference_date()
    , window{Timestamp(), Timestamp()}
{
}

const PeriodBucket* GeneratorContext::current_bucket() const {
    return find_bucket(buckets, current_key);
}

const PeriodBucket* GeneratorContext::previous_bucket() const {
    return find_bucket(buckets, previous_key);
}

double GeneratorContext::resolve(const Transaction& tx) const {
    return resolve_amount(tx, base_currency, converter, logger);
}

double GeneratorContext::series_monthly(const RecurringSeries& series) const {
    return monthly_equivalent(series, base_currency, converter, logger);
}

double GeneratorContext::balance_for(const std::string& account_id) const {
    auto it = balances.find(account_id);
    return it != balances.end() ? it->second : 0.0;
}

double GeneratorContext::total_balance() const {
    double total = 0.0;
    for (const auto& account : accounts) {
        double balance = balance_for(account.id);
        if (account.currency.empty() || account.currency == base_currency) {
            total += balance;
            continue;
        }
        if (auto converted = converter.convert(balance, account.currency, base_currency)) {
            total += *converted;
        } else {
            if (logger) {
                logger->log_conversion_fallback("account " + account.id, balance,
                                                account.currency, base_currency);
            }
            total += balance;
        }
    }
    return total;
}

const Category* GeneratorContext::find_category(const std::string& name) const {
    for (const auto& category : categories) {
        if (category.name == name) {
            return &category;
        }
    }
    return nullptr;
}

bool GeneratorContext::is_income_category(const std::string& name) const {
    const Category* category = find_category(name);
    return category != nullptr && category->type == CategoryType::Income;
}

std::vector<const RecurringSeries*> GeneratorContext::active_series() const {
    std::vector<const RecurringSeries*> active;
    for (const auto& series : recurring) {
        if (series.is_active) {
            active.push_back(&series);
        }
    }
    return active;
}

double GeneratorContext::recurring_expense_monthly() const {
    double total = 0.0;
    for (const RecurringSeries* series : active_series()) {
        if (!is_income_category(series->category)) {
            total += series_monthly(*series);
        }
    }
    return total;
}

double GeneratorContext::monthly_recurring_net() const {
    double total = 0.0;
    for (const RecurringSeries* series : active_series()) {
        double monthly = series_monthly(*series);
        total += is_income_category(series->category) ? monthly : -monthly;
    }
    return total;
}

std::vector<MonthlyAggregate> GeneratorContext::last_months(int count, Timestamp anchor) const {
    if (count <= 0) {
        return {};
    }
    Timestamp anchor_month = start_of_month(anchor);
    return monthly_aggregates(add_months(anchor_month, -(count - 1)), add_months(anchor_month, 1));
}

std::vector<MonthlyAggregate> GeneratorContext::monthly_aggregates(Timestamp from, Timestamp to) const {
    if (!aggregates) {
        return {};
    }
    return aggregates->fetch_monthly_aggregates(from, to, base_currency);
}

std::vector<CategoryAggregate> GeneratorContext::category_aggregates(Timestamp from, Timestamp to) const {
    if (!aggregates) {
        return {};
    }
    return aggregates->fetch_category_aggregates(from, to, base_currency);
}

} // namespace finsight
