#ifndef FINSIGHT_CURRENCY_HPP
#define FINSIGHT_CURRENCY_HPP

#include "data_sources.hpp"
#include "ledger.hpp"
#include "logger.hpp"
#include <map>
#include <string>
#include <utility>

namespace finsight {

/**
 * Converter backed by a table of exchange rates.
 *
 * A rate r for (from, to) means 1 unit of `from` buys r units of `to`.
 * Lookups try the direct rate, then the inverse of the opposite rate, then a
 * single hop through any currency that has rates to both sides.
 */
class RateTableConverter : public CurrencyConverter {
public:
    RateTableConverter() = default;

    // @throws std::invalid_argument if rate is not positive
    void add_rate(const std::string& from, const std::string& to, double rate);

    std::optional<double> rate(const std::string& from, const std::string& to) const;

    std::optional<double> convert(double amount,
                                  const std::string& from,
                                  const std::string& to) const override;

    size_t rate_count() const { return rates_.size(); }

private:
    std::map<std::pair<std::string, std::string>, double> rates_;

    std::optional<double> direct_rate(const std::string& from, const std::string& to) const;
};

// Letters and digits only, e.g. "USD" or "XAU"; cache keys rely on it
bool is_valid_currency_code(const std::string& code);

/**
 * Amount of a transaction in the base currency:
 * the raw amount when the currencies match, else the stored converted amount,
 * else the converter, else the raw amount (logged as a conversion fallback).
 */
double resolve_amount(const Transaction& tx,
                      const std::string& base_currency,
                      const CurrencyConverter& converter,
                      Logger* logger = nullptr);

// Normalizes a recurring amount to one month: daily x30, weekly x4.33, yearly /12
double monthly_equivalent(double amount, RecurringFrequency frequency);

// Monthly equivalent in the base currency; falls back to the unconverted value
// with a logged warning when no rate exists
double monthly_equivalent(const RecurringSeries& series,
                          const std::string& base_currency,
                          const CurrencyConverter& converter,
                          Logger* logger = nullptr);

} // namespace finsight

#endif // FINSIGHT_CURRENCY_HPP
