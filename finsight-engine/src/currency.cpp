#include "currency.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace finsight {

bool is_valid_currency_code(const std::string& code) {
    return !code.empty() && std::all_of(code.begin(), code.end(), [](unsigned char c) {
        return std::isalnum(c) != 0;
    });
}

void RateTableConverter::add_rate(const std::string& from, const std::string& to, double rate) {
    if (!(rate > 0.0)) {
        throw std::invalid_argument("Exchange rate must be positive: " + from + "->" + to);
    }
    rates_[{from, to}] = rate;
}

std::optional<double> RateTableConverter::direct_rate(const std::string& from, const std::string& to) const {
    if (from == to) {
        return 1.0;
    }
    auto it = rates_.find({from, to});
    if (it != rates_.end()) {
        return it->second;
    }
    auto inverse = rates_.find({to, from});
    if (inverse != rates_.end()) {
        return 1.0 / inverse->second;
    }
    return std::nullopt;
}

std::optional<double> RateTableConverter::rate(const std::string& from, const std::string& to) const {
    if (auto direct = direct_rate(from, to)) {
        return direct;
    }

    // One hop through a pivot currency
    for (const auto& [pair, value] : rates_) {
        for (const std::string& pivot : {pair.first, pair.second}) {
            if (pivot == from || pivot == to) {
                continue;
            }
            auto first_leg = direct_rate(from, pivot);
            auto second_leg = direct_rate(pivot, to);
            if (first_leg && second_leg) {
                return *first_leg * *second_leg;
            }
        }
    }
    return std::nullopt;
}

std::optional<double> RateTableConverter::convert(double amount,
                                                  const std::string& from,
                                                  const std::string& to) const {
    auto r = rate(from, to);
    if (!r) {
        return std::nullopt;
    }
    return amount * *r;
}

double resolve_amount(const Transaction& tx,
                      const std::string& base_currency,
                      const CurrencyConverter& converter,
                      Logger* logger) {
    if (tx.currency == base_currency) {
        return tx.amount;
    }
    if (tx.converted_amount) {
        return *tx.converted_amount;
    }
    if (auto converted = converter.convert(tx.amount, tx.currency, base_currency)) {
        return *converted;
    }
    if (logger) {
        logger->log_conversion_fallback("transaction " + tx.id, tx.amount, tx.currency, base_currency);
    }
    return tx.amount;
}

double monthly_equivalent(double amount, RecurringFrequency frequency) {
    switch (frequency) {
        case RecurringFrequency::Daily: return amount * 30.0;
        case RecurringFrequency::Weekly: return amount * 4.33;
        case RecurringFrequency::Monthly: return amount;
        case RecurringFrequency::Yearly: return amount / 12.0;
    }
    return amount;
}

double monthly_equivalent(const RecurringSeries& series,
                          const std::string& base_currency,
                          const CurrencyConverter& converter,
                          Logger* logger) {
    double monthly = monthly_equivalent(series.amount, series.frequency);
    if (series.currency == base_currency || series.currency.empty()) {
        return monthly;
    }
    if (auto converted = converter.convert(monthly, series.currency, base_currency)) {
        return *converted;
    }
    if (logger) {
        logger->log_conversion_fallback("recurring " + series.id, monthly, series.currency, base_currency);
    }
    return monthly;
}

} // namespace finsight
