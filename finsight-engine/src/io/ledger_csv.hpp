#ifndef FINSIGHT_LEDGER_CSV_HPP
#define FINSIGHT_LEDGER_CSV_HPP

#include "../currency.hpp"
#include "../ledger.hpp"
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace finsight {
namespace io {

/**
 * @brief Exception thrown when a ledger CSV row cannot be parsed
 *
 * The message carries the source name and line, e.g.
 * "transactions.csv:14: invalid amount 'abc'".
 */
class LedgerParseError : public std::runtime_error {
public:
    LedgerParseError(const std::string& source, size_t line, const std::string& message);

    const std::string& source() const { return source_; }
    size_t line() const { return line_; }

private:
    std::string source_;
    size_t line_;
};

/**
 * Ledger CSV loaders. Columns are matched by header name, so their order is
 * free and unknown columns are ignored. Blank lines are skipped.
 *
 * transactions: id, date, type, amount, currency, category, account_id
 *               [, subcategory, converted_amount, target_account_id, description]
 * accounts:     id, name, currency [, initial_balance]
 * categories:   name, type [, id, budget_amount, budget_period, budget_reset_day, color]
 * recurring:    id, amount, currency, frequency, category, start_date
 *               [, description, kind, is_active]
 * rates:        from, to, rate
 *
 * @throws LedgerParseError for missing columns or malformed values
 */
std::vector<Transaction> load_transactions_csv(std::istream& is, const std::string& source = "<stream>");
std::vector<Account> load_accounts_csv(std::istream& is, const std::string& source = "<stream>");
std::vector<Category> load_categories_csv(std::istream& is, const std::string& source = "<stream>");
std::vector<RecurringSeries> load_recurring_csv(std::istream& is, const std::string& source = "<stream>");
size_t load_rates_csv(std::istream& is, RateTableConverter& converter, const std::string& source = "<stream>");

// File variants; @throws std::runtime_error if the file cannot be opened
std::vector<Transaction> load_transactions_csv(const std::string& filepath);
std::vector<Account> load_accounts_csv(const std::string& filepath);
std::vector<Category> load_categories_csv(const std::string& filepath);
std::vector<RecurringSeries> load_recurring_csv(const std::string& filepath);
size_t load_rates_csv(const std::string& filepath, RateTableConverter& converter);

// Transactions from CSV or, for *.parquet paths, from Parquet
std::vector<Transaction> load_transactions(const std::string& filepath);

} // namespace io
} // namespace finsight

#endif // FINSIGHT_LEDGER_CSV_HPP
