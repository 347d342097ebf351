#ifndef FINSIGHT_LEDGER_HPP
#define FINSIGHT_LEDGER_HPP

#include "calendar.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finsight {

enum class TransactionType {
    Income,
    Expense,
    Transfer     // moves money between accounts, never counted as income or expense
};

enum class CategoryType {
    Income,
    Expense
};

enum class BudgetPeriod {
    Weekly,
    Monthly,
    Yearly
};

enum class RecurringFrequency {
    Daily,
    Weekly,
    Monthly,
    Yearly
};

enum class RecurringKind {
    Generic,
    Subscription
};

std::string to_string(TransactionType type);
std::string to_string(CategoryType type);
std::string to_string(BudgetPeriod period);
std::string to_string(RecurringFrequency frequency);
std::string to_string(RecurringKind kind);

// @throws std::invalid_argument for unknown names
TransactionType transaction_type_from_string(const std::string& text);
CategoryType category_type_from_string(const std::string& text);
BudgetPeriod budget_period_from_string(const std::string& text);
RecurringFrequency recurring_frequency_from_string(const std::string& text);
RecurringKind recurring_kind_from_string(const std::string& text);

/**
 * Single ledger entry. Amounts are always positive; the type gives the sign.
 */
struct Transaction {
    std::string id;
    Timestamp date;
    double amount;
    std::string currency;
    std::optional<double> converted_amount;   // amount in the account's currency, if it differs
    TransactionType type;
    std::string category;
    std::string subcategory;
    std::string account_id;
    std::string target_account_id;            // transfers only
    std::string description;

    Transaction();

    bool is_income() const { return type == TransactionType::Income; }
    bool is_expense() const { return type == TransactionType::Expense; }
};

struct Category {
    std::string id;
    std::string name;
    CategoryType type;
    std::optional<double> budget_amount;
    BudgetPeriod budget_period;
    unsigned budget_reset_day;   // 1..31, monthly budgets only
    std::string color;

    Category();

    bool has_budget() const { return budget_amount.has_value() && *budget_amount > 0.0; }
};

struct Account {
    std::string id;
    std::string name;
    std::string currency;
    double initial_balance;

    Account();
};

struct RecurringSeries {
    std::string id;
    std::string description;
    double amount;
    std::string currency;
    RecurringFrequency frequency;
    RecurringKind kind;
    std::string category;
    Timestamp start_date;
    bool is_active;

    RecurringSeries();
};

/**
 * Read-only access to the transaction store
 */
class LedgerSource {
public:
    virtual ~LedgerSource() = default;

    virtual const std::vector<Transaction>& transactions() const = 0;
    virtual const std::vector<Account>& accounts() const = 0;
    virtual const std::vector<Category>& categories() const = 0;
    virtual const std::vector<RecurringSeries>& recurring_series() const = 0;
};

/**
 * Ledger snapshot held in memory
 */
class InMemoryLedger : public LedgerSource {
public:
    InMemoryLedger() = default;
    InMemoryLedger(std::vector<Transaction> transactions,
                   std::vector<Account> accounts,
                   std::vector<Category> categories,
                   std::vector<RecurringSeries> recurring);

    const std::vector<Transaction>& transactions() const override { return transactions_; }
    const std::vector<Account>& accounts() const override { return accounts_; }
    const std::vector<Category>& categories() const override { return categories_; }
    const std::vector<RecurringSeries>& recurring_series() const override { return recurring_; }

    void add_transaction(Transaction transaction);
    void add_account(Account account);
    void add_category(Category category);
    void add_recurring(RecurringSeries series);

private:
    std::vector<Transaction> transactions_;
    std::vector<Account> accounts_;
    std::vector<Category> categories_;
    std::vector<RecurringSeries> recurring_;
};

// Current balance of each account in its own currency: initial balance plus
// income minus expenses, with transfers moved between source and target.
// Transactions dated after today are not applied yet.
std::map<std::string, double> compute_account_balances(const std::vector<Account>& accounts,
                                                       const std::vector<Transaction>& transactions,
                                                       Timestamp now);

} // namespace finsight

#endif // FINSIGHT_LEDGER_HPP
