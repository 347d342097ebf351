#include "ledger.hpp"
#include <stdexcept>

namespace finsight {

// ============================================================================
// Enum names
// ============================================================================

std::string to_string(TransactionType type) {
    switch (type) {
        case TransactionType::Income: return "income";
        case TransactionType::Expense: return "expense";
        case TransactionType::Transfer: return "transfer";
    }
    return "unknown";
}

std::string to_string(CategoryType type) {
    switch (type) {
        case CategoryType::Income: return "income";
        case CategoryType::Expense: return "expense";
    }
    return "unknown";
}

std::string to_string(BudgetPeriod period) {
    switch (period) {
        case BudgetPeriod::Weekly: return "weekly";
        case BudgetPeriod::Monthly: return "monthly";
        case BudgetPeriod::Yearly: return "yearly";
    }
    return "unknown";
}

std::string to_string(RecurringFrequency frequency) {
    switch (frequency) {
        case RecurringFrequency::Daily: return "daily";
        case RecurringFrequency::Weekly: return "weekly";
        case RecurringFrequency::Monthly: return "monthly";
        case RecurringFrequency::Yearly: return "yearly";
    }
    return "unknown";
}

std::string to_string(RecurringKind kind) {
    switch (kind) {
        case RecurringKind::Generic: return "generic";
        case RecurringKind::Subscription: return "subscription";
    }
    return "unknown";
}

TransactionType transaction_type_from_string(const std::string& text) {
    if (text == "income") return TransactionType::Income;
    if (text == "expense") return TransactionType::Expense;
    if (text == "transfer" || text == "internalTransfer") return TransactionType::Transfer;
    throw std::invalid_argument("Unknown transaction type: " + text);
}

CategoryType category_type_from_string(const std::string& text) {
    if (text == "income") return CategoryType::Income;
    if (text == "expense") return CategoryType::Expense;
    throw std::invalid_argument("Unknown category type: " + text);
}

BudgetPeriod budget_period_from_string(const std::string& text) {
    if (text == "weekly") return BudgetPeriod::Weekly;
    if (text == "monthly") return BudgetPeriod::Monthly;
    if (text == "yearly") return BudgetPeriod::Yearly;
    throw std::invalid_argument("Unknown budget period: " + text);
}

RecurringFrequency recurring_frequency_from_string(const std::string& text) {
    if (text == "daily") return RecurringFrequency::Daily;
    if (text == "weekly") return RecurringFrequency::Weekly;
    if (text == "monthly") return RecurringFrequency::Monthly;
    if (text == "yearly") return RecurringFrequency::Yearly;
    throw std::invalid_argument("Unknown recurring frequency: " + text);
}

RecurringKind recurring_kind_from_string(const std::string& text) {
    if (text.empty() || text == "generic") return RecurringKind::Generic;
    if (text == "subscription") return RecurringKind::Subscription;
    throw std::invalid_argument("Unknown recurring kind: " + text);
}

// ============================================================================
// Records
// ============================================================================

Transaction::Transaction()
    : date(from_epoch_seconds(0))
    , amount(0.0)
    , type(TransactionType::Expense)
{}

Category::Category()
    : type(CategoryType::Expense)
    , budget_period(BudgetPeriod::Monthly)
    , budget_reset_day(1)
    , color("#5856D6")
{}

Account::Account()
    : initial_balance(0.0)
{}

RecurringSeries::RecurringSeries()
    : amount(0.0)
    , frequency(RecurringFrequency::Monthly)
    , kind(RecurringKind::Generic)
    , start_date(from_epoch_seconds(0))
    , is_active(true)
{}

// ============================================================================
// InMemoryLedger
// ============================================================================

InMemoryLedger::InMemoryLedger(std::vector<Transaction> transactions,
                               std::vector<Account> accounts,
                               std::vector<Category> categories,
                               std::vector<RecurringSeries> recurring)
    : transactions_(std::move(transactions))
    , accounts_(std::move(accounts))
    , categories_(std::move(categories))
    , recurring_(std::move(recurring))
{}

void InMemoryLedger::add_transaction(Transaction transaction) {
    transactions_.push_back(std::move(transaction));
}

void InMemoryLedger::add_account(Account account) {
    accounts_.push_back(std::move(account));
}

void InMemoryLedger::add_category(Category category) {
    categories_.push_back(std::move(category));
}

void InMemoryLedger::add_recurring(RecurringSeries series) {
    recurring_.push_back(std::move(series));
}

// ============================================================================
// Balances
// ============================================================================

std::map<std::string, double> compute_account_balances(const std::vector<Account>& accounts,
                                                       const std::vector<Transaction>& transactions,
                                                       Timestamp now) {
    std::map<std::string, double> balances;
    std::map<std::string, std::string> currencies;
    for (const auto& account : accounts) {
        balances[account.id] = account.initial_balance;
        currencies[account.id] = account.currency;
    }

    Timestamp cutoff = add_days(start_of_day(now), 1);

    for (const auto& tx : transactions) {
        if (tx.date >= cutoff) {
            continue;
        }

        auto source = balances.find(tx.account_id);

        switch (tx.type) {
            case TransactionType::Income:
            case TransactionType::Expense: {
                if (source == balances.end()) {
                    break;
                }
                double amount = tx.amount;
                if (tx.currency != currencies[tx.account_id] && tx.converted_amount) {
                    amount = *tx.converted_amount;
                }
                source->second += tx.is_income() ? amount : -amount;
                break;
            }
            case TransactionType::Transfer: {
                // amount is in the source currency, converted_amount in the target's
                if (source != balances.end()) {
                    source->second -= tx.amount;
                }
                auto target = balances.find(tx.target_account_id);
                if (target != balances.end()) {
                    target->second += tx.converted_amount.value_or(tx.amount);
                }
                break;
            }
        }
    }

    return balances;
}

} // namespace finsight
