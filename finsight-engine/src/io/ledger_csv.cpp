#include "ledger_csv.hpp"
#include "csv_reader.hpp"
#include "parquet_reader.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <map>
#include <optional>

namespace finsight {
namespace io {

LedgerParseError::LedgerParseError(const std::string& source, size_t line, const std::string& message)
    : std::runtime_error(source + ":" + std::to_string(line) + ": " + message)
    , source_(source)
    , line_(line)
{}

namespace {

// One data row with its cells addressed by header name
class Row {
public:
    Row(const std::map<std::string, size_t>& columns,
        std::vector<std::string> cells,
        const std::string& source,
        size_t line)
        : columns_(columns), cells_(std::move(cells)), source_(source), line_(line) {}

    std::string get(const std::string& column) const {
        auto it = columns_.find(column);
        if (it == columns_.end() || it->second >= cells_.size()) {
            return "";
        }
        return cells_[it->second];
    }

    std::string required(const std::string& column) const {
        std::string value = get(column);
        if (value.empty()) {
            fail("missing value for '" + column + "'");
        }
        return value;
    }

    double number(const std::string& column) const {
        return parse_number(column, required(column));
    }

    std::optional<double> optional_number(const std::string& column) const {
        std::string value = get(column);
        if (value.empty()) {
            return std::nullopt;
        }
        return parse_number(column, value);
    }

    Timestamp date(const std::string& column) const {
        std::string value = required(column);
        std::optional<Timestamp> parsed = parse_date(value);
        if (!parsed) {
            fail("invalid date '" + value + "' for '" + column + "'");
        }
        return *parsed;
    }

    bool flag(const std::string& column, bool fallback) const {
        std::string value = get(column);
        if (value.empty()) return fallback;
        if (value == "true" || value == "1" || value == "yes") return true;
        if (value == "false" || value == "0" || value == "no") return false;
        fail("invalid boolean '" + value + "' for '" + column + "'");
        return fallback;
    }

    // Runs an enum parser and rethrows its invalid_argument with the row position
    template <typename Parse>
    auto parse_enum(const std::string& column, const std::string& value, Parse parse) const
        -> decltype(parse(value)) {
        try {
            return parse(value);
        } catch (const std::invalid_argument& e) {
            fail(e.what());
        }
    }

    [[noreturn]] void fail(const std::string& message) const {
        throw LedgerParseError(source_, line_, message);
    }

private:
    const std::map<std::string, size_t>& columns_;
    std::vector<std::string> cells_;
    const std::string& source_;
    size_t line_;

    double parse_number(const std::string& column, const std::string& value) const {
        char* end = nullptr;
        double result = std::strtod(value.c_str(), &end);
        if (end == value.c_str() || *end != '\0' || !std::isfinite(result)) {
            fail("invalid number '" + value + "' for '" + column + "'");
        }
        return result;
    }
};

// Reads the header, checks the required columns, then calls handle(row)
// for every non-blank data row
template <typename Handler>
void for_each_row(std::istream& is,
                  const std::string& source,
                  const std::vector<std::string>& required_columns,
                  Handler handle) {
    CsvReader reader(is);

    auto header = reader.read_row();
    if (header.empty()) {
        return;
    }

    std::map<std::string, size_t> columns;
    for (size_t i = 0; i < header.size(); ++i) {
        columns[header[i]] = i;
    }
    for (const auto& column : required_columns) {
        if (columns.find(column) == columns.end()) {
            throw LedgerParseError(source, reader.line_number(), "missing column '" + column + "'");
        }
    }

    while (reader.has_more()) {
        auto cells = reader.read_row();
        if (cells.empty() || (cells.size() == 1 && cells[0].empty())) {
            continue;
        }
        handle(Row(columns, std::move(cells), source, reader.line_number()));
    }
}

std::ifstream open_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }
    return file;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) return false;
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

} // anonymous namespace

// ============================================================================
// Stream loaders
// ============================================================================

std::vector<Transaction> load_transactions_csv(std::istream& is, const std::string& source) {
    std::vector<Transaction> transactions;

    for_each_row(is, source, {"id", "date", "type", "amount", "currency", "category", "account_id"},
                 [&](const Row& row) {
        Transaction tx;
        tx.id = row.required("id");
        tx.date = row.date("date");
        tx.type = row.parse_enum("type", row.required("type"), transaction_type_from_string);
        tx.amount = row.number("amount");
        if (tx.amount < 0.0) {
            row.fail("amount must not be negative");
        }
        tx.currency = row.required("currency");
        tx.category = row.get("category");
        tx.subcategory = row.get("subcategory");
        tx.account_id = row.required("account_id");
        tx.target_account_id = row.get("target_account_id");
        tx.converted_amount = row.optional_number("converted_amount");
        tx.description = row.get("description");

        if (tx.type == TransactionType::Transfer && tx.target_account_id.empty()) {
            row.fail("transfer '" + tx.id + "' has no target_account_id");
        }
        transactions.push_back(std::move(tx));
    });

    return transactions;
}

std::vector<Account> load_accounts_csv(std::istream& is, const std::string& source) {
    std::vector<Account> accounts;

    for_each_row(is, source, {"id", "name", "currency"}, [&](const Row& row) {
        Account account;
        account.id = row.required("id");
        account.name = row.required("name");
        account.currency = row.required("currency");
        account.initial_balance = row.optional_number("initial_balance").value_or(0.0);
        accounts.push_back(std::move(account));
    });

    return accounts;
}

std::vector<Category> load_categories_csv(std::istream& is, const std::string& source) {
    std::vector<Category> categories;

    for_each_row(is, source, {"name", "type"}, [&](const Row& row) {
        Category category;
        category.name = row.required("name");
        category.id = row.get("id").empty() ? category.name : row.get("id");
        category.type = row.parse_enum("type", row.required("type"), category_type_from_string);
        category.budget_amount = row.optional_number("budget_amount");

        std::string period = row.get("budget_period");
        if (!period.empty()) {
            category.budget_period = row.parse_enum("budget_period", period, budget_period_from_string);
        }

        std::optional<double> reset_day = row.optional_number("budget_reset_day");
        if (reset_day) {
            if (*reset_day < 1.0 || *reset_day > 31.0) {
                row.fail("budget_reset_day must be between 1 and 31");
            }
            category.budget_reset_day = static_cast<unsigned>(*reset_day);
        }

        std::string color = row.get("color");
        if (!color.empty()) {
            category.color = color;
        }
        categories.push_back(std::move(category));
    });

    return categories;
}

std::vector<RecurringSeries> load_recurring_csv(std::istream& is, const std::string& source) {
    std::vector<RecurringSeries> series;

    for_each_row(is, source, {"id", "amount", "currency", "frequency", "category", "start_date"},
                 [&](const Row& row) {
        RecurringSeries s;
        s.id = row.required("id");
        s.description = row.get("description");
        s.amount = row.number("amount");
        s.currency = row.required("currency");
        s.frequency = row.parse_enum("frequency", row.required("frequency"), recurring_frequency_from_string);
        s.kind = row.parse_enum("kind", row.get("kind"), recurring_kind_from_string);
        s.category = row.required("category");
        s.start_date = row.date("start_date");
        s.is_active = row.flag("is_active", true);
        series.push_back(std::move(s));
    });

    return series;
}

size_t load_rates_csv(std::istream& is, RateTableConverter& converter, const std::string& source) {
    size_t loaded = 0;

    for_each_row(is, source, {"from", "to", "rate"}, [&](const Row& row) {
        double rate = row.number("rate");
        if (rate <= 0.0) {
            row.fail("rate must be positive");
        }
        converter.add_rate(row.required("from"), row.required("to"), rate);
        loaded++;
    });

    return loaded;
}

// ============================================================================
// File loaders
// ============================================================================

std::vector<Transaction> load_transactions_csv(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_transactions_csv(file, filepath);
}

std::vector<Account> load_accounts_csv(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_accounts_csv(file, filepath);
}

std::vector<Category> load_categories_csv(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_categories_csv(file, filepath);
}

std::vector<RecurringSeries> load_recurring_csv(const std::string& filepath) {
    std::ifstream file = open_file(filepath);
    return load_recurring_csv(file, filepath);
}

size_t load_rates_csv(const std::string& filepath, RateTableConverter& converter) {
    std::ifstream file = open_file(filepath);
    return load_rates_csv(file, converter, filepath);
}

std::vector<Transaction> load_transactions(const std::string& filepath) {
    if (ends_with(filepath, ".parquet")) {
        return ParquetReader::load_transactions(filepath);
    }
    return load_transactions_csv(filepath);
}

} // namespace io
} // namespace finsight
