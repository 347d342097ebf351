#include "parquet_reader.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

namespace finsight {

#ifdef HAVE_ARROW

namespace {

std::shared_ptr<arrow::Array> column(const std::shared_ptr<arrow::Table>& table, const std::string& name) {
    auto chunked = table->GetColumnByName(name);
    if (!chunked) {
        return nullptr;
    }
    return chunked->chunk(0);
}

std::string string_at(const std::shared_ptr<arrow::Array>& array, int64_t row) {
    if (!array || array->IsNull(row)) {
        return "";
    }
    if (array->type_id() != arrow::Type::STRING) {
        throw std::runtime_error("Parquet text column has type " + array->type()->ToString() + ", expected string");
    }
    return std::static_pointer_cast<arrow::StringArray>(array)->GetString(row);
}

Timestamp date_at(const std::shared_ptr<arrow::Array>& array, int64_t row, const std::string& filepath) {
    switch (array->type_id()) {
        case arrow::Type::DATE32:
            return add_days(from_epoch_seconds(0),
                            std::static_pointer_cast<arrow::Date32Array>(array)->Value(row));
        case arrow::Type::TIMESTAMP: {
            auto type = std::static_pointer_cast<arrow::TimestampType>(array->type());
            int64_t value = std::static_pointer_cast<arrow::TimestampArray>(array)->Value(row);
            switch (type->unit()) {
                case arrow::TimeUnit::SECOND: return from_epoch_seconds(value);
                case arrow::TimeUnit::MILLI: return from_epoch_seconds(value / 1000);
                case arrow::TimeUnit::MICRO: return from_epoch_seconds(value / 1000000);
                case arrow::TimeUnit::NANO: return from_epoch_seconds(value / 1000000000);
            }
            break;
        }
        case arrow::Type::STRING: {
            std::string text = std::static_pointer_cast<arrow::StringArray>(array)->GetString(row);
            auto parsed = parse_date(text);
            if (!parsed) {
                throw std::runtime_error("Invalid date '" + text + "' in Parquet file: " + filepath);
            }
            return *parsed;
        }
        default:
            break;
    }
    throw std::runtime_error("Unsupported date column type in Parquet file: " + filepath);
}

} // anonymous namespace

std::vector<Transaction> ParquetReader::load_transactions(const std::string& filepath) {
    std::vector<Transaction> transactions;

    // Open Parquet file
    auto opened = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool());
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " + opened.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *opened;

    // Create Parquet reader
    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    // Read entire table into memory
    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    int64_t num_rows = table->num_rows();
    if (num_rows == 0) {
        return transactions;
    }

    // One chunk per column so rows can be addressed directly
    auto combined = table->CombineChunks(arrow::default_memory_pool());
    if (!combined.ok()) {
        throw std::runtime_error("Cannot combine Parquet chunks: " + combined.status().ToString());
    }
    table = *combined;

    // Validate schema
    auto id_column = column(table, "id");
    auto date_column = column(table, "date");
    auto type_column = column(table, "type");
    auto amount_column = column(table, "amount");
    auto currency_column = column(table, "currency");
    auto account_column = column(table, "account_id");

    if (!id_column || !date_column || !type_column || !amount_column || !currency_column || !account_column) {
        throw std::runtime_error("Parquet file missing required columns. Expected: id, date, type, amount, currency, account_id");
    }
    if (amount_column->type_id() != arrow::Type::DOUBLE) {
        throw std::runtime_error("Parquet column 'amount' must be float64");
    }

    auto category_column = column(table, "category");
    auto subcategory_column = column(table, "subcategory");
    auto target_column = column(table, "target_account_id");
    auto description_column = column(table, "description");
    auto converted_column = column(table, "converted_amount");
    auto amounts = std::static_pointer_cast<arrow::DoubleArray>(amount_column);
    auto converted = converted_column && converted_column->type_id() == arrow::Type::DOUBLE
        ? std::static_pointer_cast<arrow::DoubleArray>(converted_column)
        : nullptr;

    transactions.reserve(static_cast<size_t>(num_rows));

    for (int64_t i = 0; i < num_rows; ++i) {
        Transaction tx;
        tx.id = string_at(id_column, i);
        tx.date = date_at(date_column, i, filepath);
        try {
            tx.type = transaction_type_from_string(string_at(type_column, i));
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(std::string(e.what()) + " (row " + std::to_string(i) + " of " + filepath + ")");
        }
        tx.amount = amounts->Value(i);
        tx.currency = string_at(currency_column, i);
        tx.account_id = string_at(account_column, i);
        tx.category = string_at(category_column, i);
        tx.subcategory = string_at(subcategory_column, i);
        tx.target_account_id = string_at(target_column, i);
        tx.description = string_at(description_column, i);
        if (converted && !converted->IsNull(i)) {
            tx.converted_amount = converted->Value(i);
        }

        transactions.push_back(std::move(tx));
    }

    return transactions;
}

bool ParquetReader::available() {
    return true;
}

#else // !HAVE_ARROW

std::vector<Transaction> ParquetReader::load_transactions(const std::string& filepath) {
    (void)filepath;  // Suppress unused parameter warning
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

bool ParquetReader::available() {
    return false;
}

#endif // HAVE_ARROW

} // namespace finsight
