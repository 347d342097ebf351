#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "io/ledger_csv.hpp"
#include "io/parquet_reader.hpp"
#include <filesystem>
#include <optional>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

using namespace finsight;
using Catch::Matchers::WithinAbs;

#ifdef HAVE_ARROW

namespace {

std::shared_ptr<arrow::Array> string_array(const std::vector<std::string>& values) {
    arrow::StringBuilder builder;
    REQUIRE(builder.AppendValues(values).ok());
    std::shared_ptr<arrow::Array> array;
    REQUIRE(builder.Finish(&array).ok());
    return array;
}

std::shared_ptr<arrow::Array> date_array(const std::vector<Timestamp>& dates) {
    arrow::Date32Builder builder;
    for (Timestamp date : dates) {
        REQUIRE(builder.Append(static_cast<int32_t>(to_epoch_seconds(date) / 86400)).ok());
    }
    std::shared_ptr<arrow::Array> array;
    REQUIRE(builder.Finish(&array).ok());
    return array;
}

// Nullopt entries become nulls
std::shared_ptr<arrow::Array> double_array(const std::vector<std::optional<double>>& values) {
    arrow::DoubleBuilder builder;
    for (const auto& value : values) {
        REQUIRE((value ? builder.Append(*value) : builder.AppendNull()).ok());
    }
    std::shared_ptr<arrow::Array> array;
    REQUIRE(builder.Finish(&array).ok());
    return array;
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
    auto outfile = arrow::io::FileOutputStream::Open(path);
    REQUIRE(outfile.ok());
    REQUIRE(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile, 1024).ok());
    REQUIRE((*outfile)->Close().ok());
}

} // anonymous namespace

TEST_CASE("Parquet transactions load with every column", "[parquet][io]") {
    REQUIRE(ParquetReader::available());

    auto schema = arrow::schema({
        arrow::field("id", arrow::utf8()),
        arrow::field("date", arrow::date32()),
        arrow::field("type", arrow::utf8()),
        arrow::field("amount", arrow::float64()),
        arrow::field("currency", arrow::utf8()),
        arrow::field("account_id", arrow::utf8()),
        arrow::field("category", arrow::utf8()),
        arrow::field("target_account_id", arrow::utf8()),
        arrow::field("converted_amount", arrow::float64())
    });
    auto table = arrow::Table::Make(schema, {
        string_array({"t1", "t2", "t3"}),
        date_array({make_date(2026, 1, 31), make_date(2026, 2, 14), make_date(2026, 3, 1)}),
        string_array({"income", "expense", "transfer"}),
        double_array({3200.0, 42.5, 400.0}),
        string_array({"USD", "EUR", "USD"}),
        string_array({"checking", "travel", "checking"}),
        string_array({"Salary", "Dining", ""}),
        string_array({"", "", "savings"}),
        double_array({std::nullopt, 46.75, std::nullopt})
    });

    const std::string path = "test_transactions.parquet";
    std::filesystem::remove(path);
    write_table(table, path);

    std::vector<Transaction> txs = ParquetReader::load_transactions(path);
    REQUIRE(txs.size() == 3);

    REQUIRE(txs[0].id == "t1");
    REQUIRE(txs[0].type == TransactionType::Income);
    REQUIRE(txs[0].date == make_date(2026, 1, 31));
    REQUIRE_THAT(txs[0].amount, WithinAbs(3200.0, 1e-9));
    REQUIRE(txs[0].category == "Salary");
    REQUIRE_FALSE(txs[0].converted_amount.has_value());

    REQUIRE(txs[1].currency == "EUR");
    REQUIRE(txs[1].account_id == "travel");
    REQUIRE(txs[1].converted_amount.has_value());
    REQUIRE_THAT(*txs[1].converted_amount, WithinAbs(46.75, 1e-9));

    REQUIRE(txs[2].type == TransactionType::Transfer);
    REQUIRE(txs[2].target_account_id == "savings");
    REQUIRE(txs[2].subcategory.empty());

    SECTION("The generic loader picks Parquet by extension") {
        std::vector<Transaction> loaded = io::load_transactions(path);
        REQUIRE(loaded.size() == 3);
        REQUIRE(loaded[1].id == "t2");
    }

    std::filesystem::remove(path);
}

TEST_CASE("Parquet dates may be text", "[parquet][io]") {
    auto schema = arrow::schema({
        arrow::field("id", arrow::utf8()),
        arrow::field("date", arrow::utf8()),
        arrow::field("type", arrow::utf8()),
        arrow::field("amount", arrow::float64()),
        arrow::field("currency", arrow::utf8()),
        arrow::field("account_id", arrow::utf8())
    });

    const std::string path = "test_text_dates.parquet";
    std::filesystem::remove(path);

    SECTION("Valid dates parse") {
        write_table(arrow::Table::Make(schema, {
            string_array({"t1"}), string_array({"2025-07-12"}), string_array({"expense"}),
            double_array({640.0}), string_array({"USD"}), string_array({"travel"})
        }), path);

        std::vector<Transaction> txs = ParquetReader::load_transactions(path);
        REQUIRE(txs.size() == 1);
        REQUIRE(txs[0].date == make_date(2025, 7, 12));
    }

    SECTION("Bad rows are reported") {
        write_table(arrow::Table::Make(schema, {
            string_array({"t1"}), string_array({"12/07/2025"}), string_array({"expense"}),
            double_array({640.0}), string_array({"USD"}), string_array({"travel"})
        }), path);

        REQUIRE_THROWS_WITH(ParquetReader::load_transactions(path),
                            Catch::Matchers::ContainsSubstring("Invalid date '12/07/2025'"));
    }

    SECTION("Unknown transaction types are reported") {
        write_table(arrow::Table::Make(schema, {
            string_array({"t1"}), string_array({"2025-07-12"}), string_array({"refund"}),
            double_array({640.0}), string_array({"USD"}), string_array({"travel"})
        }), path);

        REQUIRE_THROWS_WITH(ParquetReader::load_transactions(path),
                            Catch::Matchers::ContainsSubstring("row 0"));
    }

    std::filesystem::remove(path);
}

TEST_CASE("Parquet schema and file errors", "[parquet][io]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ParquetReader::load_transactions("nonexistent.parquet"), std::runtime_error);
    }

    SECTION("Missing required column") {
        auto schema = arrow::schema({
            arrow::field("id", arrow::utf8()),
            arrow::field("amount", arrow::float64())
        });
        const std::string path = "test_missing_columns.parquet";
        std::filesystem::remove(path);
        write_table(arrow::Table::Make(schema, {string_array({"t1"}), double_array({1.0})}), path);

        REQUIRE_THROWS_WITH(ParquetReader::load_transactions(path),
                            Catch::Matchers::ContainsSubstring("missing required columns"));
        std::filesystem::remove(path);
    }
}

#else // !HAVE_ARROW

TEST_CASE("Parquet is not available without Arrow", "[parquet]") {
    REQUIRE_FALSE(ParquetReader::available());

    SECTION("The reader throws") {
        REQUIRE_THROWS_AS(ParquetReader::load_transactions("transactions.parquet"), std::runtime_error);
    }

    SECTION("The generic loader throws for Parquet paths") {
        REQUIRE_THROWS_WITH(io::load_transactions("transactions.parquet"),
                            Catch::Matchers::ContainsSubstring("Apache Arrow not available"));
    }
}

#endif // HAVE_ARROW
