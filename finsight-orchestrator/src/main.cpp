#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include "aggregate_store.hpp"
#include "calendar.hpp"
#include "currency.hpp"
#include "granularity.hpp"
#include "ledger.hpp"
#include "logger.hpp"
#include "time_filter.hpp"
#include "io/json_writer.hpp"
#include "io/ledger_csv.hpp"
#include "config_parser.hpp"
#include "insights_orchestrator.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string transactions_path;
    std::string accounts_path;
    std::string categories_path;
    std::string recurring_path;
    std::string rates_path;
    std::string granularity;     // "week" ... "allTime", or "all"
    std::string preset;          // time filter preset; takes precedence over granularity
    std::string from_date;       // custom preset only
    std::string to_date;
    std::string currency;
    std::string output_path;
    bool pretty = true;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Finsight Insights Engine v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Data input options:\n";
    std::cerr << "  --config <path>             JSON engine configuration\n";
    std::cerr << "  --transactions <path>       CSV or Parquet file with transactions\n";
    std::cerr << "  --accounts <path>           CSV file with accounts\n";
    std::cerr << "  --categories <path>         CSV file with categories and budgets\n";
    std::cerr << "  --recurring <path>          CSV file with recurring series\n";
    std::cerr << "  --rates <path>              CSV file with exchange rates (from,to,rate)\n\n";
    std::cerr << "Selection options:\n";
    std::cerr << "  --granularity <g>           week|month|quarter|year|allTime|all (default: config)\n";
    std::cerr << "  --preset <name>             today|yesterday|thisWeek|last30Days|thisMonth|lastMonth|\n";
    std::cerr << "                              thisYear|lastYear|allTime|custom\n";
    std::cerr << "  --from <YYYY-MM-DD>         Start of a custom range (inclusive)\n";
    std::cerr << "  --to <YYYY-MM-DD>           End of a custom range (exclusive)\n";
    std::cerr << "  --currency <code>           Base currency (default: config or USD)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Single-line JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Monthly insights from CSV files:\n";
    std::cerr << "     " << program_name << " --transactions data/transactions.csv \\\n";
    std::cerr << "         --accounts data/accounts.csv --categories data/categories.csv \\\n";
    std::cerr << "         --granularity month --currency EUR --output insights.json\n\n";
    std::cerr << "  2. Last month's insights using a configuration file:\n";
    std::cerr << "     " << program_name << " --config finsight.json --preset lastMonth\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--transactions" && i + 1 < argc) {
            args.transactions_path = argv[++i];
        } else if (arg == "--accounts" && i + 1 < argc) {
            args.accounts_path = argv[++i];
        } else if (arg == "--categories" && i + 1 < argc) {
            args.categories_path = argv[++i];
        } else if (arg == "--recurring" && i + 1 < argc) {
            args.recurring_path = argv[++i];
        } else if (arg == "--rates" && i + 1 < argc) {
            args.rates_path = argv[++i];
        } else if (arg == "--granularity" && i + 1 < argc) {
            args.granularity = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            args.preset = argv[++i];
        } else if (arg == "--from" && i + 1 < argc) {
            args.from_date = argv[++i];
        } else if (arg == "--to" && i + 1 < argc) {
            args.to_date = argv[++i];
        } else if (arg == "--currency" && i + 1 < argc) {
            args.currency = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--compact") {
            args.pretty = false;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// Command line values override the configuration file
void apply_overrides(const CLIArgs& args, finsight::EngineConfig& config) {
    if (!args.transactions_path.empty()) config.data.transactions = args.transactions_path;
    if (!args.accounts_path.empty()) config.data.accounts = args.accounts_path;
    if (!args.categories_path.empty()) config.data.categories = args.categories_path;
    if (!args.recurring_path.empty()) config.data.recurring = args.recurring_path;
    if (!args.rates_path.empty()) config.data.rates = args.rates_path;
    if (!args.currency.empty()) config.base_currency = args.currency;

    if (args.granularity == "all") {
        config.granularities = finsight::all_granularities();
    } else if (!args.granularity.empty()) {
        config.granularities = {finsight::granularity_from_string(args.granularity)};
    }
}

finsight::TimeFilter build_time_filter(const CLIArgs& args, finsight::Timestamp now) {
    finsight::TimeFilterPreset preset = finsight::time_filter_preset_from_string(args.preset);
    if (preset != finsight::TimeFilterPreset::Custom) {
        return finsight::TimeFilter::from_preset(preset, now);
    }

    auto from = finsight::parse_date(args.from_date);
    auto to = finsight::parse_date(args.to_date);
    if (!from || !to) {
        throw std::invalid_argument("--preset custom needs --from and --to as YYYY-MM-DD");
    }
    return finsight::TimeFilter::custom(*from, *to);
}

finsight::InMemoryLedger load_ledger(const finsight::DataPaths& data) {
    finsight::InMemoryLedger ledger(
        finsight::io::load_transactions(data.transactions),
        data.accounts.empty() ? std::vector<finsight::Account>() : finsight::io::load_accounts_csv(data.accounts),
        data.categories.empty() ? std::vector<finsight::Category>() : finsight::io::load_categories_csv(data.categories),
        data.recurring.empty() ? std::vector<finsight::RecurringSeries>() : finsight::io::load_recurring_csv(data.recurring)
    );
    return ledger;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        finsight::EngineConfig config;
        if (!args.config_path.empty()) {
            config = finsight::parse_engine_config_from_file(args.config_path);
        }
        apply_overrides(args, config);

        if (config.data.transactions.empty()) {
            std::cerr << "Error: --transactions is required (or data.transactions in --config)\n";
            std::cerr << "\nUse --help for usage information.\n";
            return 1;
        }

        finsight::Logger logger(config.logging);

        // Load inputs
        std::cerr << "Loading ledger from " << config.data.transactions << "..." << std::flush;
        finsight::InMemoryLedger ledger = load_ledger(config.data);
        std::cerr << " loaded " << ledger.transactions().size() << " transactions, "
                  << ledger.accounts().size() << " accounts, "
                  << ledger.categories().size() << " categories, "
                  << ledger.recurring_series().size() << " recurring series\n";

        finsight::RateTableConverter rates;
        if (!config.data.rates.empty()) {
            size_t loaded = finsight::io::load_rates_csv(config.data.rates, rates);
            std::cerr << "Loaded " << loaded << " exchange rates\n";
        }

        // Precompute aggregates for the base currency
        finsight::Timestamp now = finsight::Clock::now();
        finsight::InMemoryAggregateStore aggregates;
        aggregates.rebuild(ledger.transactions(), config.base_currency, rates, now, &logger);

        finsight::InsightsOrchestrator orchestrator(ledger, rates, &aggregates, config.cache, &logger,
                                                    [now] { return now; });

        json report;
        report["base_currency"] = config.base_currency;
        report["generated_at"] = finsight::format_date(now);

        if (!args.preset.empty()) {
            finsight::TimeFilter filter = build_time_filter(args, now);
            std::vector<finsight::Insight> insights = orchestrator.generate_all_insights(filter, config.base_currency);

            report["time_filter"] = {
                {"preset", finsight::to_string(filter.preset)},
                {"start", finsight::format_date(filter.start)},
                {"end", finsight::format_date(filter.end)}
            };
            report["insights"] = finsight::io::insights_to_json(insights);
            std::cerr << "Generated " << insights.size() << " insights for "
                      << filter.display_name() << "\n";
        } else {
            std::optional<finsight::Timestamp> first_date =
                finsight::first_transaction_date(ledger.transactions());

            json granularities = json::object();
            for (finsight::Granularity granularity : config.granularities) {
                finsight::GranularityResult result =
                    orchestrator.generate_all_insights(granularity, config.base_currency, first_date);
                granularities[finsight::to_string(granularity)] = {
                    {"buckets", finsight::io::buckets_to_json(result.buckets)},
                    {"insights", finsight::io::insights_to_json(result.insights)}
                };
                std::cerr << "Generated " << result.insights.size() << " insights over "
                          << result.buckets.size() << " " << finsight::to_string(granularity)
                          << " buckets\n";
            }
            report["granularities"] = granularities;
        }

        // Write output
        if (!args.output_path.empty()) {
            finsight::io::write_json(args.output_path, report, args.pretty);
            std::cerr << "Results written to " << args.output_path << "\n";
        } else {
            finsight::io::write_json(std::cout, report, args.pretty);
        }
        logger.flush();

    } catch (const finsight::ConfigParseError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    } catch (const finsight::io::LedgerParseError& e) {
        std::cerr << "Ledger error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
