#ifndef FINSIGHT_CONFIG_PARSER_HPP
#define FINSIGHT_CONFIG_PARSER_HPP

#include "insights_orchestrator.hpp"
#include "granularity.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace finsight {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Input files of a run (empty = not provided)
 */
struct DataPaths {
    std::string transactions;   ///< CSV or Parquet
    std::string accounts;
    std::string categories;
    std::string recurring;
    std::string rates;
};

/**
 * @brief Engine configuration
 *
 * Example:
 *   @code
 *   {
 *     "base_currency": "EUR",
 *     "cache": { "capacity": 20, "ttl_seconds": 300 },
 *     "logging": { "level": "INFO", "json": true, "console": true, "file": "finsight.log" },
 *     "granularities": ["week", "month", "year"],
 *     "data": { "transactions": "${DATA_DIR}/transactions.csv", "accounts": "accounts.csv" }
 *   }
 *   @endcode
 */
struct EngineConfig {
    std::string base_currency;
    OrchestratorConfig cache;
    LoggerConfig logging;
    std::vector<Granularity> granularities;
    DataPaths data;

    EngineConfig()
        : base_currency("USD"),
          granularities(all_granularities()) {}
};

/**
 * @brief Parses an engine configuration from a JSON file
 *
 * Relative data and log file paths are resolved against the directory of the
 * configuration file.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration
 * @throws ConfigParseError if the file cannot be read or the content is invalid
 */
EngineConfig parse_engine_config_from_file(const std::string& file_path);

/**
 * @brief Parses an engine configuration from a JSON string
 *
 * Every field is optional; missing fields keep their defaults.
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigParseError if the JSON is invalid or a value is out of range
 */
EngineConfig parse_engine_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace finsight

#endif // FINSIGHT_CONFIG_PARSER_HPP
