/**
 * @file logger.hpp
 * @brief Structured logging for the insights engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Domain events (cache lookups, aggregation path, generator runs)
 * - Console (stderr) and file sinks
 *
 * A Logger is an ordinary object built from a LoggerConfig and handed to the
 * components that need it as a `Logger*`. A null pointer means "do not log".
 */

#ifndef FINSIGHT_LOGGER_HPP
#define FINSIGHT_LOGGER_HPP

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace finsight {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (cache keys, bucket counts)
    INFO,    ///< Informational messages (generation start/end)
    WARN,    ///< Warning messages (conversion fallbacks, skipped data)
    ERROR    ///< Error messages (generator failures)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("finsight.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "finsight.log";
 *
 *   Logger logger(config);
 *   logger.log_cache_lookup("granularity_month_USD", false);
 *   logger.log_generation_complete("granularity_month_USD", 12, counts, 3.2);
 *   @endcode
 */
class Logger {
public:
    explicit Logger(const LoggerConfig& config = LoggerConfig());
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Log a result cache lookup
     *
     * @param key Cache key
     * @param hit Whether the key was served from cache
     */
    void log_cache_lookup(const std::string& key, bool hit);

    /**
     * @brief Log a completed pass being stored in the cache
     */
    void log_cache_store(const std::string& key, size_t insight_count);

    /**
     * @brief Log a cache invalidation
     *
     * @param scope "all" or the currency that was invalidated
     * @param removed Number of entries removed
     */
    void log_cache_invalidation(const std::string& scope, size_t removed);

    /**
     * @brief Log which aggregation path produced a bucket sequence
     *
     * @param granularity Granularity name
     * @param path "fast", "slow" or "empty"
     * @param bucket_count Number of buckets produced
     * @param elapsed_ms Wall time of the aggregation
     */
    void log_aggregation(
        const std::string& granularity,
        const std::string& path,
        size_t bucket_count,
        double elapsed_ms
    );

    /**
     * @brief Log the start of an insight generation pass
     */
    void log_generation_start(const std::string& key, size_t transaction_count);

    /**
     * @brief Log the end of an insight generation pass
     *
     * @param key Cache key of the pass
     * @param insight_count Total number of insights
     * @param category_counts Insights per category
     * @param elapsed_ms Wall time of the pass
     */
    void log_generation_complete(
        const std::string& key,
        size_t insight_count,
        const std::map<std::string, size_t>& category_counts,
        double elapsed_ms
    );

    /**
     * @brief Log a generator that threw; its insights are dropped from the pass
     */
    void log_generator_failed(const std::string& generator, const std::string& error_message);

    /**
     * @brief Log a missing exchange rate; the raw amount is used instead
     */
    void log_conversion_fallback(
        const std::string& context,
        double amount,
        const std::string& from_currency,
        const std::string& to_currency
    );

    void debug(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void info(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void warn(const std::string& message, const std::map<std::string, std::string>& fields = {});
    void error(const std::string& message, const std::map<std::string, std::string>& fields = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace finsight

#endif // FINSIGHT_LOGGER_HPP
