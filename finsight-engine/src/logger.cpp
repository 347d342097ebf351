/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace finsight {

namespace {

std::string format_ms(double ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << ms;
    return oss.str();
}

} // anonymous namespace

Logger::Logger(const LoggerConfig& config)
    : config_(config)
{
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::log_cache_lookup(const std::string& key, bool hit) {
    std::map<std::string, std::string> fields;
    fields["event"] = hit ? "cache_hit" : "cache_miss";
    fields["cache_key"] = key;

    log(LogLevel::DEBUG, hit ? "Insights served from cache" : "Insights cache miss", fields);
}

void Logger::log_cache_store(const std::string& key, size_t insight_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cache_store";
    fields["cache_key"] = key;
    fields["insight_count"] = std::to_string(insight_count);

    log(LogLevel::DEBUG, "Insights stored in cache", fields);
}

void Logger::log_cache_invalidation(const std::string& scope, size_t removed) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cache_invalidation";
    fields["scope"] = scope;
    fields["removed"] = std::to_string(removed);

    log(LogLevel::INFO, "Insights cache invalidated", fields);
}

void Logger::log_aggregation(
    const std::string& granularity,
    const std::string& path,
    size_t bucket_count,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "aggregation";
    fields["granularity"] = granularity;
    fields["path"] = path;
    fields["bucket_count"] = std::to_string(bucket_count);
    fields["elapsed_ms"] = format_ms(elapsed_ms);

    log(LogLevel::DEBUG, "Period buckets computed", fields);
}

void Logger::log_generation_start(const std::string& key, size_t transaction_count) {
    std::map<std::string, std::string> fields;
    fields["event"] = "generation_start";
    fields["cache_key"] = key;
    fields["transaction_count"] = std::to_string(transaction_count);

    log(LogLevel::INFO, "Generating insights", fields);
}

void Logger::log_generation_complete(
    const std::string& key,
    size_t insight_count,
    const std::map<std::string, size_t>& category_counts,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "generation_complete";
    fields["cache_key"] = key;
    fields["insight_count"] = std::to_string(insight_count);
    fields["elapsed_ms"] = format_ms(elapsed_ms);

    for (const auto& [category, count] : category_counts) {
        fields["count." + category] = std::to_string(count);
    }

    log(LogLevel::INFO, "Insights generated", fields);
}

void Logger::log_generator_failed(const std::string& generator, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "generator_failed";
    fields["generator"] = generator;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Insight generator failed", fields);
}

void Logger::log_conversion_fallback(
    const std::string& context,
    double amount,
    const std::string& from_currency,
    const std::string& to_currency
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "conversion_fallback";
    fields["context"] = context;
    fields["amount"] = std::to_string(amount);
    fields["from"] = from_currency;
    fields["to"] = to_currency;

    log(LogLevel::WARN, "No exchange rate, using unconverted amount", fields);
}

void Logger::debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::info(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::INFO, message, fields);
}

void Logger::warn(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::WARN, message, fields);
}

void Logger::error(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::ERROR, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    if (level < get_min_level()) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace finsight
