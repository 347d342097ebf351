#include "config_parser.hpp"
#include "currency.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace finsight {

namespace {

std::string expanded_string(const json& j, const std::string& field) {
    return expand_environment_variables(j.at(field).get<std::string>());
}

LogLevel parse_level(const std::string& text) {
    std::string upper;
    for (char c : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "WARNING") {
        upper = "WARN";
    }
    if (upper != "DEBUG" && upper != "INFO" && upper != "WARN" && upper != "ERROR") {
        throw ConfigParseError("Invalid logging level: " + text + " (expected DEBUG, INFO, WARN or ERROR)");
    }
    return string_to_level(upper);
}

void parse_cache(const json& j, EngineConfig& config) {
    if (j.contains("capacity")) {
        long long capacity = j["capacity"].get<long long>();
        if (capacity < 1) {
            throw ConfigParseError("cache.capacity must be at least 1");
        }
        config.cache.cache_capacity = static_cast<size_t>(capacity);
    }
    if (j.contains("ttl_seconds")) {
        long long ttl = j["ttl_seconds"].get<long long>();
        if (ttl <= 0) {
            throw ConfigParseError("cache.ttl_seconds must be positive");
        }
        config.cache.cache_ttl = std::chrono::seconds(ttl);
    }
}

void parse_logging(const json& j, EngineConfig& config) {
    if (j.contains("level")) {
        config.logging.min_level = parse_level(j["level"].get<std::string>());
    }
    if (j.contains("json")) {
        config.logging.enable_json = j["json"].get<bool>();
    }
    if (j.contains("console")) {
        config.logging.enable_console = j["console"].get<bool>();
    }
    if (j.contains("file")) {
        std::string file = expanded_string(j, "file");
        config.logging.enable_file = !file.empty();
        if (!file.empty()) {
            config.logging.log_file_path = file;
        }
    }
}

void parse_granularities(const json& j, EngineConfig& config) {
    if (!j.is_array()) {
        throw ConfigParseError("granularities must be an array");
    }
    config.granularities.clear();
    for (const auto& entry : j) {
        try {
            Granularity granularity = granularity_from_string(entry.get<std::string>());
            if (std::find(config.granularities.begin(), config.granularities.end(), granularity)
                == config.granularities.end()) {
                config.granularities.push_back(granularity);
            }
        } catch (const std::invalid_argument& e) {
            throw ConfigParseError(e.what());
        }
    }
    if (config.granularities.empty()) {
        throw ConfigParseError("granularities must not be empty");
    }
}

void parse_data(const json& j, EngineConfig& config) {
    if (j.contains("transactions")) config.data.transactions = expanded_string(j, "transactions");
    if (j.contains("accounts")) config.data.accounts = expanded_string(j, "accounts");
    if (j.contains("categories")) config.data.categories = expanded_string(j, "categories");
    if (j.contains("recurring")) config.data.recurring = expanded_string(j, "recurring");
    if (j.contains("rates")) config.data.rates = expanded_string(j, "rates");
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++; // Skip '}'
        }

        // A lone '$' is kept as is
        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (path.empty() || p.is_absolute()) {
        return path;
    }

    // Resolve relative to config directory
    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

EngineConfig parse_engine_config_from_string(const std::string& json_string) {
    EngineConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Configuration must be a JSON object");
        }

        if (j.contains("base_currency")) {
            config.base_currency = expanded_string(j, "base_currency");
            if (config.base_currency.empty()) {
                throw ConfigParseError("base_currency must not be empty");
            }
            if (!is_valid_currency_code(config.base_currency)) {
                throw ConfigParseError("base_currency must contain only letters and digits: " +
                                       config.base_currency);
            }
        }
        if (j.contains("cache")) {
            parse_cache(j["cache"], config);
        }
        if (j.contains("logging")) {
            parse_logging(j["logging"], config);
        }
        if (j.contains("granularities")) {
            parse_granularities(j["granularities"], config);
        }
        if (j.contains("data")) {
            parse_data(j["data"], config);
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON value error: ") + e.what());
    }

    return config;
}

EngineConfig parse_engine_config_from_file(const std::string& file_path) {
    // Read file
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    EngineConfig config = parse_engine_config_from_string(buffer.str());

    // Resolve relative paths
    DataPaths& data = config.data;
    for (std::string* path : {&data.transactions, &data.accounts, &data.categories,
                              &data.recurring, &data.rates}) {
        *path = resolve_relative_path(*path, file_path);
    }
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace finsight
