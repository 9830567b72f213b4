#include "core/config.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace flowguard {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as size_t within [min_val, max_val]
std::optional<std::size_t> get_env_size(const char* name, std::size_t min_val = 0,
                                        std::size_t max_val = std::numeric_limits<std::size_t>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    auto parsed = parse_size(*value);
    if (parsed.is_err()) {
        std::cerr << "Warning: Invalid size value for " << name
                  << ": " << parsed.error() << ", ignoring" << std::endl;
        return std::nullopt;
    }
    std::size_t result = parsed.value();
    if (result < min_val || result > max_val) {
        std::cerr << "Warning: " << name << " value " << result
                  << " out of range [" << min_val << ", " << max_val
                  << "], ignoring" << std::endl;
        return std::nullopt;
    }
    return result;
}

/// Non-negative integer field; get<std::size_t>() would wrap a negative one
std::size_t get_size(const json& node, const char* field) {
    const auto& value = node.at(field);
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument(std::string(field) + " must be a non-negative integer, got " +
                                    value.dump());
    }
    return value.get<std::size_t>();
}

/// Get environment variable as a strictly positive double
std::optional<double> get_env_positive(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        double result = std::stod(*value);
        if (!(result > 0.0)) {
            std::cerr << "Warning: " << name << " must be positive, ignoring" << std::endl;
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        std::cerr << "Warning: Invalid number for " << name
                  << ": " << *value << ", ignoring" << std::endl;
        return std::nullopt;
    }
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    // Detector
    if (auto v = get_env_size("FLOWGUARD_WINDOW", 2, 10000)) {
        config.detector.window = *v;
    }
    if (auto v = get_env("FLOWGUARD_METHOD")) {
        config.detector.method = *v;
    }
    if (auto v = get_env_positive("FLOWGUARD_Z_THRESHOLD")) {
        config.detector.z_threshold = *v;
    }
    if (auto v = get_env_positive("FLOWGUARD_IQR_K")) {
        config.detector.iqr_k = *v;
    }
    if (auto v = get_env_size("FLOWGUARD_THREADS", 1, kMaxThreads)) {
        config.detector.threads = *v;
    }

    // Columns
    if (auto v = get_env("FLOWGUARD_SENSOR_COLUMN")) {
        config.columns.sensor_id = *v;
    }
    if (auto v = get_env("FLOWGUARD_VALUE_COLUMN")) {
        config.columns.value = *v;
    }
    if (auto v = get_env("FLOWGUARD_TIMESTAMP_COLUMN")) {
        config.columns.timestamp = *v;
    }

    // Query
    if (auto v = get_env("FLOWGUARD_SENSOR")) {
        config.query.sensor_id = *v;
    }
    if (auto v = get_env("FLOWGUARD_SINCE")) {
        config.query.since = *v;
    }
    if (auto v = get_env_size("FLOWGUARD_LIMIT", 0, 10000000)) {
        config.query.limit = *v;
    }

    // Output
    if (auto v = get_env_size("FLOWGUARD_ALERT_LIMIT", 0, 10000000)) {
        config.output.alert_limit = *v;
    }
    if (auto v = get_env("FLOWGUARD_LOG_LEVEL")) {
        config.output.log_level = *v;
    }
}

}  // namespace

Result<std::size_t, std::string> parse_size(std::string_view text) {
    std::size_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [end, ec] = std::from_chars(first, last, value);

    if (ec == std::errc::result_out_of_range) {
        return Result<std::size_t, std::string>::Err("'" + std::string(text) + "' is out of range");
    }
    if (text.empty() || ec != std::errc() || end != last) {
        return Result<std::size_t, std::string>::Err(
            "expected a non-negative integer, got '" + std::string(text) + "'");
    }
    return Result<std::size_t, std::string>::Ok(value);
}

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("detector")) {
            const auto& det = j["detector"];
            if (det.contains("window")) {
                config.detector.window = get_size(det, "window");
            }
            if (det.contains("method")) {
                config.detector.method = det["method"].get<std::string>();
            }
            if (det.contains("z_threshold")) {
                config.detector.z_threshold = det["z_threshold"].get<double>();
            }
            if (det.contains("iqr_k")) {
                config.detector.iqr_k = det["iqr_k"].get<double>();
            }
            if (det.contains("threads")) {
                config.detector.threads = get_size(det, "threads");
            }
        }

        if (j.contains("columns")) {
            const auto& cols = j["columns"];
            config.columns.sensor_id = cols.value("sensor_id", config.columns.sensor_id);
            config.columns.value = cols.value("value", config.columns.value);
            config.columns.timestamp = cols.value("timestamp", config.columns.timestamp);
        }

        if (j.contains("query")) {
            const auto& q = j["query"];
            if (q.contains("sensor_id") && !q["sensor_id"].is_null()) {
                config.query.sensor_id = q["sensor_id"].get<std::string>();
            }
            if (q.contains("since") && !q["since"].is_null()) {
                config.query.since = q["since"].get<std::string>();
            }
            if (q.contains("limit")) {
                config.query.limit = get_size(q, "limit");
            }
        }

        if (j.contains("output")) {
            const auto& out = j["output"];
            config.output.alerts_only = out.value("alerts_only", config.output.alerts_only);
            if (out.contains("alert_limit")) {
                config.output.alert_limit = get_size(out, "alert_limit");
            }
            config.output.pretty = out.value("pretty", config.output.pretty);
            config.output.log_level = out.value("log_level", config.output.log_level);
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            std::cerr << "Warning: Failed to load config from '" << *config_path
                      << "': " << result.error()
                      << " (using defaults with env overrides)" << std::endl;
        }
    }

    // Environment has the last word
    apply_env_overrides(config);

    return config;
}

std::string Config::validate() const {
    if (detector.window < 2) {
        return "detector.window must be at least 2, got " + std::to_string(detector.window);
    }
    if (!(detector.z_threshold > 0.0)) {
        return "detector.z_threshold must be positive";
    }
    if (!(detector.iqr_k > 0.0)) {
        return "detector.iqr_k must be positive";
    }
    if (detector.threads == 0 || detector.threads > kMaxThreads) {
        return "detector.threads must be between 1 and " + std::to_string(kMaxThreads) +
               ", got " + std::to_string(detector.threads);
    }
    if (columns.sensor_id.empty() || columns.value.empty() || columns.timestamp.empty()) {
        return "column names must not be empty";
    }
    return {};
}

}  // namespace flowguard
