#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace flowguard {

/// Upper bound on detector.threads
inline constexpr std::size_t kMaxThreads = 256;

/// Parse a non-negative decimal integer (CLI and env counts)
/// Signs, fractions and trailing characters are rejected
[[nodiscard]] Result<std::size_t, std::string> parse_size(std::string_view text);

/// Immutable configuration for flowguard
struct Config {
    /// Anomaly detector parameters
    struct Detector {
        std::size_t window = 20;
        std::string method = "zscore";
        double z_threshold = 3.0;
        double iqr_k = 1.5;
        std::size_t threads = 1;  // >1 evaluates sensors on a thread pool
    };

    /// Reading selection applied before detection
    struct Query {
        std::optional<SensorId> sensor_id;
        std::optional<std::string> since;  // ISO-8601, inclusive lower bound
        std::size_t limit = 0;              // 0 = all rows
    };

    /// Output configuration
    struct Output {
        bool alerts_only = false;
        std::size_t alert_limit = 200;
        bool pretty = false;
        std::string log_level = "info";
    };

    Detector detector;
    ColumnNames columns;
    Query query;
    Output output;

    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Check cross-field constraints (window >= 2, positive thresholds, 1 <= threads <= kMaxThreads)
    /// @return Empty string when valid, otherwise the first problem found
    [[nodiscard]] std::string validate() const;
};

}  // namespace flowguard
