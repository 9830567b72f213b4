#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace flowguard {

// Opaque sensor / meter identifier used as the partition key
using SensorId = std::string;

// UTC instant, millisecond resolution
using UtcTime = std::chrono::sys_time<std::chrono::milliseconds>;

// A numeric cell that may legitimately have no value
using MaybeNumber = std::optional<double>;

/// Anomaly detection method
enum class Method {
    ZScore,
    Iqr
};

/// Canonical method tag ("zscore" / "iqr")
[[nodiscard]] constexpr std::string_view method_name(Method method) noexcept {
    switch (method) {
        case Method::ZScore: return "zscore";
        case Method::Iqr: return "iqr";
    }
    return "unknown";
}

/// Names of the required input columns
struct ColumnNames {
    std::string sensor_id = "sensor_id";
    std::string value = "value";
    std::string timestamp = "timestamp";
};

}  // namespace flowguard
