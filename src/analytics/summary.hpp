#pragma once

#include "analytics/analysis_row.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace flowguard {

/// Row and anomaly counts for one sensor
struct SensorSummary {
    std::optional<SensorId> sensor_id;
    std::size_t total{0};
    std::size_t anomalies{0};

    friend bool operator==(const SensorSummary&, const SensorSummary&) = default;
};

/// Per-sensor totals, ascending by sensor id (rows without an id last)
[[nodiscard]] std::vector<SensorSummary> summarize_by_sensor(const AnalysisTable& rows);

/// Alert rows for display
///
/// Keeps anomalies that have both a timestamp and a value, most recent
/// first (ties keep detector order), truncated to `limit` (0 = no limit).
[[nodiscard]] AnalysisTable select_alerts(const AnalysisTable& rows, std::size_t limit = 0);

}  // namespace flowguard
