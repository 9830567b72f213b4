#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace flowguard {

/// One reading enriched with rolling statistics and the anomaly flag
///
/// Statistic fields stay nullopt until the sensor's trailing window is
/// complete. z-score fields belong to Method::ZScore, low/high bounds to
/// Method::Iqr; the other method's fields are always nullopt.
struct AnalysisRow {
    std::size_t source_index{0};  // row position in the input table
    std::optional<SensorId> sensor_id;
    MaybeNumber value;
    std::optional<UtcTime> timestamp;

    MaybeNumber rolling_mean;
    MaybeNumber rolling_std;
    MaybeNumber rolling_low;
    MaybeNumber rolling_high;
    MaybeNumber zscore;

    bool is_anomaly{false};
    Method method{Method::ZScore};

    friend bool operator==(const AnalysisRow&, const AnalysisRow&) = default;
};

using AnalysisTable = std::vector<AnalysisRow>;

}  // namespace flowguard
