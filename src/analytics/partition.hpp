#pragma once

#include "analytics/analysis_row.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace flowguard {

/// Rows of one sensor in chronological order
struct Partition {
    std::optional<SensorId> sensor_id;  // nullopt collects rows with no usable id
    std::vector<std::size_t> rows;      // indices into the coerced row vector
};

/// Group rows by sensor id and order each group by timestamp
///
/// Partitions come back in ascending sensor-id order, with the id-less
/// partition (if any) last. Within a partition the sort is stable, and rows
/// with no timestamp follow all timestamped rows in input order.
[[nodiscard]] std::vector<Partition> partition_by_sensor(const AnalysisTable& rows);

}  // namespace flowguard
