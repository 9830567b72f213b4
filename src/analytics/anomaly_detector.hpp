#pragma once

#include "analytics/analysis_row.hpp"
#include "analytics/detection_strategy.hpp"
#include "core/errors.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include "input/reading_table.hpp"
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace flowguard {

/// Parameters of one detection run
struct DetectorParams {
    std::size_t window = 20;        // trailing observations incl. the current one
    std::string method = "zscore";  // "zscore" or "iqr", case-insensitive
    double z_threshold = 3.0;
    double iqr_k = 1.5;
};

/// Parse a method name (case-insensitive, surrounding whitespace ignored)
[[nodiscard]] Result<Method, InvalidMethodError> parse_method(std::string_view name);

/// Per-sensor rolling anomaly detector
///
/// Pure: no I/O, no logging, no randomness, and the input table is never
/// modified. Sensors are independent; the thread-pool overload evaluates
/// them concurrently and returns exactly what the sequential call returns.
class AnomalyDetector {
public:
    /// Build a detector, resolving the method name to a strategy
    [[nodiscard]] static Result<AnomalyDetector, InvalidMethodError> create(
        const DetectorParams& params,
        ColumnNames columns = {}
    );

    /// Build a detector around an explicit strategy
    AnomalyDetector(std::size_t window,
                    std::shared_ptr<const DetectionStrategy> strategy,
                    ColumnNames columns = {});

    /// Enrich every reading with rolling statistics and the anomaly flag
    /// @return Rows grouped by ascending sensor id, chronological within a
    ///         sensor; SchemaError if a required column is absent
    [[nodiscard]] Result<AnalysisTable, DetectError> detect(const ReadingTable& readings) const;

    /// Same as detect(readings), one pool task per sensor
    [[nodiscard]] Result<AnalysisTable, DetectError> detect(
        const ReadingTable& readings,
        boost::asio::thread_pool& pool
    ) const;

    [[nodiscard]] Method method() const noexcept { return strategy_->method(); }
    [[nodiscard]] std::size_t window() const noexcept { return window_; }
    [[nodiscard]] const ColumnNames& columns() const noexcept { return columns_; }

private:
    std::size_t window_;
    std::shared_ptr<const DetectionStrategy> strategy_;
    ColumnNames columns_;
};

/// Check that the table carries the three required columns
[[nodiscard]] std::optional<SchemaError> check_schema(
    const ReadingTable& readings,
    const ColumnNames& columns
);

/// One-call entry point
/// Schema is checked before the method name.
[[nodiscard]] Result<AnalysisTable, DetectError> detect_anomalies(
    const ReadingTable& readings,
    const DetectorParams& params = {},
    const ColumnNames& columns = {}
);

}  // namespace flowguard
