#pragma once

#include "analytics/analysis_row.hpp"
#include "analytics/anomaly_detector.hpp"
#include "analytics/summary.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace flowguard::output {

/// Formats analysis results as JSON
/// Undefined statistics serialise as null
class JsonFormatter {
public:
    /// One result row
    [[nodiscard]] static nlohmann::json format_row(const AnalysisRow& row);

    /// Array of result rows
    [[nodiscard]] static nlohmann::json format_rows(const AnalysisTable& rows);

    /// Per-sensor totals
    [[nodiscard]] static nlohmann::json format_summary(const std::vector<SensorSummary>& summary);

    /// Detector parameters as used
    [[nodiscard]] static nlohmann::json format_params(const DetectorParams& params);

    /// Full report document
    /// @param alerts_only When true the document carries "alerts" instead of "rows"
    [[nodiscard]] static nlohmann::json format_report(
        const DetectorParams& params,
        const AnalysisTable& rows,
        bool alerts_only,
        std::size_t alert_limit
    );

    /// Fatal detector error
    [[nodiscard]] static nlohmann::json format_error(const DetectError& error);
};

}  // namespace flowguard::output
