#pragma once

#include "analytics/analysis_row.hpp"
#include "analytics/anomaly_detector.hpp"
#include "analytics/summary.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace flowguard::output {

/// Console reporting of analysis runs
class ConsoleLogger {
public:
    /// @param max_alerts Alerts printed per run (0 = all)
    explicit ConsoleLogger(std::size_t max_alerts = 10);

    /// Log the parameters and input size of a run
    void log_run(const DetectorParams& params, std::size_t input_rows, std::size_t threads);

    /// Log one line per sensor: rows analysed and anomalies found
    void log_summary(const std::vector<SensorSummary>& summary);

    /// Log a single alert row
    void log_alert(const AnalysisRow& row);

    /// Log the alerts of a run, most recent first, capped at max_alerts
    /// @return Number of alerts logged
    std::size_t log_alerts(const AnalysisTable& rows);

    /// Log a fatal error
    void log_error(const std::string& message);

private:
    std::size_t max_alerts_;
};

}  // namespace flowguard::output
