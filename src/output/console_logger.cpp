#include "output/console_logger.hpp"
#include "core/timestamp.hpp"
#include <spdlog/spdlog.h>

namespace flowguard::output {

ConsoleLogger::ConsoleLogger(std::size_t max_alerts)
    : max_alerts_(max_alerts)
{}

void ConsoleLogger::log_run(const DetectorParams& params, std::size_t input_rows, std::size_t threads) {
    spdlog::info(
        "Analysing {} readings | method: {} | window: {} | z: {:.2f} | k: {:.2f} | threads: {}",
        input_rows,
        params.method,
        params.window,
        params.z_threshold,
        params.iqr_k,
        threads
    );
}

void ConsoleLogger::log_summary(const std::vector<SensorSummary>& summary) {
    if (summary.empty()) {
        spdlog::info("No readings to summarise");
        return;
    }

    for (const auto& s : summary) {
        spdlog::info("Sensor {}: {} rows, {} anomalies",
                     s.sensor_id.value_or("<none>"), s.total, s.anomalies);
    }
}

void ConsoleLogger::log_alert(const AnalysisRow& row) {
    std::string when = row.timestamp ? timestamp::format_iso8601(*row.timestamp) : "?";
    std::string sensor = row.sensor_id.value_or("<none>");
    double value = row.value.value_or(0.0);

    if (row.zscore) {
        spdlog::warn("ALERT: {} {} flow={:.3f} ({:+.2f} sigma)", sensor, when, value, *row.zscore);
    } else if (row.rolling_low && row.rolling_high) {
        spdlog::warn("ALERT: {} {} flow={:.3f} outside [{:.3f}, {:.3f}]",
                     sensor, when, value, *row.rolling_low, *row.rolling_high);
    } else {
        spdlog::warn("ALERT: {} {} flow={:.3f}", sensor, when, value);
    }
}

std::size_t ConsoleLogger::log_alerts(const AnalysisTable& rows) {
    auto alerts = select_alerts(rows, max_alerts_);
    if (alerts.empty()) {
        spdlog::info("No anomalies detected for the current parameters");
        return 0;
    }

    for (const auto& row : alerts) {
        log_alert(row);
    }
    return alerts.size();
}

void ConsoleLogger::log_error(const std::string& message) {
    spdlog::error("{}", message);
}

}  // namespace flowguard::output
