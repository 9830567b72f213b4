#include "analytics/summary.hpp"
#include <algorithm>
#include <iterator>
#include <map>

namespace flowguard {

std::vector<SensorSummary> summarize_by_sensor(const AnalysisTable& rows) {
    std::map<SensorId, SensorSummary> by_sensor;
    SensorSummary unkeyed;

    for (const auto& row : rows) {
        SensorSummary* summary = &unkeyed;
        if (row.sensor_id) {
            summary = &by_sensor[*row.sensor_id];
            summary->sensor_id = row.sensor_id;
        }
        ++summary->total;
        if (row.is_anomaly) {
            ++summary->anomalies;
        }
    }

    std::vector<SensorSummary> result;
    result.reserve(by_sensor.size() + 1);
    for (auto& [_, summary] : by_sensor) {
        result.push_back(std::move(summary));
    }
    if (unkeyed.total > 0) {
        result.push_back(unkeyed);
    }
    return result;
}

AnalysisTable select_alerts(const AnalysisTable& rows, std::size_t limit) {
    AnalysisTable alerts;
    std::copy_if(rows.begin(), rows.end(), std::back_inserter(alerts), [](const AnalysisRow& row) {
        return row.is_anomaly && row.timestamp && row.value;
    });

    std::stable_sort(alerts.begin(), alerts.end(), [](const AnalysisRow& a, const AnalysisRow& b) {
        return *a.timestamp > *b.timestamp;
    });

    if (limit > 0 && alerts.size() > limit) {
        alerts.resize(limit);
    }
    return alerts;
}

}  // namespace flowguard
