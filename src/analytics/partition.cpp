#include "analytics/partition.hpp"
#include <algorithm>
#include <map>

namespace flowguard {

std::vector<Partition> partition_by_sensor(const AnalysisTable& rows) {
    std::map<SensorId, std::vector<std::size_t>> by_sensor;
    std::vector<std::size_t> unkeyed;

    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].sensor_id) {
            by_sensor[*rows[i].sensor_id].push_back(i);
        } else {
            unkeyed.push_back(i);
        }
    }

    // Undefined timestamps sort last
    auto earlier = [&rows](std::size_t a, std::size_t b) {
        const auto& ta = rows[a].timestamp;
        const auto& tb = rows[b].timestamp;
        if (!ta) {
            return false;
        }
        return !tb || *ta < *tb;
    };

    std::vector<Partition> partitions;
    partitions.reserve(by_sensor.size() + (unkeyed.empty() ? 0 : 1));

    for (auto& [sensor_id, indices] : by_sensor) {
        std::stable_sort(indices.begin(), indices.end(), earlier);
        partitions.push_back(Partition{sensor_id, std::move(indices)});
    }

    if (!unkeyed.empty()) {
        std::stable_sort(unkeyed.begin(), unkeyed.end(), earlier);
        partitions.push_back(Partition{std::nullopt, std::move(unkeyed)});
    }

    return partitions;
}

}  // namespace flowguard
