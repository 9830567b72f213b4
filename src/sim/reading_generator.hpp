#pragma once

#include "core/types.hpp"
#include "input/reading_table.hpp"
#include <chrono>
#include <cstdint>
#include <random>
#include <vector>

namespace flowguard::sim {

/// Parameters of the synthetic flow-meter feed
struct GeneratorConfig {
    std::vector<SensorId> meters{"SETOR-A-01", "SETOR-A-02", "SETOR-B-01"};
    double flow_min = 12.0;            // L/min
    double flow_max = 30.0;
    double spike_probability = 0.05;
    double spike_min = 1.8;            // multiplier applied to the base flow
    double spike_max = 2.5;
    std::chrono::seconds interval{5};
    UtcTime start = UtcTime{std::chrono::milliseconds{1762099200000}};  // 2025-11-02T16:00:00Z
    std::uint32_t seed = 42;
};

/// One simulated reading
struct SimulatedReading {
    SensorId meter;
    double flow_lpm;
    double pressure_bar;
    double temperature_c;
    UtcTime ts;
    bool spiked;
};

/// Deterministic generator of meter readings with occasional spikes
///
/// Each reading goes to a randomly chosen meter, one interval after the
/// previous reading. Identical configs produce identical sequences.
class ReadingGenerator {
public:
    explicit ReadingGenerator(GeneratorConfig config = {});

    [[nodiscard]] SimulatedReading next();

    /// Generate `count` readings as a table
    /// Columns: the configured sensor/value/timestamp names plus
    /// pressure_bar and temperature_c; timestamps as ISO-8601 text
    [[nodiscard]] ReadingTable generate(std::size_t count, const ColumnNames& columns = {});

    [[nodiscard]] std::size_t spike_count() const noexcept { return spikes_; }

private:
    GeneratorConfig config_;
    std::mt19937 rng_;
    UtcTime clock_;
    std::size_t spikes_{0};
};

}  // namespace flowguard::sim
