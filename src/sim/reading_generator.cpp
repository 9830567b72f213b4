#include "sim/reading_generator.hpp"
#include "core/timestamp.hpp"
#include <cmath>
#include <stdexcept>

namespace flowguard::sim {

namespace {

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

}  // namespace

ReadingGenerator::ReadingGenerator(GeneratorConfig config)
    : config_(std::move(config))
    , rng_(config_.seed)
    , clock_(config_.start)
{
    if (config_.meters.empty()) {
        throw std::invalid_argument("ReadingGenerator needs at least one meter");
    }
}

SimulatedReading ReadingGenerator::next() {
    std::uniform_int_distribution<std::size_t> meter_dist(0, config_.meters.size() - 1);
    std::uniform_real_distribution<double> flow_dist(config_.flow_min, config_.flow_max);
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    std::uniform_real_distribution<double> spike_dist(config_.spike_min, config_.spike_max);
    std::uniform_real_distribution<double> pressure_dist(1.5, 3.5);
    std::uniform_real_distribution<double> temp_dist(18.0, 30.0);

    SimulatedReading reading;
    reading.meter = config_.meters[meter_dist(rng_)];

    double flow = flow_dist(rng_);
    reading.spiked = chance(rng_) < config_.spike_probability;
    if (reading.spiked) {
        flow *= spike_dist(rng_);
        ++spikes_;
    }
    reading.flow_lpm = round_to(flow, 3);
    reading.pressure_bar = round_to(pressure_dist(rng_), 3);
    reading.temperature_c = round_to(temp_dist(rng_), 2);
    reading.ts = clock_;

    clock_ += config_.interval;
    return reading;
}

ReadingTable ReadingGenerator::generate(std::size_t count, const ColumnNames& columns) {
    ReadingTable table({columns.sensor_id, columns.value, columns.timestamp,
                        "pressure_bar", "temperature_c"});

    for (std::size_t i = 0; i < count; ++i) {
        auto reading = next();
        table.add_row({
            reading.meter,
            reading.flow_lpm,
            timestamp::format_iso8601(reading.ts),
            reading.pressure_bar,
            reading.temperature_c
        });
    }
    return table;
}

}  // namespace flowguard::sim
