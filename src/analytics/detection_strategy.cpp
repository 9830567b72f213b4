#include "analytics/detection_strategy.hpp"
#include <cmath>

namespace flowguard {

ZScoreStrategy::ZScoreStrategy(double z_threshold)
    : threshold_(z_threshold)
{}

void ZScoreStrategy::evaluate(const RollingWindow& window, double value, AnalysisRow& row) const {
    double mean = window.mean();
    double std_dev = window.population_std_dev();

    // Sums past the double range leave every statistic undefined
    if (!std::isfinite(mean) || !std::isfinite(std_dev)) {
        return;
    }

    row.rolling_mean = mean;
    row.rolling_std = std_dev;

    // Zero spread: z-score undefined, never an anomaly
    if (!(std_dev > 0.0)) {
        return;
    }

    double z = (value - mean) / std_dev;
    if (!std::isfinite(z)) {
        return;
    }
    row.zscore = z;
    row.is_anomaly = std::fabs(z) > threshold_;
}

IqrStrategy::IqrStrategy(double k)
    : k_(k)
{}

void IqrStrategy::evaluate(const RollingWindow& window, double value, AnalysisRow& row) const {
    auto [q1, q3] = window.quartiles();
    double iqr = q3 - q1;
    double low = q1 - k_ * iqr;
    double high = q3 + k_ * iqr;
    if (!std::isfinite(low) || !std::isfinite(high)) {
        return;
    }

    row.rolling_low = low;
    row.rolling_high = high;
    row.is_anomaly = value < low || value > high;
}

std::shared_ptr<const DetectionStrategy> make_strategy(
    Method method,
    double z_threshold,
    double iqr_k
) {
    switch (method) {
        case Method::ZScore:
            return std::make_shared<ZScoreStrategy>(z_threshold);
        case Method::Iqr:
            return std::make_shared<IqrStrategy>(iqr_k);
    }
    return nullptr;
}

}  // namespace flowguard
