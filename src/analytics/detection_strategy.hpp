#pragma once

#include "analytics/analysis_row.hpp"
#include "analytics/rolling_window.hpp"
#include "core/types.hpp"
#include <memory>

namespace flowguard {

/// Statistical test applied at each position of a sensor's series
///
/// The detector owns partitioning and window sliding; a strategy only sees
/// a complete trailing window and the current value, and fills the
/// statistic fields and anomaly flag it is responsible for.
class DetectionStrategy {
public:
    virtual ~DetectionStrategy() = default;

    [[nodiscard]] virtual Method method() const noexcept = 0;

    /// Evaluate one position
    /// @param window Complete trailing window (includes `value`)
    /// @param value Current observation
    /// @param row Output row; only this method's fields are written
    virtual void evaluate(const RollingWindow& window, double value, AnalysisRow& row) const = 0;
};

/// Rolling z-score: |value - mean| / std > threshold
class ZScoreStrategy final : public DetectionStrategy {
public:
    /// @param z_threshold z-score magnitude above which a point is anomalous
    explicit ZScoreStrategy(double z_threshold = 3.0);

    [[nodiscard]] Method method() const noexcept override { return Method::ZScore; }

    void evaluate(const RollingWindow& window, double value, AnalysisRow& row) const override;

    [[nodiscard]] double threshold() const noexcept { return threshold_; }

private:
    double threshold_;
};

/// Rolling IQR fence: outside [Q1 - k*IQR, Q3 + k*IQR]
class IqrStrategy final : public DetectionStrategy {
public:
    /// @param k Fence multiplier
    explicit IqrStrategy(double k = 1.5);

    [[nodiscard]] Method method() const noexcept override { return Method::Iqr; }

    void evaluate(const RollingWindow& window, double value, AnalysisRow& row) const override;

    [[nodiscard]] double k() const noexcept { return k_; }

private:
    double k_;
};

/// Build the strategy for a method
[[nodiscard]] std::shared_ptr<const DetectionStrategy> make_strategy(
    Method method,
    double z_threshold,
    double iqr_k
);

}  // namespace flowguard
