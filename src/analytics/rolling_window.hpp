#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace flowguard {

/// Fixed-size trailing window over one sensor's values
///
/// Undefined values occupy a slot like any other observation, so a single
/// missing reading keeps the window incomplete until it slides out.
/// Statistics are only meaningful once complete() is true.
class RollingWindow {
public:
    /// @param capacity Number of trailing observations, including the current one
    explicit RollingWindow(std::size_t capacity);

    /// Push the next observation, evicting the oldest once at capacity
    void push(MaybeNumber value);

    /// True when the window holds `capacity` observations, all defined
    [[nodiscard]] bool complete() const noexcept;

    /// Arithmetic mean of the window
    [[nodiscard]] double mean() const;

    /// Population standard deviation (divisor = window size)
    /// Exactly 0.0 when every value in the window is identical
    [[nodiscard]] double population_std_dev() const;

    /// Q1 and Q3 by linear interpolation, from a single sort
    [[nodiscard]] std::pair<double, double> quartiles() const;

private:
    [[nodiscard]] std::vector<double> sorted_values() const;

    std::deque<MaybeNumber> values_;
    std::size_t capacity_;
    std::size_t missing_{0};
};

/// Linear-interpolation quantile of an ascending-sorted, non-empty range
/// position = q * (n - 1), q clamped to [0, 1]
[[nodiscard]] double interpolated_quantile(const std::vector<double>& sorted, double q);

}  // namespace flowguard
