#include "analytics/rolling_window.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace flowguard {

RollingWindow::RollingWindow(std::size_t capacity)
    : capacity_(capacity)
{}

void RollingWindow::push(MaybeNumber value) {
    if (!value) {
        ++missing_;
    }
    values_.push_back(value);

    if (values_.size() > capacity_) {
        if (!values_.front()) {
            --missing_;
        }
        values_.pop_front();
    }
}

bool RollingWindow::complete() const noexcept {
    return capacity_ > 0 && values_.size() == capacity_ && missing_ == 0;
}

double RollingWindow::mean() const {
    if (values_.empty() || missing_ > 0) {
        throw std::logic_error("RollingWindow::mean() on an incomplete window");
    }
    double sum = 0.0;
    for (const auto& v : values_) {
        sum += *v;
    }
    return sum / static_cast<double>(values_.size());
}

double RollingWindow::population_std_dev() const {
    double m = mean();

    // Constant windows must give exactly zero, not rounding noise around the mean
    auto [lo, hi] = std::minmax_element(values_.begin(), values_.end());
    if (**lo == **hi) {
        return 0.0;
    }

    double m2 = 0.0;
    for (const auto& v : values_) {
        double delta = *v - m;
        m2 += delta * delta;
    }
    return std::sqrt(m2 / static_cast<double>(values_.size()));
}

std::pair<double, double> RollingWindow::quartiles() const {
    auto sorted = sorted_values();
    return {interpolated_quantile(sorted, 0.25), interpolated_quantile(sorted, 0.75)};
}

std::vector<double> RollingWindow::sorted_values() const {
    if (values_.empty() || missing_ > 0) {
        throw std::logic_error("RollingWindow quantile on an incomplete window");
    }
    std::vector<double> sorted;
    sorted.reserve(values_.size());
    for (const auto& v : values_) {
        sorted.push_back(*v);
    }
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

double interpolated_quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        throw std::invalid_argument("quantile of an empty range");
    }
    q = std::clamp(q, 0.0, 1.0);

    double position = q * static_cast<double>(sorted.size() - 1);
    auto lower = static_cast<std::size_t>(std::floor(position));
    std::size_t upper = std::min(lower + 1, sorted.size() - 1);
    double fraction = position - static_cast<double>(lower);

    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

}  // namespace flowguard
