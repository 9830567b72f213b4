#include "input/cell_coercion.hpp"
#include "core/timestamp.hpp"
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <string_view>
#include <system_error>

namespace flowguard::coerce {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

MaybeNumber finite_or_missing(double value) {
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

MaybeNumber parse_number(std::string_view text) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return finite_or_missing(value);
}

}  // namespace

std::optional<SensorId> to_sensor_id(const Cell& cell) {
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return *text;
    }
    if (const auto* number = std::get_if<double>(&cell)) {
        if (std::isnan(*number)) {
            return std::nullopt;
        }
        std::array<char, 64> buf{};
        auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), *number);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
        return SensorId(buf.data(), end);
    }
    return std::nullopt;
}

MaybeNumber to_number(const Cell& cell) {
    if (const auto* number = std::get_if<double>(&cell)) {
        return finite_or_missing(*number);
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return parse_number(*text);
    }
    return std::nullopt;
}

std::optional<UtcTime> to_utc(const Cell& cell) {
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return timestamp::parse(*text);
    }
    if (const auto* number = std::get_if<double>(&cell)) {
        return timestamp::from_epoch_seconds(*number);
    }
    return std::nullopt;
}

}  // namespace flowguard::coerce
