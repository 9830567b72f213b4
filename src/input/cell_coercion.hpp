#pragma once

#include "core/types.hpp"
#include "input/reading_table.hpp"
#include <optional>

namespace flowguard::coerce {

/// Sensor id as text; numbers use their shortest decimal form
[[nodiscard]] std::optional<SensorId> to_sensor_id(const Cell& cell);

/// Finite number, or nullopt for missing / unparseable / NaN / infinite
[[nodiscard]] MaybeNumber to_number(const Cell& cell);

/// UTC instant from ISO-8601 text or epoch seconds
[[nodiscard]] std::optional<UtcTime> to_utc(const Cell& cell);

}  // namespace flowguard::coerce
