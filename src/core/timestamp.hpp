#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace flowguard::timestamp {

/// Parse an ISO-8601 date or date-time into a UTC instant
///
/// Accepted: YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]]][Z|(+|-)HH[:MM]|(+|-)HHMM]
/// Values without an offset are taken as UTC. Fractions are truncated
/// to milliseconds. Surrounding whitespace is ignored.
/// @return nullopt for anything that is not a valid calendar instant
[[nodiscard]] std::optional<UtcTime> parse(std::string_view text);

/// Convert Unix epoch seconds (fractional allowed) to a UTC instant
/// @return nullopt for NaN, infinities, or values outside +/- 10^11 s
[[nodiscard]] std::optional<UtcTime> from_epoch_seconds(double seconds);

/// Format as YYYY-MM-DDTHH:MM:SSZ
[[nodiscard]] std::string format_iso8601(UtcTime time);

/// Current wall-clock time as YYYY-MM-DDTHH:MM:SS.mmmZ
[[nodiscard]] std::string now_iso8601();

}  // namespace flowguard::timestamp
