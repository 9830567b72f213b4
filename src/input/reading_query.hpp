#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include "input/reading_table.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace flowguard::input {

/// Selection of readings to analyse
struct ReadingQuery {
    std::optional<SensorId> sensor_id;  // exact match on the sensor column
    std::optional<UtcTime> since;       // inclusive lower bound
    std::size_t limit = 0;              // keep the N most recent rows, 0 = all
};

/// Build a query from textual options
/// @return Error when `since` is not a valid timestamp
[[nodiscard]] Result<ReadingQuery, std::string> make_query(
    const std::optional<SensorId>& sensor_id,
    const std::optional<std::string>& since,
    std::size_t limit
);

/// Indices of the rows a query keeps, in result order
///
/// Rows are filtered on sensor id and `since` (rows with no parseable
/// timestamp fail a `since` bound). With a limit, the result holds the
/// `limit` most recent rows, newest first, undatable rows last.
/// Without a limit the input order is kept.
[[nodiscard]] std::vector<std::size_t> select_rows(
    const ReadingTable& table,
    const ReadingQuery& query,
    const ColumnNames& columns = {}
);

/// New table with the same columns holding `indices` rows of `table`, in that order
[[nodiscard]] ReadingTable take_rows(const ReadingTable& table,
                                     const std::vector<std::size_t>& indices);

}  // namespace flowguard::input
