#include "input/reading_query.hpp"
#include "core/timestamp.hpp"
#include "input/cell_coercion.hpp"
#include <algorithm>
#include <vector>

namespace flowguard::input {

Result<ReadingQuery, std::string> make_query(
    const std::optional<SensorId>& sensor_id,
    const std::optional<std::string>& since,
    std::size_t limit
) {
    ReadingQuery query;
    query.sensor_id = sensor_id;
    query.limit = limit;

    if (since) {
        auto parsed = timestamp::parse(*since);
        if (!parsed) {
            return Result<ReadingQuery, std::string>::Err("Invalid 'since' timestamp: " + *since);
        }
        query.since = *parsed;
    }

    return Result<ReadingQuery, std::string>::Ok(std::move(query));
}

std::vector<std::size_t> select_rows(
    const ReadingTable& table,
    const ReadingQuery& query,
    const ColumnNames& columns
) {
    // A filter on an absent column is skipped; the detector reports the schema problem
    auto sensor_col = table.column_index(columns.sensor_id);
    auto ts_col = table.column_index(columns.timestamp);

    struct Selected {
        std::size_t index;
        std::optional<UtcTime> ts;
    };
    std::vector<Selected> selected;
    selected.reserve(table.size());

    for (std::size_t i = 0; i < table.size(); ++i) {
        const auto& row = table.rows()[i];

        if (query.sensor_id && sensor_col) {
            auto id = coerce::to_sensor_id(row[*sensor_col]);
            if (!id || *id != *query.sensor_id) {
                continue;
            }
        }

        std::optional<UtcTime> ts;
        if (ts_col) {
            ts = coerce::to_utc(row[*ts_col]);
        }
        if (query.since && ts_col && (!ts || *ts < *query.since)) {
            continue;
        }

        selected.push_back(Selected{i, ts});
    }

    if (query.limit > 0) {
        std::stable_sort(selected.begin(), selected.end(), [](const Selected& a, const Selected& b) {
            if (!a.ts) {
                return false;
            }
            return !b.ts || *a.ts > *b.ts;
        });
        if (selected.size() > query.limit) {
            selected.resize(query.limit);
        }
    }

    std::vector<std::size_t> indices;
    indices.reserve(selected.size());
    for (const auto& s : selected) {
        indices.push_back(s.index);
    }
    return indices;
}

ReadingTable take_rows(const ReadingTable& table, const std::vector<std::size_t>& indices) {
    ReadingTable result(table.columns());
    for (std::size_t index : indices) {
        result.add_row(table.rows().at(index));
    }
    return result;
}

}  // namespace flowguard::input
