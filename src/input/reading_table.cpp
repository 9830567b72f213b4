#include "input/reading_table.hpp"
#include <algorithm>
#include <iterator>

namespace flowguard {

ReadingTable::ReadingTable(std::vector<std::string> columns)
    : columns_(std::move(columns))
{}

void ReadingTable::add_row(Row row) {
    row.resize(columns_.size());
    rows_.push_back(std::move(row));
}

std::size_t ReadingTable::ensure_column(const std::string& name) {
    if (auto idx = column_index(name)) {
        return *idx;
    }
    columns_.push_back(name);
    for (auto& row : rows_) {
        row.emplace_back(std::monostate{});
    }
    return columns_.size() - 1;
}

std::optional<std::size_t> ReadingTable::column_index(std::string_view name) const {
    auto it = std::find(columns_.begin(), columns_.end(), name);
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(columns_.begin(), it));
}

}  // namespace flowguard
