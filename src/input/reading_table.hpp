#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flowguard {

/// One input cell: missing, numeric, or text
using Cell = std::variant<std::monostate, double, std::string>;

/// Column-named table of dynamically typed cells
///
/// The shape collaborators hand to the detector. Rows are padded or
/// truncated to the column count on insertion.
class ReadingTable {
public:
    using Row = std::vector<Cell>;

    ReadingTable() = default;
    explicit ReadingTable(std::vector<std::string> columns);

    /// Append a row (missing trailing cells become std::monostate)
    void add_row(Row row);

    /// Add a column if not present; existing rows get a missing cell
    /// @return Index of the column
    std::size_t ensure_column(const std::string& name);

    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const;

    [[nodiscard]] bool has_column(std::string_view name) const {
        return column_index(name).has_value();
    }

    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::vector<Row>& rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t size() const noexcept { return rows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rows_.empty(); }

    [[nodiscard]] const Cell& at(std::size_t row, std::size_t column) const {
        return rows_.at(row).at(column);
    }

    friend bool operator==(const ReadingTable&, const ReadingTable&) = default;

private:
    std::vector<std::string> columns_;
    std::vector<Row> rows_;
};

/// True when the cell holds no value
[[nodiscard]] inline bool is_missing(const Cell& cell) noexcept {
    return std::holds_alternative<std::monostate>(cell);
}

}  // namespace flowguard
