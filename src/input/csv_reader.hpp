#pragma once

#include "core/status.hpp"
#include "input/reading_table.hpp"
#include <string>
#include <string_view>

namespace flowguard::input {

/// Reader for comma-separated reading exports
/// First record is the header; every other cell is kept as text and
/// coerced later by the detector. Empty fields become missing cells.
class CsvReader {
public:
    /// Parse CSV text
    /// Supports quoted fields with embedded separators, newlines and "" escapes
    [[nodiscard]] static Result<ReadingTable, std::string> parse(std::string_view text);

    /// Read and parse a CSV file
    [[nodiscard]] static Result<ReadingTable, std::string> read_file(const std::string& path);

    /// Render a table as CSV (numbers in shortest round-trip form)
    [[nodiscard]] static std::string write(const ReadingTable& table);
};

}  // namespace flowguard::input
