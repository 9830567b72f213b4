#include "input/csv_reader.hpp"
#include <array>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace flowguard::input {

namespace {

using Record = std::vector<std::string>;

/// Split the whole document into records, honouring quotes
Result<std::vector<Record>, std::string> split_records(std::string_view text) {
    std::vector<Record> records;
    Record current;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;
    std::size_t line = 1;

    auto end_field = [&]() {
        current.push_back(std::move(field));
        field.clear();
        field_started = false;
    };
    auto end_record = [&]() {
        end_field();
        // A record consisting of one empty field is a blank line
        if (!(current.size() == 1 && current.front().empty())) {
            records.push_back(std::move(current));
        }
        current.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                field.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                if (field_started) {
                    return Result<std::vector<Record>, std::string>::Err(
                        "Unexpected quote inside unquoted field on line " + std::to_string(line));
                }
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                end_field();
                break;
            case '\r':
                break;
            case '\n':
                end_record();
                ++line;
                break;
            default:
                field.push_back(c);
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        return Result<std::vector<Record>, std::string>::Err(
            "Unterminated quoted field on line " + std::to_string(line));
    }
    if (field_started || !field.empty() || !current.empty()) {
        end_record();
    }

    return Result<std::vector<Record>, std::string>::Ok(std::move(records));
}

/// Shortest text that parses back to the same double
std::string format_number(double value) {
    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        return {};
    }
    return std::string(buf.data(), end);
}

std::string quote_if_needed(const std::string& text) {
    if (text.find_first_of(",\"\n\r") == std::string::npos) {
        return text;
    }
    std::string out = "\"";
    for (char c : text) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace

Result<ReadingTable, std::string> CsvReader::parse(std::string_view text) {
    auto split = split_records(text);
    if (split.is_err()) {
        return Result<ReadingTable, std::string>::Err(split.error());
    }
    auto records = std::move(split).take_value();

    if (records.empty()) {
        return Result<ReadingTable, std::string>::Err("CSV input has no header row");
    }

    ReadingTable table(records.front());
    const std::size_t width = table.columns().size();

    for (std::size_t r = 1; r < records.size(); ++r) {
        auto& record = records[r];
        if (record.size() > width) {
            return Result<ReadingTable, std::string>::Err(
                "CSV record " + std::to_string(r) + " has " + std::to_string(record.size()) +
                " fields, header has " + std::to_string(width));
        }

        ReadingTable::Row row;
        row.reserve(width);
        for (auto& field : record) {
            if (field.empty()) {
                row.emplace_back(std::monostate{});
            } else {
                row.emplace_back(std::move(field));
            }
        }
        table.add_row(std::move(row));
    }

    return Result<ReadingTable, std::string>::Ok(std::move(table));
}

Result<ReadingTable, std::string> CsvReader::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<ReadingTable, std::string>::Err("Failed to open input file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

std::string CsvReader::write(const ReadingTable& table) {
    std::ostringstream oss;

    const auto& columns = table.columns();
    for (std::size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) {
            oss << ',';
        }
        oss << quote_if_needed(columns[c]);
    }
    oss << '\n';

    for (const auto& row : table.rows()) {
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) {
                oss << ',';
            }
            // Missing cells are empty fields
            if (is_missing(row[c])) {
                continue;
            }
            if (const auto* number = std::get_if<double>(&row[c])) {
                oss << format_number(*number);
            } else {
                oss << quote_if_needed(std::get<std::string>(row[c]));
            }
        }
        oss << '\n';
    }

    return oss.str();
}

}  // namespace flowguard::input
