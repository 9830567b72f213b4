#include "input/json_reader.hpp"
#include <fstream>
#include <sstream>

namespace flowguard::input {

using json = nlohmann::json;

namespace {

Cell to_cell(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return std::monostate{};
        case json::value_t::boolean:
            return value.get<bool>() ? 1.0 : 0.0;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return value.get<double>();
        case json::value_t::string:
            return value.get<std::string>();
        default:
            return value.dump();
    }
}

}  // namespace

Result<ReadingTable, std::string> JsonReader::from_json(const json& document) {
    const json* items = &document;
    if (document.is_object() && document.contains("items")) {
        items = &document["items"];
    }

    if (!items->is_array()) {
        return Result<ReadingTable, std::string>::Err(
            std::string("Unexpected JSON payload: expected an array of readings, got ") +
            document.type_name());
    }

    ReadingTable table;
    std::size_t index = 0;
    for (const auto& item : *items) {
        if (!item.is_object()) {
            return Result<ReadingTable, std::string>::Err(
                "Reading " + std::to_string(index) + " is not a JSON object");
        }

        for (const auto& entry : item.items()) {
            table.ensure_column(entry.key());
        }

        ReadingTable::Row row(table.columns().size());
        for (const auto& entry : item.items()) {
            row[*table.column_index(entry.key())] = to_cell(entry.value());
        }
        table.add_row(std::move(row));
        ++index;
    }

    return Result<ReadingTable, std::string>::Ok(std::move(table));
}

Result<ReadingTable, std::string> JsonReader::parse(std::string_view json_str) {
    try {
        return from_json(json::parse(json_str));
    } catch (const json::exception& e) {
        return Result<ReadingTable, std::string>::Err(
            std::string("JSON parse error: ") + e.what()
        );
    }
}

Result<ReadingTable, std::string> JsonReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<ReadingTable, std::string>::Err("Failed to open input file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

}  // namespace flowguard::input
