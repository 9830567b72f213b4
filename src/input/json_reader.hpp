#pragma once

#include "core/status.hpp"
#include "input/reading_table.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace flowguard::input {

/// Reader for JSON reading exports
///
/// Accepts either a top-level array of objects or an object wrapping the
/// array under "items". Columns are the union of object keys, appended as
/// they are first met (keys within one object in nlohmann's key order).
/// Numbers and booleans become numeric cells, strings stay text,
/// null becomes a missing cell and nested values keep their JSON text.
class JsonReader {
public:
    [[nodiscard]] static Result<ReadingTable, std::string> parse(std::string_view json);

    [[nodiscard]] static Result<ReadingTable, std::string> from_json(const nlohmann::json& document);

    [[nodiscard]] static Result<ReadingTable, std::string> read_file(const std::string& path);
};

}  // namespace flowguard::input
