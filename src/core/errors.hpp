#pragma once

#include <string>
#include <variant>
#include <vector>

namespace flowguard {

/// Required input columns are absent
struct SchemaError {
    std::vector<std::string> missing;
    std::vector<std::string> present;
};

/// Method argument is not a recognised detection method
struct InvalidMethodError {
    std::string value;
    std::vector<std::string> accepted;
};

/// The two fatal outcomes of anomaly detection
using DetectError = std::variant<SchemaError, InvalidMethodError>;

/// Human-readable rendering for logs and CLI output
[[nodiscard]] std::string describe(const SchemaError& error);
[[nodiscard]] std::string describe(const InvalidMethodError& error);
[[nodiscard]] std::string describe(const DetectError& error);

}  // namespace flowguard
