#include "core/errors.hpp"
#include <sstream>

namespace flowguard {

namespace {

std::string join(const std::vector<std::string>& names) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << '\'' << names[i] << '\'';
    }
    oss << ']';
    return oss.str();
}

}  // namespace

std::string describe(const SchemaError& error) {
    return "Input is missing required columns: " + join(error.missing) +
           ". Columns received: " + join(error.present);
}

std::string describe(const InvalidMethodError& error) {
    return "Invalid method '" + error.value + "'. Use one of " + join(error.accepted);
}

std::string describe(const DetectError& error) {
    return std::visit([](const auto& e) { return describe(e); }, error);
}

}  // namespace flowguard
