#include "output/json_formatter.hpp"
#include "core/timestamp.hpp"
#include <type_traits>
#include <variant>

namespace flowguard::output {

namespace {

nlohmann::json number_or_null(const MaybeNumber& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

}  // namespace

nlohmann::json JsonFormatter::format_row(const AnalysisRow& row) {
    return nlohmann::json{
        {"sensor_id", row.sensor_id ? nlohmann::json(*row.sensor_id) : nlohmann::json(nullptr)},
        {"timestamp", row.timestamp
            ? nlohmann::json(timestamp::format_iso8601(*row.timestamp))
            : nlohmann::json(nullptr)},
        {"value", number_or_null(row.value)},
        {"rolling_mean", number_or_null(row.rolling_mean)},
        {"rolling_std", number_or_null(row.rolling_std)},
        {"rolling_low", number_or_null(row.rolling_low)},
        {"rolling_high", number_or_null(row.rolling_high)},
        {"zscore", number_or_null(row.zscore)},
        {"is_anomaly", row.is_anomaly},
        {"method", std::string(method_name(row.method))},
        {"source_index", row.source_index}
    };
}

nlohmann::json JsonFormatter::format_rows(const AnalysisTable& rows) {
    auto out = nlohmann::json::array();
    for (const auto& row : rows) {
        out.push_back(format_row(row));
    }
    return out;
}

nlohmann::json JsonFormatter::format_summary(const std::vector<SensorSummary>& summary) {
    auto out = nlohmann::json::array();
    for (const auto& s : summary) {
        out.push_back({
            {"sensor_id", s.sensor_id ? nlohmann::json(*s.sensor_id) : nlohmann::json(nullptr)},
            {"total", s.total},
            {"anomalies", s.anomalies}
        });
    }
    return out;
}

nlohmann::json JsonFormatter::format_params(const DetectorParams& params) {
    return nlohmann::json{
        {"window", params.window},
        {"method", params.method},
        {"z_threshold", params.z_threshold},
        {"iqr_k", params.iqr_k}
    };
}

nlohmann::json JsonFormatter::format_report(
    const DetectorParams& params,
    const AnalysisTable& rows,
    bool alerts_only,
    std::size_t alert_limit
) {
    nlohmann::json report{
        {"type", "analysis"},
        {"generated_at", timestamp::now_iso8601()},
        {"params", format_params(params)},
        {"summary", format_summary(summarize_by_sensor(rows))}
    };

    if (alerts_only) {
        report["alerts"] = format_rows(select_alerts(rows, alert_limit));
    } else {
        report["rows"] = format_rows(rows);
    }
    return report;
}

nlohmann::json JsonFormatter::format_error(const DetectError& error) {
    return std::visit([](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, SchemaError>) {
            return {
                {"type", "error"},
                {"kind", "schema"},
                {"missing", e.missing},
                {"present", e.present},
                {"message", describe(e)}
            };
        } else {
            return {
                {"type", "error"},
                {"kind", "invalid_method"},
                {"value", e.value},
                {"accepted", e.accepted},
                {"message", describe(e)}
            };
        }
    }, error);
}

}  // namespace flowguard::output
