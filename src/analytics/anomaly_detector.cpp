#include "analytics/anomaly_detector.hpp"
#include "analytics/partition.hpp"
#include "analytics/rolling_window.hpp"
#include "input/cell_coercion.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <cctype>
#include <future>

namespace flowguard {

namespace {

const std::vector<std::string> kAcceptedMethods{"zscore", "iqr"};

std::string normalize(std::string_view name) {
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.front()))) {
        name.remove_prefix(1);
    }
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) {
        name.remove_suffix(1);
    }
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// Typed copy of every input row, in input order
AnalysisTable coerce_rows(const ReadingTable& readings, const ColumnNames& columns, Method method) {
    const std::size_t sensor_col = *readings.column_index(columns.sensor_id);
    const std::size_t value_col = *readings.column_index(columns.value);
    const std::size_t ts_col = *readings.column_index(columns.timestamp);

    AnalysisTable rows;
    rows.reserve(readings.size());

    for (std::size_t i = 0; i < readings.size(); ++i) {
        const auto& cells = readings.rows()[i];

        AnalysisRow row;
        row.source_index = i;
        row.sensor_id = coerce::to_sensor_id(cells[sensor_col]);
        row.value = coerce::to_number(cells[value_col]);
        row.timestamp = coerce::to_utc(cells[ts_col]);
        row.method = method;
        rows.push_back(std::move(row));
    }

    return rows;
}

/// Slide the window over one sensor and write its rows to out[0..n)
void evaluate_partition(
    const Partition& partition,
    const AnalysisTable& coerced,
    std::size_t window,
    const DetectionStrategy& strategy,
    AnalysisRow* out
) {
    RollingWindow rolling(window);

    for (std::size_t pos = 0; pos < partition.rows.size(); ++pos) {
        AnalysisRow row = coerced[partition.rows[pos]];

        // Rows without a sensor id belong to no series
        if (partition.sensor_id) {
            rolling.push(row.value);
            if (rolling.complete()) {
                strategy.evaluate(rolling, *row.value, row);
            }
        }

        out[pos] = std::move(row);
    }
}

}  // namespace

Result<Method, InvalidMethodError> parse_method(std::string_view name) {
    auto key = normalize(name);
    if (key == method_name(Method::ZScore)) {
        return Result<Method, InvalidMethodError>::Ok(Method::ZScore);
    }
    if (key == method_name(Method::Iqr)) {
        return Result<Method, InvalidMethodError>::Ok(Method::Iqr);
    }
    return Result<Method, InvalidMethodError>::Err(
        InvalidMethodError{std::string(name), kAcceptedMethods});
}

std::optional<SchemaError> check_schema(const ReadingTable& readings, const ColumnNames& columns) {
    SchemaError error;
    for (const auto* name : {&columns.sensor_id, &columns.value, &columns.timestamp}) {
        if (!readings.has_column(*name)) {
            error.missing.push_back(*name);
        }
    }
    if (error.missing.empty()) {
        return std::nullopt;
    }
    error.present = readings.columns();
    return error;
}

Result<AnomalyDetector, InvalidMethodError> AnomalyDetector::create(
    const DetectorParams& params,
    ColumnNames columns
) {
    auto method = parse_method(params.method);
    if (method.is_err()) {
        return Result<AnomalyDetector, InvalidMethodError>::Err(method.error());
    }

    return Result<AnomalyDetector, InvalidMethodError>::Ok(AnomalyDetector(
        params.window,
        make_strategy(method.value(), params.z_threshold, params.iqr_k),
        std::move(columns)
    ));
}

AnomalyDetector::AnomalyDetector(
    std::size_t window,
    std::shared_ptr<const DetectionStrategy> strategy,
    ColumnNames columns
)
    : window_(window)
    , strategy_(std::move(strategy))
    , columns_(std::move(columns))
{}

Result<AnalysisTable, DetectError> AnomalyDetector::detect(const ReadingTable& readings) const {
    if (auto schema_error = check_schema(readings, columns_)) {
        return Result<AnalysisTable, DetectError>::Err(*schema_error);
    }

    auto coerced = coerce_rows(readings, columns_, strategy_->method());
    auto partitions = partition_by_sensor(coerced);

    AnalysisTable out(coerced.size());
    std::size_t offset = 0;
    for (const auto& partition : partitions) {
        evaluate_partition(partition, coerced, window_, *strategy_, out.data() + offset);
        offset += partition.rows.size();
    }

    return Result<AnalysisTable, DetectError>::Ok(std::move(out));
}

Result<AnalysisTable, DetectError> AnomalyDetector::detect(
    const ReadingTable& readings,
    boost::asio::thread_pool& pool
) const {
    if (auto schema_error = check_schema(readings, columns_)) {
        return Result<AnalysisTable, DetectError>::Err(*schema_error);
    }

    auto coerced = coerce_rows(readings, columns_, strategy_->method());
    auto partitions = partition_by_sensor(coerced);

    // Each task owns a disjoint slice of `out`
    AnalysisTable out(coerced.size());
    std::vector<std::future<void>> pending;
    pending.reserve(partitions.size());

    std::size_t offset = 0;
    for (const auto& partition : partitions) {
        AnalysisRow* dest = out.data() + offset;
        auto task = std::make_shared<std::packaged_task<void()>>(
            [this, &partition, &coerced, dest]() {
                evaluate_partition(partition, coerced, window_, *strategy_, dest);
            });
        pending.push_back(task->get_future());
        boost::asio::post(pool, [task]() { (*task)(); });
        offset += partition.rows.size();
    }

    // Wait for every task before get() can rethrow, so no task outlives the locals
    for (auto& f : pending) {
        f.wait();
    }
    for (auto& f : pending) {
        f.get();
    }

    return Result<AnalysisTable, DetectError>::Ok(std::move(out));
}

Result<AnalysisTable, DetectError> detect_anomalies(
    const ReadingTable& readings,
    const DetectorParams& params,
    const ColumnNames& columns
) {
    if (auto schema_error = check_schema(readings, columns)) {
        return Result<AnalysisTable, DetectError>::Err(*schema_error);
    }

    auto detector = AnomalyDetector::create(params, columns);
    if (detector.is_err()) {
        return Result<AnalysisTable, DetectError>::Err(detector.error());
    }
    return detector.value().detect(readings);
}

}  // namespace flowguard
