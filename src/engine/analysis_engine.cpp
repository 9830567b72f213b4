#include "engine/analysis_engine.hpp"
#include "analytics/summary.hpp"
#include "input/csv_reader.hpp"
#include "input/json_reader.hpp"
#include "input/reading_query.hpp"
#include "output/json_formatter.hpp"
#include "sim/reading_generator.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace flowguard {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

}  // namespace

std::string describe(const AnalysisError& error) {
    if (const auto* detect = std::get_if<DetectError>(&error)) {
        return describe(*detect);
    }
    return std::get<std::string>(error);
}

Result<InputFormat, std::string> resolve_format(
    const std::string& path,
    const std::optional<std::string>& format
) {
    std::string name = format ? lower(*format)
                              : lower(std::filesystem::path(path).extension().string());
    if (!name.empty() && name.front() == '.') {
        name.erase(0, 1);
    }

    if (name == "csv") {
        return Result<InputFormat, std::string>::Ok(InputFormat::Csv);
    }
    if (name == "json") {
        return Result<InputFormat, std::string>::Ok(InputFormat::Json);
    }
    return Result<InputFormat, std::string>::Err(
        "Cannot determine input format for '" + path + "' (use --format csv|json)");
}

AnalysisEngine::AnalysisEngine(const Config& config)
    : config_(config)
{
    if (config_.detector.threads > 1) {
        pool_ = std::make_unique<boost::asio::thread_pool>(config_.detector.threads);
    }
}

AnalysisEngine::~AnalysisEngine() {
    if (pool_) {
        pool_->join();
    }
}

void AnalysisEngine::setup_logging(const std::string& level) {
    // Async so report writing never waits on the terminal
    spdlog::init_thread_pool(8192, 1);

    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        "flowguard",
        stderr_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

DetectorParams AnalysisEngine::params() const {
    return DetectorParams{
        .window = config_.detector.window,
        .method = config_.detector.method,
        .z_threshold = config_.detector.z_threshold,
        .iqr_k = config_.detector.iqr_k
    };
}

Result<ReadingTable, std::string> AnalysisEngine::load(
    const std::string& path,
    const std::optional<std::string>& format
) const {
    auto resolved = resolve_format(path, format);
    if (resolved.is_err()) {
        return Result<ReadingTable, std::string>::Err(resolved.error());
    }

    if (resolved.value() == InputFormat::Csv) {
        return input::CsvReader::read_file(path);
    }
    return input::JsonReader::read_file(path);
}

Result<AnalysisTable, AnalysisError> AnalysisEngine::analyze(const ReadingTable& readings) {
    using AnalysisResult = Result<AnalysisTable, AnalysisError>;

    auto query = input::make_query(config_.query.sensor_id, config_.query.since, config_.query.limit);
    if (query.is_err()) {
        return AnalysisResult::Err(query.error());
    }

    auto kept = input::select_rows(readings, query.value(), config_.columns);
    auto selected = input::take_rows(readings, kept);
    if (selected.size() != readings.size()) {
        spdlog::debug("Query kept {} of {} readings", selected.size(), readings.size());
    }

    auto detector = AnomalyDetector::create(params(), config_.columns);
    if (detector.is_err()) {
        return AnalysisResult::Err(detector.error());
    }

    console_.log_run(params(), selected.size(), config_.detector.threads);

    auto result = pool_ ? detector.value().detect(selected, *pool_)
                        : detector.value().detect(selected);
    if (result.is_err()) {
        return AnalysisResult::Err(result.error());
    }

    auto rows = std::move(result).take_value();
    for (auto& row : rows) {
        row.source_index = kept[row.source_index];
    }
    return AnalysisResult::Ok(std::move(rows));
}

nlohmann::json AnalysisEngine::report(const AnalysisTable& rows) const {
    return output::JsonFormatter::format_report(
        params(), rows, config_.output.alerts_only, config_.output.alert_limit);
}

int AnalysisEngine::run(
    const std::string& input_path,
    const std::optional<std::string>& format,
    const std::optional<std::string>& output_path
) {
    spdlog::info("Loading readings from {}", input_path);

    auto table = load(input_path, format);
    if (table.is_err()) {
        console_.log_error(table.error());
        return 1;
    }

    auto rows = analyze(table.value());
    if (rows.is_err()) {
        const auto& error = rows.error();
        console_.log_error(describe(error));
        if (const auto* detect = std::get_if<DetectError>(&error)) {
            if (!write_json(output::JsonFormatter::format_error(*detect), output_path)) {
                spdlog::warn("Error document was not written");
            }
        }
        return 1;
    }

    console_.log_summary(summarize_by_sensor(rows.value()));
    console_.log_alerts(rows.value());

    if (!write_json(report(rows.value()), output_path)) {
        return 1;
    }

    spdlog::info("Analysis complete");
    return 0;
}

int AnalysisEngine::simulate(
    std::size_t count,
    std::uint32_t seed,
    const std::optional<std::string>& output_path
) {
    sim::GeneratorConfig gen_config;
    gen_config.seed = seed;
    sim::ReadingGenerator generator(gen_config);

    auto table = generator.generate(count, config_.columns);
    spdlog::info("Simulated {} readings ({} spikes)", table.size(), generator.spike_count());

    return write_text(input::CsvReader::write(table), output_path) ? 0 : 1;
}

bool AnalysisEngine::write_json(
    const nlohmann::json& document,
    const std::optional<std::string>& output_path
) {
    int indent = config_.output.pretty ? 2 : -1;
    return write_text(document.dump(indent) + "\n", output_path);
}

bool AnalysisEngine::write_text(
    const std::string& text,
    const std::optional<std::string>& output_path
) {
    if (!output_path) {
        std::cout << text;
        std::cout.flush();
        return true;
    }

    std::ofstream file(*output_path);
    if (!file.is_open()) {
        console_.log_error("Failed to open output file: " + *output_path);
        return false;
    }
    file << text;
    if (!file) {
        console_.log_error("Failed to write output file: " + *output_path);
        return false;
    }
    spdlog::info("Wrote {}", *output_path);
    return true;
}

}  // namespace flowguard
