#pragma once

#include "analytics/anomaly_detector.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/status.hpp"
#include "input/reading_table.hpp"
#include "output/console_logger.hpp"
#include <boost/asio/thread_pool.hpp>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace flowguard {

/// Input file format
enum class InputFormat {
    Csv,
    Json
};

/// Pick a format from an explicit name or the file extension
[[nodiscard]] Result<InputFormat, std::string> resolve_format(
    const std::string& path,
    const std::optional<std::string>& format
);

/// Why an analysis produced no rows: a detector error, or a bad query
using AnalysisError = std::variant<DetectError, std::string>;

[[nodiscard]] std::string describe(const AnalysisError& error);

/// Runs one analysis: load, select, detect, report
/// Owns the worker pool when more than one thread is configured
class AnalysisEngine {
public:
    /// @param config Application configuration (validated by the caller)
    explicit AnalysisEngine(const Config& config);

    ~AnalysisEngine();

    // Non-copyable, non-movable
    AnalysisEngine(const AnalysisEngine&) = delete;
    AnalysisEngine& operator=(const AnalysisEngine&) = delete;

    /// Configure the default spdlog logger (async, colour, stderr)
    static void setup_logging(const std::string& level);

    /// Read a readings file
    [[nodiscard]] Result<ReadingTable, std::string> load(
        const std::string& path,
        const std::optional<std::string>& format = std::nullopt
    ) const;

    /// Apply the configured query and run the detector
    /// Each row's source_index refers to `readings`, not to the queried subset
    [[nodiscard]] Result<AnalysisTable, AnalysisError> analyze(const ReadingTable& readings);

    /// Build the JSON report for a finished analysis
    [[nodiscard]] nlohmann::json report(const AnalysisTable& rows) const;

    /// Full pipeline; writes the report to `output_path` or stdout
    /// A detector error is written there as an error document instead
    /// @return Process exit code
    int run(const std::string& input_path,
            const std::optional<std::string>& format,
            const std::optional<std::string>& output_path);

    /// Write `count` simulated readings as CSV to `output_path` or stdout
    /// @return Process exit code
    int simulate(std::size_t count,
                 std::uint32_t seed,
                 const std::optional<std::string>& output_path);

    [[nodiscard]] DetectorParams params() const;

private:
    [[nodiscard]] bool write_json(const nlohmann::json& document,
                                  const std::optional<std::string>& output_path);

    [[nodiscard]] bool write_text(const std::string& text,
                                  const std::optional<std::string>& output_path);

    const Config& config_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    output::ConsoleLogger console_;
};

}  // namespace flowguard
