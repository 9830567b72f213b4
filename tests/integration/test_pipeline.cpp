#include <gtest/gtest.h>

#include "analytics/anomaly_detector.hpp"
#include "analytics/summary.hpp"
#include "core/config.hpp"
#include "engine/analysis_engine.hpp"
#include "input/cell_coercion.hpp"
#include "input/csv_reader.hpp"
#include "input/json_reader.hpp"
#include "input/reading_query.hpp"
#include "output/json_formatter.hpp"
#include "sim/reading_generator.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

using namespace flowguard;

namespace {

std::string read_all(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

// ============================================================================
// Pipeline Integration Tests
// ============================================================================

class PipelineIntegrationTest : public ::testing::Test {
protected:
    static constexpr std::size_t kReadings = 600;

    std::string input_path = "pipeline_input_temp.csv";
    std::string output_path = "pipeline_output_temp.json";

    void TearDown() override {
        std::remove(input_path.c_str());
        std::remove(output_path.c_str());
    }

    /// Simulated feed with a guaranteed spike on one meter
    ReadingTable make_feed() {
        sim::GeneratorConfig config;
        config.spike_probability = 0.0;
        config.flow_min = 14.0;
        config.flow_max = 16.0;
        sim::ReadingGenerator generator(config);

        auto table = generator.generate(kReadings);
        table.add_row({std::string("SETOR-A-01"), 90.0, std::string("2025-11-03T00:00:00Z"),
                       2.0, 20.0});
        return table;
    }
};

TEST_F(PipelineIntegrationTest, CsvRoundTripThroughDetector) {
    auto feed = make_feed();

    // Act: CSV text -> table -> detector
    auto parsed = input::CsvReader::parse(input::CsvReader::write(feed));
    ASSERT_TRUE(parsed.is_ok());

    auto result = detect_anomalies(parsed.value(), DetectorParams{.window = 20});
    ASSERT_TRUE(result.is_ok());
    const auto& rows = result.value();

    // Assert: every reading comes back, grouped by meter
    ASSERT_EQ(rows.size(), kReadings + 1);
    auto summary = summarize_by_sensor(rows);
    ASSERT_EQ(summary.size(), 3u);
    EXPECT_EQ(summary[0].sensor_id, "SETOR-A-01");
    EXPECT_EQ(summary[1].sensor_id, "SETOR-A-02");
    EXPECT_EQ(summary[2].sensor_id, "SETOR-B-01");

    std::size_t total = 0;
    for (const auto& s : summary) {
        total += s.total;
    }
    EXPECT_EQ(total, kReadings + 1);

    // The injected reading is the newest of its meter and stands out
    auto alerts = select_alerts(rows, 1);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].sensor_id, "SETOR-A-01");
    EXPECT_DOUBLE_EQ(*alerts[0].value, 90.0);
}

TEST_F(PipelineIntegrationTest, QueryNarrowsDetectorInput) {
    auto feed = make_feed();

    auto query = input::make_query(std::string("SETOR-B-01"), std::nullopt, 50);
    ASSERT_TRUE(query.is_ok());
    auto selected = input::take_rows(feed, input::select_rows(feed, query.value()));

    ASSERT_EQ(selected.size(), 50u);

    auto result = detect_anomalies(selected, DetectorParams{.window = 10, .method = "iqr"});
    ASSERT_TRUE(result.is_ok());

    const auto& rows = result.value();
    ASSERT_EQ(rows.size(), 50u);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i].sensor_id, "SETOR-B-01");
        if (i > 0) {
            EXPECT_LE(*rows[i - 1].timestamp, *rows[i].timestamp);
        }
    }
    EXPECT_TRUE(rows[9].rolling_low.has_value());
    EXPECT_FALSE(rows[8].rolling_low.has_value());
}

TEST_F(PipelineIntegrationTest, JsonFeedWithCustomColumns) {
    auto document = R"({"items": [
        {"meter_code": "M1", "flow_lpm": 10.0, "ts": "2025-11-02T16:00:00Z"},
        {"meter_code": "M1", "flow_lpm": 10.2, "ts": "2025-11-02T16:00:10Z"},
        {"meter_code": "M1", "flow_lpm": 9.8,  "ts": "2025-11-02T16:00:05Z"},
        {"meter_code": "M1", "flow_lpm": 60.0, "ts": "2025-11-02T16:00:15Z"}
    ]})";

    auto table = input::JsonReader::parse(document);
    ASSERT_TRUE(table.is_ok());

    ColumnNames columns{"meter_code", "flow_lpm", "ts"};
    auto result = detect_anomalies(table.value(), DetectorParams{.window = 4, .z_threshold = 1.5},
                                   columns);
    ASSERT_TRUE(result.is_ok());

    const auto& rows = result.value();
    ASSERT_EQ(rows.size(), 4u);
    EXPECT_DOUBLE_EQ(*rows[1].value, 9.8);
    EXPECT_TRUE(rows[3].is_anomaly);

    auto report = output::JsonFormatter::format_report(DetectorParams{.window = 4}, rows, true, 0);
    ASSERT_EQ(report["alerts"].size(), 1u);
    EXPECT_EQ(report["alerts"][0]["timestamp"], "2025-11-02T16:00:15Z");
}

TEST_F(PipelineIntegrationTest, EngineWritesReport) {
    {
        std::ofstream file(input_path);
        file << input::CsvReader::write(make_feed());
    }

    auto config = Config::defaults();
    config.detector.threads = 3;
    config.output.alerts_only = true;

    AnalysisEngine engine(config);
    int exit_code = engine.run(input_path, std::nullopt, output_path);

    ASSERT_EQ(exit_code, 0);
    auto report = nlohmann::json::parse(read_all(output_path));
    EXPECT_EQ(report["type"], "analysis");
    EXPECT_EQ(report["params"]["window"], 20);
    ASSERT_TRUE(report.contains("alerts"));
    ASSERT_FALSE(report["alerts"].empty());
    EXPECT_DOUBLE_EQ(report["alerts"][0]["value"].get<double>(), 90.0);
}

TEST_F(PipelineIntegrationTest, EngineAppliesQueryFromConfig) {
    auto config = Config::defaults();
    config.query.sensor_id = "SETOR-A-02";
    config.query.limit = 25;

    AnalysisEngine engine(config);
    auto rows = engine.analyze(make_feed());

    ASSERT_TRUE(rows.is_ok());
    EXPECT_EQ(rows.value().size(), 25u);
    for (const auto& row : rows.value()) {
        EXPECT_EQ(row.sensor_id, "SETOR-A-02");
    }
}

TEST_F(PipelineIntegrationTest, EngineReportsDetectorErrors) {
    auto config = Config::defaults();
    config.detector.method = "bogus";
    AnalysisEngine engine(config);

    auto bad_method = engine.analyze(make_feed());
    ASSERT_TRUE(bad_method.is_err());
    ASSERT_TRUE(std::holds_alternative<DetectError>(bad_method.error()));
    EXPECT_NE(describe(bad_method.error()).find("Invalid method 'bogus'"), std::string::npos);

    auto schema = AnalysisEngine(Config::defaults()).analyze(ReadingTable({"sensor_id"}));
    ASSERT_TRUE(schema.is_err());
    const auto& detect = std::get<DetectError>(schema.error());
    ASSERT_TRUE(std::holds_alternative<SchemaError>(detect));
    EXPECT_EQ(std::get<SchemaError>(detect).missing,
              (std::vector<std::string>{"value", "timestamp"}));
}

TEST_F(PipelineIntegrationTest, EngineWritesErrorDocumentForBadMethod) {
    {
        std::ofstream file(input_path);
        file << input::CsvReader::write(make_feed());
    }

    auto config = Config::defaults();
    config.detector.method = "bogus";
    AnalysisEngine engine(config);

    ASSERT_EQ(engine.run(input_path, std::nullopt, output_path), 1);

    auto document = nlohmann::json::parse(read_all(output_path));
    EXPECT_EQ(document["type"], "error");
    EXPECT_EQ(document["kind"], "invalid_method");
    EXPECT_EQ(document["value"], "bogus");
    EXPECT_EQ(document["accepted"], nlohmann::json::array({"zscore", "iqr"}));
}

TEST_F(PipelineIntegrationTest, EngineWritesErrorDocumentForMissingColumn) {
    {
        std::ofstream file(input_path);
        file << "sensor_id,timestamp\nA,2025-11-02T16:00:00Z\n";
    }

    AnalysisEngine engine(Config::defaults());

    ASSERT_EQ(engine.run(input_path, std::nullopt, output_path), 1);

    auto document = nlohmann::json::parse(read_all(output_path));
    EXPECT_EQ(document["type"], "error");
    EXPECT_EQ(document["kind"], "schema");
    EXPECT_EQ(document["missing"], nlohmann::json::array({"value"}));
    EXPECT_EQ(document["present"], nlohmann::json::array({"sensor_id", "timestamp"}));
}

TEST_F(PipelineIntegrationTest, SourceIndexRefersToInputAfterQuery) {
    ReadingTable feed({"sensor_id", "value", "timestamp"});
    for (int i = 0; i < 6; ++i) {
        feed.add_row({std::string(i % 2 == 0 ? "A" : "B"), static_cast<double>(i + 1),
                      "2025-11-02T16:00:0" + std::to_string(i) + "Z"});
    }
    {
        std::ofstream file(input_path);
        file << input::CsvReader::write(feed);
    }

    auto config = Config::defaults();
    config.detector.window = 2;
    config.query.sensor_id = "B";
    config.query.limit = 2;
    AnalysisEngine engine(config);

    ASSERT_EQ(engine.run(input_path, std::nullopt, output_path), 0);

    auto input = input::CsvReader::read_file(input_path);
    ASSERT_TRUE(input.is_ok());
    auto report = nlohmann::json::parse(read_all(output_path));
    const auto& rows = report["rows"];

    // B rows sit at input positions 1, 3, 5; the limit keeps the newest two
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["source_index"], 3);
    EXPECT_EQ(rows[1]["source_index"], 5);
    for (const auto& row : rows) {
        auto index = row["source_index"].get<std::size_t>();
        auto value = coerce::to_number(input.value().at(index, 1));
        ASSERT_TRUE(value.has_value());
        EXPECT_DOUBLE_EQ(*value, row["value"].get<double>());
    }
}

TEST_F(PipelineIntegrationTest, EngineRejectsBadSince) {
    auto config = Config::defaults();
    config.query.since = "not-a-time";
    AnalysisEngine engine(config);

    auto rows = engine.analyze(make_feed());

    ASSERT_TRUE(rows.is_err());
    ASSERT_TRUE(std::holds_alternative<std::string>(rows.error()));
    EXPECT_NE(describe(rows.error()).find("since"), std::string::npos);
}

TEST_F(PipelineIntegrationTest, EngineLoadChecksFormat) {
    AnalysisEngine engine(Config::defaults());

    auto unknown = engine.load("readings.txt");
    ASSERT_TRUE(unknown.is_err());
    EXPECT_NE(unknown.error().find("--format"), std::string::npos);

    EXPECT_EQ(resolve_format("readings.CSV", std::nullopt).value(), InputFormat::Csv);
    EXPECT_EQ(resolve_format("readings.txt", std::string("json")).value(), InputFormat::Json);
}

TEST_F(PipelineIntegrationTest, EngineSimulateWritesCsv) {
    AnalysisEngine engine(Config::defaults());

    ASSERT_EQ(engine.simulate(30, 42, input_path), 0);

    auto table = input::CsvReader::read_file(input_path);
    ASSERT_TRUE(table.is_ok());
    EXPECT_EQ(table.value().size(), 30u);
    EXPECT_TRUE(table.value().has_column("sensor_id"));
}

TEST_F(PipelineIntegrationTest, EngineRunFailsOnMissingInput) {
    AnalysisEngine engine(Config::defaults());

    EXPECT_EQ(engine.run("does_not_exist.csv", std::nullopt, output_path), 1);
}
