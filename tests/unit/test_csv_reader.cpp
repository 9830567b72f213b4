#include <gtest/gtest.h>
#include "input/csv_reader.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace flowguard;
using namespace flowguard::input;

namespace {

std::string text_at(const ReadingTable& table, std::size_t row, std::size_t col) {
    const auto* text = std::get_if<std::string>(&table.at(row, col));
    return text ? *text : std::string("<not text>");
}

}  // namespace

TEST(CsvReaderTest, ParsesHeaderAndRows) {
    auto result = CsvReader::parse(
        "sensor_id,value,timestamp\n"
        "A,10.5,2025-11-02T16:00:00Z\n"
        "B,5,2025-11-02T16:00:05Z\n");

    ASSERT_TRUE(result.is_ok());
    const auto& table = result.value();

    ASSERT_EQ(table.columns().size(), 3u);
    EXPECT_EQ(table.columns()[1], "value");
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(text_at(table, 0, 0), "A");
    EXPECT_EQ(text_at(table, 0, 1), "10.5");
    EXPECT_EQ(text_at(table, 1, 2), "2025-11-02T16:00:05Z");
}

TEST(CsvReaderTest, EmptyFieldsAreMissing) {
    auto result = CsvReader::parse("sensor_id,value,timestamp\nA,,2025-11-02\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(is_missing(result.value().at(0, 1)));
}

TEST(CsvReaderTest, ShortRecordsArePadded) {
    auto result = CsvReader::parse("sensor_id,value,timestamp\nA,1\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(is_missing(result.value().at(0, 2)));
}

TEST(CsvReaderTest, HandlesQuotedFields) {
    auto result = CsvReader::parse(
        "sensor_id,note\n"
        "\"A,1\",\"said \"\"hi\"\"\"\n"
        "B,\"two\nlines\"\n");

    ASSERT_TRUE(result.is_ok());
    const auto& table = result.value();
    ASSERT_EQ(table.size(), 2u);
    EXPECT_EQ(text_at(table, 0, 0), "A,1");
    EXPECT_EQ(text_at(table, 0, 1), "said \"hi\"");
    EXPECT_EQ(text_at(table, 1, 1), "two\nlines");
}

TEST(CsvReaderTest, HandlesCrLfAndBlankLines) {
    auto result = CsvReader::parse("sensor_id,value\r\n\r\nA,1\r\n\r\nB,2");

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(text_at(result.value(), 1, 1), "2");
}

TEST(CsvReaderTest, HeaderOnlyGivesEmptyTable) {
    auto result = CsvReader::parse("sensor_id,value,timestamp\n");

    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().empty());
    EXPECT_EQ(result.value().columns().size(), 3u);
}

TEST(CsvReaderTest, RejectsEmptyInput) {
    auto result = CsvReader::parse("");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("no header"), std::string::npos);
}

TEST(CsvReaderTest, RejectsTooManyFields) {
    auto result = CsvReader::parse("a,b\n1,2,3\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("3 fields"), std::string::npos);
}

TEST(CsvReaderTest, RejectsUnterminatedQuote) {
    auto result = CsvReader::parse("a,b\n\"open,2\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("Unterminated"), std::string::npos);
}

TEST(CsvReaderTest, RejectsStrayQuote) {
    auto result = CsvReader::parse("a,b\nab\"c,2\n");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("Unexpected quote"), std::string::npos);
}

TEST(CsvReaderTest, ReadFileMissing) {
    auto result = CsvReader::read_file("does_not_exist.csv");

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("Failed to open"), std::string::npos);
}

TEST(CsvReaderTest, ReadFileParsesContent) {
    const std::string path = "test_csv_reader_temp.csv";
    {
        std::ofstream file(path);
        file << "sensor_id,value,timestamp\nA,1,2025-11-02\n";
    }

    auto result = CsvReader::read_file(path);
    std::remove(path.c_str());

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 1u);
}

TEST(CsvReaderTest, WriteRendersNumbersAndQuotes) {
    ReadingTable table({"sensor_id", "value", "note"});
    table.add_row({std::string("A"), 12.345, std::string("a,b")});
    table.add_row({std::string("B"), 30.0, std::monostate{}});

    EXPECT_EQ(CsvReader::write(table),
              "sensor_id,value,note\n"
              "A,12.345,\"a,b\"\n"
              "B,30,\n");
}

TEST(CsvReaderTest, WrittenTableParsesBack) {
    ReadingTable table({"sensor_id", "note"});
    table.add_row({std::string("A"), std::string("quote \" and\nnewline")});

    auto parsed = CsvReader::parse(CsvReader::write(table));

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), table);
}
