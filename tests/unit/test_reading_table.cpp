#include <gtest/gtest.h>
#include "input/cell_coercion.hpp"
#include "input/reading_table.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <string>

using namespace flowguard;

// ============================================================================
// ReadingTable
// ============================================================================

TEST(ReadingTableTest, RowsArePaddedToColumnCount) {
    ReadingTable table({"sensor_id", "value", "timestamp"});
    table.add_row({std::string("A")});

    ASSERT_EQ(table.size(), 1u);
    EXPECT_EQ(table.rows()[0].size(), 3u);
    EXPECT_TRUE(is_missing(table.at(0, 1)));
    EXPECT_TRUE(is_missing(table.at(0, 2)));
}

TEST(ReadingTableTest, LongRowsAreTruncated) {
    ReadingTable table({"a"});
    table.add_row({1.0, 2.0});

    EXPECT_EQ(table.rows()[0].size(), 1u);
}

TEST(ReadingTableTest, EnsureColumnBackfillsExistingRows) {
    ReadingTable table({"sensor_id"});
    table.add_row({std::string("A")});

    auto idx = table.ensure_column("value");
    EXPECT_EQ(idx, 1u);
    EXPECT_EQ(table.ensure_column("value"), 1u);
    EXPECT_TRUE(is_missing(table.at(0, 1)));
}

TEST(ReadingTableTest, ColumnLookup) {
    ReadingTable table({"sensor_id", "value"});

    EXPECT_EQ(table.column_index("value"), 1u);
    EXPECT_FALSE(table.column_index("timestamp").has_value());
    EXPECT_TRUE(table.has_column("sensor_id"));
    EXPECT_FALSE(table.has_column("Sensor_Id"));
}

TEST(ReadingTableTest, EqualityComparesColumnsAndCells) {
    ReadingTable a({"x"});
    ReadingTable b({"x"});
    a.add_row({1.0});
    b.add_row({1.0});
    EXPECT_EQ(a, b);

    b.add_row({std::string("1")});
    EXPECT_NE(a, b);
}

// ============================================================================
// Cell coercion
// ============================================================================

TEST(CellCoercionTest, SensorIdFromTextAndNumber) {
    EXPECT_EQ(coerce::to_sensor_id(Cell{std::string("SETOR-A-01")}), "SETOR-A-01");
    EXPECT_EQ(coerce::to_sensor_id(Cell{42.0}), "42");
    EXPECT_EQ(coerce::to_sensor_id(Cell{2.5}), "2.5");
    EXPECT_FALSE(coerce::to_sensor_id(Cell{}).has_value());
    EXPECT_FALSE(coerce::to_sensor_id(Cell{std::nan("")}).has_value());
}

TEST(CellCoercionTest, NumberFromText) {
    EXPECT_EQ(coerce::to_number(Cell{std::string("10.5")}), 10.5);
    EXPECT_EQ(coerce::to_number(Cell{std::string(" +3 ")}), 3.0);
    EXPECT_EQ(coerce::to_number(Cell{std::string("-1e2")}), -100.0);
    EXPECT_EQ(coerce::to_number(Cell{7.0}), 7.0);
}

TEST(CellCoercionTest, UnparseableNumbersAreUndefined) {
    EXPECT_FALSE(coerce::to_number(Cell{}).has_value());
    EXPECT_FALSE(coerce::to_number(Cell{std::string("")}).has_value());
    EXPECT_FALSE(coerce::to_number(Cell{std::string("abc")}).has_value());
    EXPECT_FALSE(coerce::to_number(Cell{std::string("12abc")}).has_value());
    EXPECT_FALSE(coerce::to_number(Cell{std::string("nan")}).has_value());
    EXPECT_FALSE(coerce::to_number(Cell{std::string("inf")}).has_value());
    EXPECT_FALSE(coerce::to_number(Cell{std::numeric_limits<double>::infinity()}).has_value());
}

TEST(CellCoercionTest, TimestampFromTextAndEpoch) {
    auto from_text = coerce::to_utc(Cell{std::string("1970-01-01T00:00:10Z")});
    auto from_epoch = coerce::to_utc(Cell{10.0});

    ASSERT_TRUE(from_text.has_value());
    ASSERT_TRUE(from_epoch.has_value());
    EXPECT_EQ(*from_text, *from_epoch);
    EXPECT_EQ(from_epoch->time_since_epoch(), std::chrono::milliseconds{10000});
}

TEST(CellCoercionTest, BadTimestampsAreUndefined) {
    EXPECT_FALSE(coerce::to_utc(Cell{}).has_value());
    EXPECT_FALSE(coerce::to_utc(Cell{std::string("yesterday")}).has_value());
}
