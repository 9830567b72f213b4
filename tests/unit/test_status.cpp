#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/status.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace flowguard;

// Test Result<T, E>

TEST(StatusTest, OkCreation) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(StatusTest, ErrCreation) {
    auto result = Result<int, std::string>::Err("something failed");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "something failed");
}

TEST(StatusTest, SameValueAndErrorTypeStaysDistinct) {
    auto ok = Result<std::string, std::string>::Ok("value");
    auto err = Result<std::string, std::string>::Err("error");

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "error");
}

TEST(StatusTest, ValueThrowsOnError) {
    auto result = Result<int, std::string>::Err("error");
    EXPECT_THROW((void)result.value(), std::logic_error);
}

TEST(StatusTest, ErrorThrowsOnOk) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_THROW((void)result.error(), std::logic_error);
}

TEST(StatusTest, TakeValueThrowsOnError) {
    auto result = Result<std::vector<double>, std::string>::Err("no rows");
    EXPECT_THROW((void)std::move(result).take_value(), std::logic_error);
}

TEST(StatusTest, CarriesDetectError) {
    auto result = Result<int, DetectError>::Err(
        InvalidMethodError{"bogus", {"zscore", "iqr"}});

    ASSERT_TRUE(result.is_err());
    ASSERT_TRUE(std::holds_alternative<InvalidMethodError>(result.error()));
    EXPECT_EQ(describe(result.error()), "Invalid method 'bogus'. Use one of ['zscore', 'iqr']");
}

TEST(StatusTest, WorksWithMoveOnlyTypes) {
    auto result = Result<std::unique_ptr<int>, std::string>::Ok(
        std::make_unique<int>(42)
    );

    EXPECT_TRUE(result.is_ok());
    auto ptr = std::move(result).take_value();
    EXPECT_EQ(*ptr, 42);
}

// describe()

TEST(ErrorsTest, SchemaErrorNamesMissingAndPresentColumns) {
    SchemaError error{{"value"}, {"sensor_id", "timestamp"}};

    EXPECT_EQ(describe(error),
              "Input is missing required columns: ['value']. "
              "Columns received: ['sensor_id', 'timestamp']");
}

TEST(ErrorsTest, DescribeVisitsVariant) {
    DetectError error = SchemaError{{"timestamp"}, {}};
    EXPECT_NE(describe(error).find("'timestamp'"), std::string::npos);
}
