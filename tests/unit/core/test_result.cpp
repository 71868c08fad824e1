//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/result.hpp"
#include "eca/error.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace eca
{
    TEST(ResultTest, SuccessConstruction) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
    }

    TEST(ResultTest, FailureConstruction) {
        auto result = Result<int, Error>::failure(Error::not_found("item not found"));

        EXPECT_FALSE(result.is_ok());
        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST(ResultTest, ValueThrowsOnError) {
        auto result = Result<int, Error>::failure(Error::config_error("bad arg"));
        EXPECT_THROW(result.value(), std::logic_error);
    }

    TEST(ResultTest, ErrorThrowsOnSuccess) {
        auto result = Result<int, Error>::success(10);
        EXPECT_THROW(result.error(), std::logic_error);
    }

    TEST(ResultTest, EmptyOptionalIsStillSuccess) {
        const auto result = Result<std::optional<std::string>, Error>::success(std::nullopt);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.value().has_value());
    }

    TEST(ResultTest, AndThenOnSuccess) {
        auto chained = Result<int, Error>::success(10).and_then([](const int x) {
            return Result<std::string, Error>::success(std::to_string(x));
        });

        EXPECT_TRUE(chained.is_ok());
        EXPECT_EQ(chained.value(), "10");
    }

    TEST(ResultTest, AndThenShortCircuitsOnFailure) {
        bool called = false;
        auto chained = Result<int, Error>::failure(Error::io_error("read failed")).and_then([&called](const int x) {
            called = true;
            return Result<std::string, Error>::success(std::to_string(x));
        });

        EXPECT_FALSE(called);
        EXPECT_TRUE(chained.is_err());
        EXPECT_EQ(chained.error().code(), ErrorCode::IoError);
    }

    TEST(ResultTest, MapErrorAddsContext) {
        auto result = Result<int, Error>::failure(Error::parse_error("JSON parse error", "line 3"))
            .map_error([](const Error& error) { return error.with_context("records.jsonl"); });

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "line 3; records.jsonl");
    }

    TEST(ResultTest, MapErrorLeavesSuccessAlone) {
        auto result = Result<int, Error>::success(7)
            .map_error([](const Error& error) { return error.with_context("unused"); });

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value(), 7);
    }

    TEST(ResultTest, MoveSemantics) {
        auto result = Result<std::string, Error>::success("hello");
        const std::string value = std::move(result).value();

        EXPECT_EQ(value, "hello");
    }

    TEST(VoidResultTest, SuccessConstruction) {
        const auto result = Result<void, Error>::success();

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_THROW((void)result.error(), std::logic_error);
    }

    TEST(VoidResultTest, FailureConstruction) {
        const auto result = Result<void, Error>::failure(Error::config_error("bad config"));

        EXPECT_FALSE(result.is_ok());
        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }
}
