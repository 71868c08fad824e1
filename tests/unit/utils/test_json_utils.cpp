//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/utils/json_utils.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace eca::json_utils
{
    class JsonUtilsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "eca_json_utils_test" /
                       ::testing::UnitTest::GetInstance()->current_test_info()->name();
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        fs::path temp_dir;
    };

    TEST_F(JsonUtilsTest, ParseValid) {
        const auto result = parse(R"({"level": "ERROR", "line": 23})");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value()["line"], 23);
    }

    TEST_F(JsonUtilsTest, ParseInvalid) {
        const auto result = parse(R"({"level": )");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST_F(JsonUtilsTest, GetOr) {
        const json obj = {{"line", 23}, {"name", nullptr}, {"flag", "yes"}};

        EXPECT_EQ(get_or<int>(obj, "line", -1), 23);
        EXPECT_EQ(get_or<int>(obj, "missing", -1), -1);
        EXPECT_EQ(get_or<std::string>(obj, "name", "none"), "none");
        EXPECT_FALSE(get_or<bool>(obj, "flag", false));
    }

    TEST_F(JsonUtilsTest, GetOptional) {
        const json obj = {{"line", 23}, {"file", nullptr}, {"method", 5}};

        const auto line = get_optional<int>(obj, "line");
        ASSERT_TRUE(line.is_ok());
        EXPECT_EQ(line.value().value(), 23);

        const auto file = get_optional<std::string>(obj, "file");
        ASSERT_TRUE(file.is_ok());
        EXPECT_FALSE(file.value().has_value());

        const auto method = get_optional<std::string>(obj, "method");
        ASSERT_TRUE(method.is_err());
        EXPECT_EQ(method.error().code(), ErrorCode::ParseError);
    }

    TEST_F(JsonUtilsTest, WriteFileCreatesParentDirectories) {
        const auto path = temp_dir / "out" / "clusters.json";

        ASSERT_TRUE(write_file(path, json{{"count", 2}}).is_ok());

        std::ifstream in(path);
        std::stringstream content;
        content << in.rdbuf();
        EXPECT_EQ(json::parse(content.str())["count"], 2);
    }
}
