//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/utils/file_utils.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace eca::file_utils
{
    class FileUtilsTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "eca_file_utils_test" /
                       ::testing::UnitTest::GetInstance()->current_test_info()->name();
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        void create_test_file(const fs::path& relative, const std::string& content) const {
            const auto path = temp_dir / relative;
            fs::create_directories(path.parent_path());
            std::ofstream file(path, std::ios::binary);
            file << content;
        }

        fs::path temp_dir;
    };

    TEST_F(FileUtilsTest, ReadFile) {
        create_test_file("a.txt", "hello");

        const auto content = read_file(temp_dir / "a.txt");
        ASSERT_TRUE(content.is_ok());
        EXPECT_EQ(content.value(), "hello");
    }

    TEST_F(FileUtilsTest, ReadMissingFileIsNotFound) {
        const auto content = read_file(temp_dir / "missing.txt");
        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::NotFound);
    }

    TEST_F(FileUtilsTest, SymlinkLoopIsIoError) {
        fs::create_symlink("b.txt", temp_dir / "a.txt");
        fs::create_symlink("a.txt", temp_dir / "b.txt");

        const auto status = file_status(temp_dir / "a.txt");
        ASSERT_TRUE(status.is_err());
        EXPECT_EQ(status.error().code(), ErrorCode::IoError);
        EXPECT_NE(status.error().context().value().find("a.txt: "), std::string::npos);

        const auto content = read_file(temp_dir / "a.txt");
        ASSERT_TRUE(content.is_err());
        EXPECT_EQ(content.error().code(), ErrorCode::IoError);

        const auto lines = read_lines(temp_dir / "b.txt");
        ASSERT_TRUE(lines.is_err());
        EXPECT_EQ(lines.error().code(), ErrorCode::IoError);

        EXPECT_TRUE(file_utils::is_regular_file(temp_dir / "a.txt").is_err());
        EXPECT_TRUE(find_file_by_name(temp_dir / "a.txt", "X.java").is_err());
    }

    TEST_F(FileUtilsTest, IsRegularFile) {
        create_test_file("x/Y.java", "");

        EXPECT_TRUE(file_utils::is_regular_file(temp_dir / "x/Y.java").value());
        EXPECT_FALSE(file_utils::is_regular_file(temp_dir / "x").value());
        EXPECT_FALSE(file_utils::is_regular_file(temp_dir / "missing.java").value());
        EXPECT_FALSE(file_utils::is_regular_file(temp_dir / "x/Y.java/child").value());
    }

    TEST_F(FileUtilsTest, ReadLinesStripsCarriageReturns) {
        create_test_file("Crlf.java", "class A {\r\n    int x;\r\n}\r\n");

        const auto lines = read_lines(temp_dir / "Crlf.java");
        ASSERT_TRUE(lines.is_ok());
        ASSERT_EQ(lines.value().size(), 3u);
        EXPECT_EQ(lines.value()[1], "    int x;");
    }

    TEST_F(FileUtilsTest, FindFileByNamePrefersShallowFilesThenSortedDirectories) {
        create_test_file("b/Target.java", "b");
        create_test_file("a/deep/Target.java", "a-deep");
        create_test_file("c/Other.java", "c");

        const auto found = find_file_by_name(temp_dir, "Target.java");
        ASSERT_TRUE(found.is_ok());
        ASSERT_TRUE(found.value().has_value());
        EXPECT_EQ(*found.value(), temp_dir / "a" / "deep" / "Target.java");

        create_test_file("Target.java", "root");
        const auto shallow = find_file_by_name(temp_dir, "Target.java");
        ASSERT_TRUE(shallow.is_ok());
        EXPECT_EQ(*shallow.value(), temp_dir / "Target.java");
    }

    TEST_F(FileUtilsTest, FindFileByNameAbsent) {
        create_test_file("x/Y.java", "");

        const auto found = find_file_by_name(temp_dir, "Z.java");
        ASSERT_TRUE(found.is_ok());
        EXPECT_FALSE(found.value().has_value());

        const auto missing_root = find_file_by_name(temp_dir / "nope", "Y.java");
        ASSERT_TRUE(missing_root.is_ok());
        EXPECT_FALSE(missing_root.value().has_value());
    }
}
