//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/export/json_exporter.hpp"
#include "eca/analysis/analysis_engine.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace eca::json_export
{
    namespace fs = std::filesystem;

    class JsonExporterTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "eca_json_exporter_test" /
                       ::testing::UnitTest::GetInstance()->current_test_info()->name();
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            if (fs::exists(temp_dir)) {
                fs::remove_all(temp_dir);
            }
        }

        static json read_json(const fs::path& path) {
            std::ifstream file(path);
            return json::parse(file);
        }

        fs::path temp_dir;
    };

    TEST_F(JsonExporterTest, ParsesFullRecord) {
        const auto content = R"({"timestamp": 1700000000123, "level": "error", "logger": "com.example.Orders",)"
                             R"( "message": "boom", "class_name": "com.example.OrderService",)"
                             R"( "method_name": "processOrder", "line": 23, "thread_name": "http-1",)"
                             R"( "correlation_id": "abc"})";

        const auto records = parse_records_jsonl(content);
        ASSERT_TRUE(records.is_ok());
        ASSERT_EQ(records.value().size(), 1u);

        const auto& record = records.value()[0];
        EXPECT_EQ(record.level, LogLevel::Error);
        EXPECT_EQ(record.logger, "com.example.Orders");
        EXPECT_EQ(record.message, "boom");
        EXPECT_EQ(record.class_name.value(), "com.example.OrderService");
        EXPECT_EQ(record.method_name.value(), "processOrder");
        EXPECT_EQ(record.line.value(), 23);
        EXPECT_EQ(record.thread_name.value(), "http-1");
        EXPECT_EQ(record.correlation_id.value(), "abc");
        EXPECT_EQ(record.timestamp.time_since_epoch(), std::chrono::milliseconds(1700000000123));
        EXPECT_FALSE(record.stack_trace.has_value());
    }

    TEST_F(JsonExporterTest, MissingFieldsUseDefaults) {
        const auto records = parse_records_jsonl("{}\n\n   \n{\"level\": \"SEVERE\"}\n");

        ASSERT_TRUE(records.is_ok());
        ASSERT_EQ(records.value().size(), 2u);
        EXPECT_EQ(records.value()[0].level, LogLevel::Info);
        EXPECT_EQ(records.value()[0].message, "");
        EXPECT_EQ(records.value()[0].timestamp, Timestamp{});
        EXPECT_EQ(records.value()[1].level, LogLevel::Error);
    }

    TEST_F(JsonExporterTest, BadLineReportsLineNumber) {
        const auto records = parse_records_jsonl("{}\n{not json\n");

        ASSERT_TRUE(records.is_err());
        EXPECT_EQ(records.error().code(), ErrorCode::ParseError);
        ASSERT_TRUE(records.error().has_context());
        EXPECT_NE(records.error().context()->find("line 2"), std::string::npos);
    }

    TEST_F(JsonExporterTest, WrongFieldTypeIsParseError) {
        const auto records = parse_records_jsonl(R"({"message": 42})");

        ASSERT_TRUE(records.is_err());
        EXPECT_EQ(records.error().code(), ErrorCode::ParseError);
    }

    TEST_F(JsonExporterTest, NonObjectRecordIsParseError) {
        const auto records = parse_records_jsonl("[1, 2]");
        ASSERT_TRUE(records.is_err());
        EXPECT_EQ(records.error().code(), ErrorCode::ParseError);
    }

    TEST_F(JsonExporterTest, ThrowableChain) {
        const auto value = json::parse(R"({
            "type": "org.springframework.dao.DataAccessException",
            "message": "query failed",
            "frames": [{"class_name": "com.example.Repo", "method_name": "find", "file_name": "Repo.java", "line": 10}],
            "cause": {
                "type": "java.sql.SQLException",
                "frames": [],
                "cause": {"type": "java.net.SocketTimeoutException", "message": "read timed out"}
            }
        })");

        const auto throwable = throwable_from_json(value);
        ASSERT_TRUE(throwable.is_ok());

        const auto& top = throwable.value();
        EXPECT_EQ(top.type_name, "org.springframework.dao.DataAccessException");
        EXPECT_EQ(top.message.value(), "query failed");
        ASSERT_EQ(top.frames.size(), 1u);
        EXPECT_EQ(top.frames[0].file_name.value(), "Repo.java");
        EXPECT_EQ(top.frames[0].line, 10);

        ASSERT_NE(top.cause, nullptr);
        EXPECT_EQ(top.cause->type_name, "java.sql.SQLException");
        EXPECT_FALSE(top.cause->message.has_value());
        ASSERT_NE(top.cause->cause, nullptr);
        EXPECT_EQ(top.cause->cause->message.value(), "read timed out");
        EXPECT_EQ(top.cause->cause->cause, nullptr);
    }

    TEST_F(JsonExporterTest, BadFrameIsParseError) {
        const auto value = json::parse(R"({"type": "X", "frames": [1]})");
        const auto throwable = throwable_from_json(value);

        ASSERT_TRUE(throwable.is_err());
        EXPECT_EQ(throwable.error().code(), ErrorCode::ParseError);
    }

    TEST_F(JsonExporterTest, FrameDefaults) {
        const auto frame = frame_from_json(json::parse(R"({"class_name": "a.B", "method_name": "c"})"));

        ASSERT_TRUE(frame.is_ok());
        EXPECT_EQ(frame.value().line, -1);
        EXPECT_FALSE(frame.value().native_method);
        EXPECT_FALSE(frame.value().file_name.has_value());
    }

    TEST_F(JsonExporterTest, RecordSerialization) {
        LogRecord record;
        record.timestamp = Timestamp{} + std::chrono::milliseconds(5000);
        record.level = LogLevel::Fatal;
        record.message = "boom";
        record.line = 7;

        const auto j = to_json(record);

        EXPECT_EQ(j["timestamp"], 5000);
        EXPECT_EQ(j["level"], "FATAL");
        EXPECT_EQ(j["message"], "boom");
        EXPECT_EQ(j["line"], 7);
        EXPECT_FALSE(j.contains("stack_trace"));
        EXPECT_FALSE(j.contains("class_name"));
    }

    TEST_F(JsonExporterTest, ClusterSerialization) {
        ErrorCluster cluster;
        cluster.id = "ERR-0000ABCD";
        cluster.fingerprint = "java.lang.NullPointerException|com.example.A.a:1";
        cluster.exception_type = "java.lang.NullPointerException";
        CodeLocation location;
        location.class_name = "com.example.A";
        location.method_name = "a";
        location.line = 1;
        cluster.primary_location = location;
        for (int i = 0; i < 12; ++i) {
            LogRecord record;
            record.level = LogLevel::Error;
            record.timestamp = Timestamp{} + std::chrono::seconds(i);
            cluster.records.push_back(record);
        }
        cluster.occurrence_count = 12;
        cluster.severity = ClusterSeverity::Medium;
        cluster.first_seen = cluster.records.front().timestamp;
        cluster.last_seen = cluster.records.back().timestamp;

        const auto j = to_json(cluster, 3);

        EXPECT_EQ(j["id"], "ERR-0000ABCD");
        EXPECT_EQ(j["severity"], "MEDIUM");
        EXPECT_EQ(j["occurrence_count"], 12);
        EXPECT_EQ(j["full_location"], "com.example.A.a:1");
        EXPECT_EQ(j["primary_location"]["line"], 1);
        EXPECT_EQ(j["first_seen"], 0);
        EXPECT_EQ(j["last_seen"], 11000);
        EXPECT_FALSE(j.contains("message_template"));
        ASSERT_EQ(j["sample_records"].size(), 3u);
        EXPECT_EQ(j["sample_records"][2]["timestamp"], 11000);
    }

    TEST_F(JsonExporterTest, ParsedTraceSerialization) {
        ParsedTrace trace;
        trace.exception_type = "java.lang.RuntimeException";
        trace.caused_by = std::make_unique<ParsedTrace>();
        trace.caused_by->exception_type = "java.io.IOException";
        trace.caused_by->message = "disk";

        const auto j = to_json(trace);

        EXPECT_EQ(j["exception_type"], "java.lang.RuntimeException");
        EXPECT_TRUE(j["frames"].empty());
        EXPECT_EQ(j["caused_by"]["message"], "disk");
    }

    TEST_F(JsonExporterTest, WritesAndReadsFiles) {
        const auto input = temp_dir / "records.jsonl";
        {
            std::ofstream file(input);
            file << R"({"level": "ERROR", "message": "User 1234567 not found"})" << "\n";
            file << R"({"level": "ERROR", "message": "User 7654321 not found"})" << "\n";
        }

        const auto records = read_records_jsonl(input);
        ASSERT_TRUE(records.is_ok());
        ASSERT_EQ(records.value().size(), 2u);

        const analysis::AnalysisEngine engine;
        const auto report = engine.analyze(records.value());
        ASSERT_TRUE(report.is_ok());

        const auto output = temp_dir / "out" / "clusters.json";
        ASSERT_TRUE(write_clusters(output, report.value().clusters).is_ok());

        const auto written = read_json(output);
        ASSERT_TRUE(written.is_array());
        ASSERT_EQ(written.size(), 1u);
        EXPECT_EQ(written[0]["fingerprint"], "User <ID> not found");
        EXPECT_EQ(written[0]["occurrence_count"], 2);
    }

    TEST_F(JsonExporterTest, MissingInputIsNotFound) {
        const auto records = read_records_jsonl(temp_dir / "absent.jsonl");
        ASSERT_TRUE(records.is_err());
        EXPECT_EQ(records.error().code(), ErrorCode::NotFound);
    }
}
