//
// Created by gregorian-rayne on 10/19/26.
//

#include "eca/analysis/cluster_aggregate.hpp"

#include <gtest/gtest.h>

#include <cctype>

namespace eca::analysis
{
    namespace {
        Timestamp at(const int seconds) {
            return Timestamp{} + std::chrono::seconds(seconds);
        }

        LogRecord record_at(const int seconds) {
            LogRecord record;
            record.level = LogLevel::Error;
            record.timestamp = at(seconds);
            record.message = "event " + std::to_string(seconds);
            return record;
        }

        CodeLocation location(std::string class_name, const int line) {
            CodeLocation loc;
            loc.class_name = std::move(class_name);
            loc.method_name = "run";
            loc.line = line;
            return loc;
        }

        RecordAnalysis analysis_for(std::string fingerprint) {
            RecordAnalysis analysis;
            analysis.fingerprint = std::move(fingerprint);
            analysis.exception_type = "java.lang.IllegalStateException";
            analysis.message_template = "event <NUM>";
            return analysis;
        }

        RecordAnalysis located(std::optional<CodeLocation> loc) {
            auto analysis = analysis_for("fp");
            analysis.location = std::move(loc);
            return analysis;
        }

        void apply_at(ErrorCluster& cluster, const int seconds, std::optional<CodeLocation> loc = std::nullopt) {
            apply_record(cluster, record_at(seconds), located(std::move(loc)));
        }
    }

    TEST(ClusterAggregateTest, ShortIdFormat) {
        const auto id = make_short_id("java.lang.NullPointerException|com.example.A.a:1");

        ASSERT_EQ(id.size(), 12u);
        EXPECT_EQ(id.substr(0, 4), "ERR-");
        for (const char c : id.substr(4)) {
            EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'A' && c <= 'F')) << id;
        }
        EXPECT_EQ(id, make_short_id("java.lang.NullPointerException|com.example.A.a:1"));
        EXPECT_NE(id, make_short_id("java.lang.NullPointerException|com.example.A.a:2"));
    }

    TEST(ClusterAggregateTest, SeverityBoundaries) {
        EXPECT_EQ(severity_for_count(0), ClusterSeverity::Low);
        EXPECT_EQ(severity_for_count(9), ClusterSeverity::Low);
        EXPECT_EQ(severity_for_count(10), ClusterSeverity::Medium);
        EXPECT_EQ(severity_for_count(49), ClusterSeverity::Medium);
        EXPECT_EQ(severity_for_count(50), ClusterSeverity::High);
        EXPECT_EQ(severity_for_count(99), ClusterSeverity::High);
        EXPECT_EQ(severity_for_count(100), ClusterSeverity::Critical);
        EXPECT_EQ(severity_for_count(100000), ClusterSeverity::Critical);
    }

    TEST(ClusterAggregateTest, MakeClusterIsEmpty) {
        const auto cluster = make_cluster(analysis_for("fp"));

        EXPECT_EQ(cluster.fingerprint, "fp");
        EXPECT_EQ(cluster.id, make_short_id("fp"));
        EXPECT_FALSE(cluster.exception_type.has_value());
        EXPECT_FALSE(cluster.message_template.has_value());
        EXPECT_EQ(cluster.occurrence_count, 0u);
        EXPECT_FALSE(cluster.primary_location.has_value());
    }

    TEST(ClusterAggregateTest, TypeAndTemplateFilledOnFirstArrival) {
        auto cluster = make_cluster(analysis_for("fp"));

        RecordAnalysis bare;
        bare.fingerprint = "fp";
        apply_record(cluster, record_at(1), bare);
        EXPECT_FALSE(cluster.exception_type.has_value());
        EXPECT_FALSE(cluster.message_template.has_value());

        RecordAnalysis typed = bare;
        typed.exception_type = "java.lang.IllegalStateException";
        apply_record(cluster, record_at(2), typed);
        EXPECT_EQ(cluster.exception_type.value(), "java.lang.IllegalStateException");
        EXPECT_FALSE(cluster.message_template.has_value());

        RecordAnalysis other = bare;
        other.exception_type = "java.lang.NullPointerException";
        other.message_template = "event <NUM>";
        apply_record(cluster, record_at(3), other);
        EXPECT_EQ(cluster.exception_type.value(), "java.lang.IllegalStateException");
        EXPECT_EQ(cluster.message_template.value(), "event <NUM>");
    }

    TEST(ClusterAggregateTest, ApplyRecordTracksTimeRangeOutOfOrder) {
        auto cluster = make_cluster(analysis_for("fp"));

        apply_at(cluster, 50);
        apply_at(cluster, 10);
        apply_at(cluster, 30);

        EXPECT_EQ(cluster.occurrence_count, 3u);
        EXPECT_EQ(cluster.records.size(), 3u);
        EXPECT_EQ(cluster.first_seen.value(), at(10));
        EXPECT_EQ(cluster.last_seen.value(), at(50));
        EXPECT_EQ(cluster.records.front().timestamp, at(50));
        EXPECT_EQ(cluster.most_recent_record()->timestamp, at(50));
    }

    TEST(ClusterAggregateTest, PrimaryLocationIsPinnedToFirst) {
        auto cluster = make_cluster(analysis_for("fp"));

        apply_at(cluster, 1);
        apply_at(cluster, 2, CodeLocation{});
        apply_at(cluster, 3, location("com.example.A", 10));
        apply_at(cluster, 4, location("com.example.B", 20));

        ASSERT_TRUE(cluster.primary_location.has_value());
        EXPECT_EQ(cluster.primary_location->class_name, "com.example.A");
        EXPECT_EQ(cluster.full_location(), "com.example.A.run:10");
    }

    TEST(ClusterAggregateTest, AbsorbKeepsSurvivorAttributes) {
        auto survivor = make_cluster(analysis_for("a"));
        apply_at(survivor, 20);

        auto absorbed = make_cluster(analysis_for("b"));
        absorbed.message_template = "other";
        apply_at(absorbed, 5, location("com.example.B", 3));
        apply_at(absorbed, 40);

        absorb_cluster(survivor, std::move(absorbed));

        EXPECT_EQ(survivor.fingerprint, "a");
        EXPECT_EQ(survivor.message_template.value(), "event <NUM>");
        EXPECT_EQ(survivor.occurrence_count, 3u);
        EXPECT_EQ(survivor.first_seen.value(), at(5));
        EXPECT_EQ(survivor.last_seen.value(), at(40));
        EXPECT_EQ(survivor.primary_location->class_name, "com.example.B");
    }

    TEST(ClusterAggregateTest, AbsorbDoesNotReplaceLocation) {
        auto survivor = make_cluster(analysis_for("a"));
        apply_at(survivor, 1, location("com.example.A", 1));

        auto absorbed = make_cluster(analysis_for("b"));
        apply_at(absorbed, 2, location("com.example.B", 2));

        absorb_cluster(survivor, std::move(absorbed));
        EXPECT_EQ(survivor.primary_location->class_name, "com.example.A");
    }

    TEST(ClusterAggregateTest, SortIsStableAndDescending) {
        std::vector<ErrorCluster> clusters(3);
        clusters[0].fingerprint = "one";
        clusters[0].occurrence_count = 1;
        clusters[1].fingerprint = "five";
        clusters[1].occurrence_count = 5;
        clusters[2].fingerprint = "one-again";
        clusters[2].occurrence_count = 1;

        sort_by_occurrence(clusters);

        EXPECT_EQ(clusters[0].fingerprint, "five");
        EXPECT_EQ(clusters[1].fingerprint, "one");
        EXPECT_EQ(clusters[2].fingerprint, "one-again");
    }

    TEST(ClusterAggregateTest, RefreshSeverity) {
        auto cluster = make_cluster(analysis_for("fp"));
        for (int i = 0; i < 10; ++i) {
            apply_at(cluster, i);
        }
        EXPECT_EQ(cluster.severity, ClusterSeverity::Low);

        refresh_severity(cluster);
        EXPECT_EQ(cluster.severity, ClusterSeverity::Medium);
    }
}
