// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/prometheus_parser.hpp"

#include <gtest/gtest.h>

namespace keeper::test {

using namespace keeper::host_metrics;

namespace {

constexpr const char* kMemoryLines =
    "node_memory_MemTotal_bytes 8.589934592e+09\n"
    "node_memory_MemAvailable_bytes 4.294967296e+09\n";

}  // namespace

// =============================================================================
// Line parsing
// =============================================================================

TEST(PrometheusLineTest, NameLabelsValue) {
    auto sample = parse_prometheus_line(
        R"(node_filesystem_size_bytes{device="/dev/sda1",fstype="ext4",mountpoint="/"} 1.2e+11)");
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->name, "node_filesystem_size_bytes");
    EXPECT_EQ(sample->label("device"), "/dev/sda1");
    EXPECT_EQ(sample->label("fstype"), "ext4");
    EXPECT_EQ(sample->label("mountpoint"), "/");
    EXPECT_EQ(sample->label("missing"), "");
    EXPECT_DOUBLE_EQ(sample->value, 1.2e11);
}

TEST(PrometheusLineTest, ScalarWithTimestamp) {
    auto sample = parse_prometheus_line("node_memory_MemTotal_bytes 1024 1700000000000");
    ASSERT_TRUE(sample.has_value());
    EXPECT_TRUE(sample->labels.empty());
    EXPECT_DOUBLE_EQ(sample->value, 1024.0);
}

TEST(PrometheusLineTest, EscapedLabelValue) {
    auto sample = parse_prometheus_line(R"(m{path="C:\\data",note="say \"hi\""} 1)");
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->label("path"), "C:\\data");
    EXPECT_EQ(sample->label("note"), "say \"hi\"");
}

TEST(PrometheusLineTest, CommentsAndMalformed) {
    EXPECT_FALSE(parse_prometheus_line("# HELP node_cpu_seconds_total Seconds").has_value());
    EXPECT_FALSE(parse_prometheus_line("").has_value());
    EXPECT_FALSE(parse_prometheus_line("node_cpu_seconds_total{mode=\"idle\"}").has_value());
    EXPECT_FALSE(parse_prometheus_line("node_cpu_seconds_total{mode=\"idle\" 12").has_value());
    EXPECT_FALSE(parse_prometheus_line("node_memory_MemTotal_bytes abc").has_value());
    EXPECT_FALSE(parse_prometheus_line("node_memory_MemTotal_bytes 12x").has_value());
}

// =============================================================================
// Snapshot construction
// =============================================================================

TEST(NodeExporterParseTest, SingleSnapshotCpuUsage) {
    std::string text = std::string(
        "# TYPE node_cpu_seconds_total counter\n"
        "node_cpu_seconds_total{cpu=\"0\",mode=\"idle\"} 100\n"
        "node_cpu_seconds_total{cpu=\"0\",mode=\"user\"} 300\n") + kMemoryLines;

    HostMetricsSnapshot snapshot = parse_node_exporter_metrics(text);

    EXPECT_TRUE(snapshot.is_valid);
    EXPECT_FALSE(snapshot.error_message.has_value());
    EXPECT_DOUBLE_EQ(snapshot.cpu_total_seconds_total, 400.0);
    EXPECT_DOUBLE_EQ(snapshot.cpu_idle_seconds_total, 100.0);
    EXPECT_DOUBLE_EQ(snapshot.cpu_usage_percent, 75.0);
    EXPECT_EQ(snapshot.memory_total_bytes, 8589934592ULL);
    EXPECT_EQ(snapshot.memory_available_bytes, 4294967296ULL);
}

TEST(NodeExporterParseTest, SumsAcrossCores) {
    std::string text = std::string(
        "node_cpu_seconds_total{cpu=\"0\",mode=\"idle\"} 50\n"
        "node_cpu_seconds_total{cpu=\"1\",mode=\"idle\"} 50\n"
        "node_cpu_seconds_total{cpu=\"0\",mode=\"system\"} 25\n"
        "node_cpu_seconds_total{cpu=\"1\",mode=\"user\"} 75\n") + kMemoryLines;

    HostMetricsSnapshot snapshot = parse_node_exporter_metrics(text);
    EXPECT_DOUBLE_EQ(snapshot.cpu_total_seconds_total, 200.0);
    EXPECT_DOUBLE_EQ(snapshot.cpu_idle_seconds_total, 100.0);
    EXPECT_DOUBLE_EQ(snapshot.cpu_usage_percent, 50.0);
}

TEST(NodeExporterParseTest, MountFiltering) {
    std::string text = std::string(
        "node_cpu_seconds_total{cpu=\"0\",mode=\"idle\"} 1\n") + kMemoryLines +
        "node_filesystem_size_bytes{fstype=\"ext4\",mountpoint=\"/proc/foo\"} 1000\n"
        "node_filesystem_size_bytes{fstype=\"ext4\",mountpoint=\"/etc/hosts\"} 1000\n"
        "node_filesystem_size_bytes{fstype=\"tmpfs\",mountpoint=\"/tmp\"} 1000\n"
        "node_filesystem_size_bytes{fstype=\"xfs\",mountpoint=\"/empty\"} 0\n"
        "node_filesystem_size_bytes{fstype=\"ext4\",mountpoint=\"/\"} 1000\n"
        "node_filesystem_avail_bytes{fstype=\"ext4\",mountpoint=\"/\"} 400\n";

    HostMetricsSnapshot snapshot = parse_node_exporter_metrics(text);

    ASSERT_EQ(snapshot.mounts.size(), 1u);
    EXPECT_EQ(snapshot.mounts[0].mount_point, "/");
    EXPECT_EQ(snapshot.mounts[0].total_bytes, 1000u);
    EXPECT_EQ(snapshot.mounts[0].available_bytes, 400u);
    EXPECT_EQ(snapshot.mounts[0].filesystem_type, std::string("ext4"));
}

TEST(NodeExporterParseTest, MountsSortedAndFieldsInAnyOrder) {
    std::string text = std::string(
        "node_cpu_seconds_total{cpu=\"0\",mode=\"idle\"} 1\n") + kMemoryLines +
        "node_filesystem_avail_bytes{fstype=\"btrfs\",mountpoint=\"/srv\"} 30\n"
        "node_filesystem_free_bytes{fstype=\"btrfs\",mountpoint=\"/srv\"} 50\n"
        "node_filesystem_size_bytes{fstype=\"btrfs\",mountpoint=\"/srv\"} 100\n"
        "node_filesystem_size_bytes{fstype=\"overlay\",mountpoint=\"/\"} 200\n"
        "node_filesystem_free_bytes{fstype=\"overlay\",mountpoint=\"/\"} 80\n"
        "node_filesystem_size_bytes{fstype=\"zfs\",mountpoint=\"/data\"} 300\n";

    HostMetricsSnapshot snapshot = parse_node_exporter_metrics(text);

    ASSERT_EQ(snapshot.mounts.size(), 3u);
    EXPECT_EQ(snapshot.mounts[0].mount_point, "/");
    EXPECT_EQ(snapshot.mounts[0].available_bytes, 80u);   // free only
    EXPECT_EQ(snapshot.mounts[1].mount_point, "/data");
    EXPECT_EQ(snapshot.mounts[1].available_bytes, 0u);
    EXPECT_EQ(snapshot.mounts[2].mount_point, "/srv");
    EXPECT_EQ(snapshot.mounts[2].available_bytes, 30u);   // avail wins over free
}

TEST(NodeExporterParseTest, NoCpuMetrics) {
    HostMetricsSnapshot snapshot = parse_node_exporter_metrics(kMemoryLines);
    EXPECT_FALSE(snapshot.is_valid);
    EXPECT_EQ(snapshot.error_message, std::string("No CPU metrics parsed"));
    EXPECT_DOUBLE_EQ(snapshot.cpu_usage_percent, 0.0);
}

TEST(NodeExporterParseTest, NoMemoryMetrics) {
    HostMetricsSnapshot snapshot =
        parse_node_exporter_metrics("node_cpu_seconds_total{mode=\"idle\"} 10\n");
    EXPECT_FALSE(snapshot.is_valid);
    EXPECT_EQ(snapshot.error_message, std::string("No memory metrics parsed"));
}

TEST(NodeExporterParseTest, CpuErrorTakesPrecedence) {
    HostMetricsSnapshot snapshot = parse_node_exporter_metrics("# nothing here\n");
    EXPECT_FALSE(snapshot.is_valid);
    EXPECT_EQ(snapshot.error_message, std::string("No CPU metrics parsed"));
}

TEST(NodeExporterParseTest, MalformedLinesAreSkipped) {
    std::string text = std::string(
        "node_cpu_seconds_total{mode=\"idle\"} 100\n"
        "node_cpu_seconds_total{mode=\"user\" garbage\n"
        "node_cpu_seconds_total{mode=\"user\"} NaN\n"
        "node_cpu_seconds_total{mode=\"user\"} -5\n"
        "node_cpu_seconds_total{mode=\"user\"} 300\r\n") + kMemoryLines;

    HostMetricsSnapshot snapshot = parse_node_exporter_metrics(text);
    EXPECT_TRUE(snapshot.is_valid);
    EXPECT_DOUBLE_EQ(snapshot.cpu_total_seconds_total, 400.0);
    EXPECT_DOUBLE_EQ(snapshot.cpu_usage_percent, 75.0);
}

TEST(NodeExporterParseTest, SimilarMetricNamesAreNotConfused) {
    std::string text = std::string(
        "node_cpu_seconds_total{mode=\"idle\"} 100\n"
        "node_cpu_seconds_total_extra{mode=\"user\"} 9999\n"
        "node_memory_MemTotal_bytes_other 1\n") + kMemoryLines;

    HostMetricsSnapshot snapshot = parse_node_exporter_metrics(text);
    EXPECT_DOUBLE_EQ(snapshot.cpu_total_seconds_total, 100.0);
    EXPECT_EQ(snapshot.memory_total_bytes, 8589934592ULL);
}

}  // namespace keeper::test
