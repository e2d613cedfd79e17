// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/host_metrics.hpp"

#include <gtest/gtest.h>

namespace keeper::test {

using namespace keeper::host_metrics;

TEST(DiskMountTest, UsedAndPercent) {
    DiskMount mount{"/", 1000, 250, std::string("ext4")};
    EXPECT_EQ(mount.used_bytes(), 750u);
    EXPECT_DOUBLE_EQ(mount.usage_percent(), 75.0);

    DiskMount empty{"/data", 0, 0, std::nullopt};
    EXPECT_DOUBLE_EQ(empty.usage_percent(), 0.0);

    DiskMount inconsistent{"/x", 100, 200, std::nullopt};
    EXPECT_EQ(inconsistent.used_bytes(), 0u);
}

TEST(HostMetricsSnapshotTest, MemoryUsed) {
    HostMetricsSnapshot snapshot;
    snapshot.memory_total_bytes = 8000;
    snapshot.memory_available_bytes = 3000;
    EXPECT_EQ(snapshot.memory_used_bytes(), 5000u);

    snapshot.memory_available_bytes = 9000;
    EXPECT_EQ(snapshot.memory_used_bytes(), 0u);
}

TEST(HostMetricsTest, PseudoMounts) {
    EXPECT_TRUE(is_pseudo_mount("/proc"));
    EXPECT_TRUE(is_pseudo_mount("/proc/foo"));
    EXPECT_TRUE(is_pseudo_mount("/sys/fs/cgroup"));
    EXPECT_TRUE(is_pseudo_mount("/dev/shm"));
    EXPECT_TRUE(is_pseudo_mount("/run/lock"));
    EXPECT_TRUE(is_pseudo_mount("/etc/hosts"));
    EXPECT_FALSE(is_pseudo_mount("/etcetera"));
    EXPECT_FALSE(is_pseudo_mount("/"));
    EXPECT_FALSE(is_pseudo_mount("/home"));
}

TEST(HostMetricsTest, SingleSnapshotUsage) {
    EXPECT_DOUBLE_EQ(single_snapshot_cpu_usage(100.0, 400.0), 75.0);
    EXPECT_DOUBLE_EQ(single_snapshot_cpu_usage(0.0, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(single_snapshot_cpu_usage(500.0, 400.0), 0.0);
}

TEST(HostMetricsTest, DeltaUsage) {
    HostMetricsSnapshot a;
    a.is_valid = true;
    a.cpu_idle_seconds_total = 100.0;
    a.cpu_total_seconds_total = 400.0;

    HostMetricsSnapshot b = a;
    b.cpu_idle_seconds_total = 120.0;
    b.cpu_total_seconds_total = 500.0;

    auto usage = delta_cpu_usage(a, b);
    ASSERT_TRUE(usage.has_value());
    EXPECT_DOUBLE_EQ(*usage, 80.0);
}

TEST(HostMetricsTest, DeltaNotComputable) {
    HostMetricsSnapshot a;
    a.is_valid = true;
    a.cpu_idle_seconds_total = 100.0;
    a.cpu_total_seconds_total = 400.0;

    HostMetricsSnapshot reset = a;
    reset.cpu_idle_seconds_total = 10.0;
    reset.cpu_total_seconds_total = 40.0;
    EXPECT_FALSE(delta_cpu_usage(a, reset).has_value());

    HostMetricsSnapshot same = a;
    EXPECT_FALSE(delta_cpu_usage(a, same).has_value());

    HostMetricsSnapshot first;
    EXPECT_FALSE(delta_cpu_usage(first, a).has_value());

    HostMetricsSnapshot invalid = a;
    invalid.is_valid = false;
    invalid.cpu_total_seconds_total = 500.0;
    EXPECT_FALSE(delta_cpu_usage(a, invalid).has_value());
}

TEST(HostMetricsTest, FormatBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1024), "1 KB");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(1610612736ULL), "1.5 GB");
    EXPECT_EQ(format_bytes(5ULL * 1024 * 1024 * 1024 * 1024 * 1024), "5120 TB");
    EXPECT_EQ(format_bytes(1000000), "976.56 KB");
}

}  // namespace keeper::test
