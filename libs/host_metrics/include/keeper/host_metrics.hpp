// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file host_metrics.hpp
/// @brief Host resource snapshot scraped from node-exporter

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keeper::host_metrics {

/// Filesystem usage for one mount point
struct DiskMount {
    std::string mount_point;
    uint64_t total_bytes = 0;
    uint64_t available_bytes = 0;
    std::optional<std::string> filesystem_type;

    /// total - available, floored at 0
    uint64_t used_bytes() const {
        return total_bytes > available_bytes ? total_bytes - available_bytes : 0;
    }

    /// 0 when total is 0
    double usage_percent() const {
        if (total_bytes == 0) {
            return 0.0;
        }
        return static_cast<double>(used_bytes()) / static_cast<double>(total_bytes) * 100.0;
    }
};

/// One host sample. Numeric fields are only meaningful when is_valid.
struct HostMetricsSnapshot {
    double cpu_usage_percent = 0.0;

    // Cumulative counters kept for the next delta computation
    double cpu_idle_seconds_total = 0.0;
    double cpu_total_seconds_total = 0.0;

    uint64_t memory_total_bytes = 0;
    uint64_t memory_available_bytes = 0;

    /// Sorted by mount_point
    std::vector<DiskMount> mounts;

    bool is_valid = false;
    std::optional<std::string> error_message;

    uint64_t memory_used_bytes() const {
        return memory_total_bytes > memory_available_bytes
                   ? memory_total_bytes - memory_available_bytes
                   : 0;
    }
};

/// Filesystem types reported as real disks
const std::vector<std::string>& allowed_filesystem_types();

/// True for /proc, /sys, /dev, /run and /etc/ paths
bool is_pseudo_mount(const std::string& mount_point);

/// clamp((total - idle) / total * 100, 0, 100); 0 when total is 0
double single_snapshot_cpu_usage(double idle_seconds, double total_seconds);

/// clamp((1 - idle_delta / total_delta) * 100, 0, 100) between two valid
/// samples, or nullopt when the counters did not advance monotonically
std::optional<double> delta_cpu_usage(const HostMetricsSnapshot& previous,
                                      const HostMetricsSnapshot& current);

/// Human-readable binary size, up to two decimals: "1.5 GB"
std::string format_bytes(uint64_t bytes);

}  // namespace keeper::host_metrics
