// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/host_metrics.hpp"

#include <algorithm>
#include <cstdio>

namespace keeper::host_metrics {

const std::vector<std::string>& allowed_filesystem_types() {
    static const std::vector<std::string> types = {
        "overlay", "ext4", "xfs", "btrfs", "zfs", "apfs"};
    return types;
}

bool is_pseudo_mount(const std::string& mount_point) {
    static const char* const prefixes[] = {"/proc", "/sys", "/dev", "/run", "/etc/"};
    for (const char* prefix : prefixes) {
        if (mount_point.rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

double single_snapshot_cpu_usage(double idle_seconds, double total_seconds) {
    if (total_seconds <= 0.0) {
        return 0.0;
    }
    double usage = (total_seconds - idle_seconds) / total_seconds * 100.0;
    return std::clamp(usage, 0.0, 100.0);
}

std::optional<double> delta_cpu_usage(const HostMetricsSnapshot& previous,
                                      const HostMetricsSnapshot& current) {
    if (!previous.is_valid || !current.is_valid) {
        return std::nullopt;
    }
    if (previous.cpu_total_seconds_total <= 0.0 ||
        current.cpu_total_seconds_total <= previous.cpu_total_seconds_total ||
        current.cpu_idle_seconds_total < previous.cpu_idle_seconds_total) {
        return std::nullopt;
    }

    double total_delta = current.cpu_total_seconds_total - previous.cpu_total_seconds_total;
    double idle_delta = current.cpu_idle_seconds_total - previous.cpu_idle_seconds_total;
    double usage = (1.0 - idle_delta / total_delta) * 100.0;
    return std::clamp(usage, 0.0, 100.0);
}

std::string format_bytes(uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr size_t kUnitCount = sizeof(units) / sizeof(units[0]);

    double value = static_cast<double>(bytes);
    size_t order = 0;
    while (value >= 1024.0 && order < kUnitCount - 1) {
        value /= 1024.0;
        ++order;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    std::string text(buffer);
    // Drop trailing zeros: "1.50" -> "1.5", "2.00" -> "2"
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text + " " + units[order];
}

}  // namespace keeper::host_metrics
