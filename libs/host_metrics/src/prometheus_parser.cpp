// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/prometheus_parser.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace keeper::host_metrics {

namespace {

constexpr const char* kCpuSeconds = "node_cpu_seconds_total";
constexpr const char* kMemTotal = "node_memory_MemTotal_bytes";
constexpr const char* kMemAvailable = "node_memory_MemAvailable_bytes";
constexpr const char* kFsSize = "node_filesystem_size_bytes";
constexpr const char* kFsAvail = "node_filesystem_avail_bytes";
constexpr const char* kFsFree = "node_filesystem_free_bytes";

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':';
}

size_t skip_spaces(const std::string& line, size_t pos) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
        ++pos;
    }
    return pos;
}

// Parses `{k="v",...}` starting at the '{'. Returns the index after '}',
// or npos if malformed.
size_t parse_labels(const std::string& line, size_t pos,
                    std::map<std::string, std::string>& labels) {
    ++pos;  // '{'
    while (true) {
        pos = skip_spaces(line, pos);
        if (pos >= line.size()) {
            return std::string::npos;
        }
        if (line[pos] == '}') {
            return pos + 1;
        }

        size_t key_start = pos;
        while (pos < line.size() && is_name_char(line[pos])) {
            ++pos;
        }
        if (pos == key_start) {
            return std::string::npos;
        }
        std::string key = line.substr(key_start, pos - key_start);

        pos = skip_spaces(line, pos);
        if (pos >= line.size() || line[pos] != '=') {
            return std::string::npos;
        }
        pos = skip_spaces(line, pos + 1);
        if (pos >= line.size() || line[pos] != '"') {
            return std::string::npos;
        }
        ++pos;

        std::string value;
        bool closed = false;
        while (pos < line.size()) {
            char c = line[pos++];
            if (c == '\\' && pos < line.size()) {
                char escaped = line[pos++];
                value.push_back(escaped == 'n' ? '\n' : escaped);
            } else if (c == '"') {
                closed = true;
                break;
            } else {
                value.push_back(c);
            }
        }
        if (!closed) {
            return std::string::npos;
        }
        labels[key] = value;

        pos = skip_spaces(line, pos);
        if (pos < line.size() && line[pos] == ',') {
            ++pos;
        }
    }
}

// Per-mount accumulator; size/avail/free lines may arrive in any order
struct MountAccumulator {
    std::string filesystem_type;
    bool has_size = false;
    double size = 0.0;
    std::optional<double> avail;
    std::optional<double> free;
};

uint64_t to_bytes(double value) {
    return static_cast<uint64_t>(std::max(0.0, value));
}

}  // namespace

std::string PrometheusSample::label(const std::string& key) const {
    auto it = labels.find(key);
    return it != labels.end() ? it->second : std::string();
}

std::optional<PrometheusSample> parse_prometheus_line(const std::string& line) {
    size_t pos = skip_spaces(line, 0);
    if (pos >= line.size() || line[pos] == '#') {
        return std::nullopt;
    }

    PrometheusSample sample;
    size_t name_start = pos;
    while (pos < line.size() && is_name_char(line[pos])) {
        ++pos;
    }
    if (pos == name_start) {
        return std::nullopt;
    }
    sample.name = line.substr(name_start, pos - name_start);

    if (pos < line.size() && line[pos] == '{') {
        pos = parse_labels(line, pos, sample.labels);
        if (pos == std::string::npos) {
            return std::nullopt;
        }
    }

    size_t value_start = skip_spaces(line, pos);
    if (value_start == pos || value_start >= line.size()) {
        return std::nullopt;
    }

    const char* begin = line.c_str() + value_start;
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin) {
        return std::nullopt;
    }
    if (*end != '\0' && *end != ' ' && *end != '\t' && *end != '\r') {
        return std::nullopt;
    }
    sample.value = value;
    return sample;
}

HostMetricsSnapshot parse_node_exporter_metrics(const std::string& text) {
    HostMetricsSnapshot snapshot;
    snapshot.is_valid = true;

    double cpu_total = 0.0;
    double cpu_idle = 0.0;
    std::map<std::string, MountAccumulator> mounts;
    size_t skipped = 0;

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto sample = parse_prometheus_line(line);
        if (!sample) {
            ++skipped;
            continue;
        }
        if (!std::isfinite(sample->value) || sample->value < 0.0) {
            ++skipped;
            continue;
        }

        const std::string& name = sample->name;
        if (name == kCpuSeconds) {
            cpu_total += sample->value;
            if (sample->label("mode") == "idle") {
                cpu_idle += sample->value;
            }
        } else if (name == kMemTotal) {
            snapshot.memory_total_bytes = to_bytes(sample->value);
        } else if (name == kMemAvailable) {
            snapshot.memory_available_bytes = to_bytes(sample->value);
        } else if (name == kFsSize || name == kFsAvail || name == kFsFree) {
            std::string mount_point = sample->label("mountpoint");
            if (mount_point.empty()) {
                ++skipped;
                continue;
            }
            MountAccumulator& mount = mounts[mount_point];
            if (name == kFsSize) {
                mount.has_size = true;
                mount.size = sample->value;
                mount.filesystem_type = sample->label("fstype");
            } else if (name == kFsAvail) {
                mount.avail = sample->value;
            } else {
                mount.free = sample->value;
            }
        }
    }

    if (skipped > 0) {
        VLOG(1) << "[node_exporter] Skipped " << skipped << " unparseable line(s)";
    }

    snapshot.cpu_idle_seconds_total = cpu_idle;
    snapshot.cpu_total_seconds_total = cpu_total;
    if (cpu_total > 0.0) {
        snapshot.cpu_usage_percent = single_snapshot_cpu_usage(cpu_idle, cpu_total);
    } else {
        snapshot.is_valid = false;
        snapshot.error_message = "No CPU metrics parsed";
    }

    const auto& allowed = allowed_filesystem_types();
    for (const auto& entry : mounts) {
        const MountAccumulator& acc = entry.second;
        if (!acc.has_size || is_pseudo_mount(entry.first)) {
            continue;
        }
        if (std::find(allowed.begin(), allowed.end(), acc.filesystem_type) == allowed.end()) {
            continue;
        }

        DiskMount mount;
        mount.mount_point = entry.first;
        mount.total_bytes = to_bytes(acc.size);
        mount.available_bytes = to_bytes(acc.avail ? *acc.avail : acc.free.value_or(0.0));
        mount.filesystem_type = acc.filesystem_type;
        if (mount.total_bytes == 0) {
            continue;
        }
        snapshot.mounts.push_back(mount);
    }
    // std::map iteration already yields mount points in sorted order

    if (snapshot.memory_total_bytes == 0) {
        snapshot.is_valid = false;
        if (!snapshot.error_message) {
            snapshot.error_message = "No memory metrics parsed";
        }
    }

    return snapshot;
}

}  // namespace keeper::host_metrics
