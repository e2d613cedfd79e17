// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file prometheus_parser.hpp
/// @brief Prometheus text exposition parsing for node-exporter output
///
/// Lines have the form `name{label="value",...} value [timestamp]`.
/// Comments (#) and blank lines are ignored; a malformed line is skipped
/// and leaves the affected metric at its zero default.

#include "keeper/host_metrics.hpp"

#include <map>
#include <optional>
#include <string>

namespace keeper::host_metrics {

/// One parsed exposition line
struct PrometheusSample {
    std::string name;
    std::map<std::string, std::string> labels;
    double value = 0.0;

    /// Label value, or empty if absent
    std::string label(const std::string& key) const;
};

/// Parse one line. nullopt for comments, blank lines and malformed lines.
std::optional<PrometheusSample> parse_prometheus_line(const std::string& line);

/// Build a snapshot from a full node-exporter body.
/// The result is invalid when no CPU or no memory metrics were found.
HostMetricsSnapshot parse_node_exporter_metrics(const std::string& text);

}  // namespace keeper::host_metrics
