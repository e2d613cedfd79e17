// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file monitor_report.hpp
/// @brief Per-cycle summary of probe results and host metrics

#include "keeper/host_metrics.hpp"
#include "keeper/query_service.hpp"
#include "monitor_config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace keeper::monitor {

/// Outcome of probing one server
struct ServerStatus {
    std::string name;
    query::GameType game = query::GameType::MinecraftJava;
    std::string target;         ///< host:port, or "N/A" without allocation
    query::ProbeResult raw;     ///< Probe output as returned
    std::string players;        ///< Display form, e.g. "3/20" or "N/A/32"
    bool online = false;
};

/// Turn a probe result into a display status. RCON output runs through
/// the player-count extractor with the server's custom pattern.
ServerStatus summarize_probe(const ServerEntry& server,
                             const std::optional<query::ProbeTarget>& target,
                             const query::ProbeResult& result);

std::string render_text(const std::vector<ServerStatus>& servers,
                        const std::optional<host_metrics::HostMetricsSnapshot>& host);

nlohmann::json render_json(const std::vector<ServerStatus>& servers,
                           const std::optional<host_metrics::HostMetricsSnapshot>& host);

/// render_json() serialized to one line. Invalid UTF-8 in server output is
/// replaced with U+FFFD instead of throwing.
std::string render_json_text(const std::vector<ServerStatus>& servers,
                             const std::optional<host_metrics::HostMetricsSnapshot>& host);

}  // namespace keeper::monitor
