// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file monitor_config.hpp
/// @brief YAML server list for keeper_monitor
///
/// Example:
/// @code
/// metrics_url: http://node-exporter:9100/metrics
/// interval: 30
/// internal_ip_structure: "192.168.*.*"
/// external_ip: 203.0.113.10
/// servers:
///   - name: Survival
///     game: minecraft_java
///     allocation_ip: 192.168.1.20
///     port: 25565
///   - name: Palworld
///     game: rcon
///     host: 192.168.1.21
///     port: 8211
///     rcon_port: 25575
///     rcon_password: secret
///     rcon_command: ShowPlayers
///     max_players: 32
/// @endcode

#include "keeper/allocation.hpp"
#include "keeper/query_factory.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace keeper::monitor {

/// One monitored game server
struct ServerEntry {
    std::string name;
    query::GameType game = query::GameType::MinecraftJava;
    std::vector<query::ServerAllocation> allocations;

    std::optional<uint16_t> rcon_port;
    std::string rcon_password;
    std::string rcon_command = "ListPlayers";
    std::optional<std::string> player_count_pattern;
    int max_players = 0;
};

struct MonitorConfig {
    std::string metrics_url = "http://node-exporter:9100/metrics";
    int interval_seconds = 30;
    std::string internal_ip_structure;
    std::string external_ip;
    std::vector<ServerEntry> servers;
};

/// @throws std::runtime_error on unreadable files or invalid entries
MonitorConfig load_monitor_config(const std::string& path);

/// @throws std::runtime_error on invalid entries
MonitorConfig parse_monitor_config(const YAML::Node& root);

/// Address to probe for @p server, or nullopt if it has no allocation.
/// RCON servers are probed on rcon_port when set.
std::optional<query::ProbeTarget> resolve_probe_target(const ServerEntry& server,
                                                       const MonitorConfig& config);

}  // namespace keeper::monitor
