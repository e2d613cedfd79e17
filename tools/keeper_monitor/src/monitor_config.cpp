// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "monitor_config.hpp"

#include <glog/logging.h>

#include <stdexcept>

namespace keeper::monitor {

namespace {

uint16_t parse_port(const YAML::Node& node, const std::string& context) {
    int port = node.as<int>();
    if (port <= 0 || port > 65535) {
        throw std::runtime_error(context + ": port " + std::to_string(port) + " out of range");
    }
    return static_cast<uint16_t>(port);
}

ServerEntry parse_server(const YAML::Node& node, size_t index) {
    ServerEntry server;
    server.name = node["name"] ? node["name"].as<std::string>()
                               : "server-" + std::to_string(index);
    std::string context = "server '" + server.name + "'";

    if (node["game"]) {
        std::string game = node["game"].as<std::string>();
        auto type = query::game_type_from_string(game);
        if (!type) {
            throw std::runtime_error(context + ": unknown game type '" + game + "'");
        }
        server.game = *type;
    }

    if (node["allocations"]) {
        for (const auto& entry : node["allocations"]) {
            query::ServerAllocation allocation;
            if (entry["ip"]) allocation.ip = entry["ip"].as<std::string>();
            if (!entry["port"]) {
                throw std::runtime_error(context + ": allocation without port");
            }
            allocation.port = parse_port(entry["port"], context);
            if (entry["default"]) allocation.is_default = entry["default"].as<bool>();
            server.allocations.push_back(allocation);
        }
    } else {
        if (!node["port"]) {
            throw std::runtime_error(context + ": missing port");
        }
        query::ServerAllocation allocation;
        if (node["allocation_ip"]) {
            allocation.ip = node["allocation_ip"].as<std::string>();
        } else if (node["host"]) {
            allocation.ip = node["host"].as<std::string>();
        }
        allocation.port = parse_port(node["port"], context);
        allocation.is_default = true;
        server.allocations.push_back(allocation);
    }

    if (node["rcon_port"]) server.rcon_port = parse_port(node["rcon_port"], context);
    if (node["rcon_password"]) server.rcon_password = node["rcon_password"].as<std::string>();
    if (node["rcon_command"]) server.rcon_command = node["rcon_command"].as<std::string>();
    if (node["player_count_pattern"]) {
        server.player_count_pattern = node["player_count_pattern"].as<std::string>();
    }
    if (node["max_players"]) server.max_players = node["max_players"].as<int>();

    return server;
}

}  // namespace

MonitorConfig parse_monitor_config(const YAML::Node& root) {
    MonitorConfig config;
    if (!root || root.IsNull()) {
        return config;
    }

    try {
        if (root["metrics_url"]) config.metrics_url = root["metrics_url"].as<std::string>();
        if (root["interval"]) config.interval_seconds = root["interval"].as<int>();
        if (root["internal_ip_structure"]) {
            config.internal_ip_structure = root["internal_ip_structure"].as<std::string>();
        }
        if (root["external_ip"]) config.external_ip = root["external_ip"].as<std::string>();

        if (root["servers"]) {
            size_t index = 0;
            for (const auto& node : root["servers"]) {
                config.servers.push_back(parse_server(node, index++));
            }
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("invalid monitor config: ") + e.what());
    }

    if (config.interval_seconds <= 0) {
        throw std::runtime_error("interval must be positive");
    }
    return config;
}

MonitorConfig load_monitor_config(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("failed to load " + path + ": " + e.what());
    }

    MonitorConfig config = parse_monitor_config(root);
    LOG(INFO) << "Loaded " << config.servers.size() << " server(s) from " << path;
    return config;
}

std::optional<query::ProbeTarget> resolve_probe_target(const ServerEntry& server,
                                                       const MonitorConfig& config) {
    auto allocation = query::select_default_allocation(server.allocations);
    if (!allocation) {
        return std::nullopt;
    }

    query::ProbeTarget target;
    target.host = query::query_host(*allocation, config.internal_ip_structure, config.external_ip);
    target.port = allocation->port;
    if (server.game == query::GameType::Rcon && server.rcon_port) {
        target.port = *server.rcon_port;
    }
    return target;
}

}  // namespace keeper::monitor
