// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "monitor_report.hpp"

#include "keeper/player_count.hpp"

#include <iomanip>
#include <sstream>

namespace keeper::monitor {

ServerStatus summarize_probe(const ServerEntry& server,
                             const std::optional<query::ProbeTarget>& target,
                             const query::ProbeResult& result) {
    ServerStatus status;
    status.name = server.name;
    status.game = server.game;
    status.target = target ? target->to_string() : query::kNotAvailable;
    status.raw = result;
    status.online = result != query::kNotAvailable;

    if (!status.online) {
        status.players = format_player_count("", server.max_players);
    } else if (server.game == query::GameType::Rcon) {
        int count = extract_player_count(result, server.player_count_pattern);
        status.players = format_player_count(std::to_string(count), server.max_players);
    } else {
        status.players = result;
    }
    return status;
}

std::string render_text(const std::vector<ServerStatus>& servers,
                        const std::optional<host_metrics::HostMetricsSnapshot>& host) {
    std::ostringstream out;
    for (const auto& server : servers) {
        out << std::left << std::setw(24) << server.name
            << std::setw(20) << query::to_string(server.game)
            << std::setw(24) << server.target
            << (server.online ? "online   " : "offline  ")
            << server.players << "\n";
    }

    if (host) {
        if (!host->is_valid) {
            out << "host: unavailable (" << host->error_message.value_or("unknown") << ")\n";
        } else {
            out << std::fixed << std::setprecision(1)
                << "host: cpu " << host->cpu_usage_percent << "%, memory "
                << host_metrics::format_bytes(host->memory_used_bytes()) << " / "
                << host_metrics::format_bytes(host->memory_total_bytes) << "\n";
            for (const auto& mount : host->mounts) {
                out << "  " << std::setw(22) << mount.mount_point
                    << host_metrics::format_bytes(mount.used_bytes()) << " / "
                    << host_metrics::format_bytes(mount.total_bytes)
                    << " (" << mount.usage_percent() << "%)\n";
            }
        }
    }
    return out.str();
}

nlohmann::json render_json(const std::vector<ServerStatus>& servers,
                           const std::optional<host_metrics::HostMetricsSnapshot>& host) {
    nlohmann::json root;
    root["servers"] = nlohmann::json::array();
    for (const auto& server : servers) {
        root["servers"].push_back({
            {"name", server.name},
            {"game", query::to_string(server.game)},
            {"target", server.target},
            {"online", server.online},
            {"players", server.players},
            {"raw", server.raw},
        });
    }

    if (host) {
        nlohmann::json h;
        h["valid"] = host->is_valid;
        if (host->error_message) {
            h["error"] = *host->error_message;
        }
        h["cpu_usage_percent"] = host->cpu_usage_percent;
        h["memory_total_bytes"] = host->memory_total_bytes;
        h["memory_used_bytes"] = host->memory_used_bytes();
        h["mounts"] = nlohmann::json::array();
        for (const auto& mount : host->mounts) {
            h["mounts"].push_back({
                {"mount_point", mount.mount_point},
                {"filesystem_type", mount.filesystem_type.value_or("")},
                {"total_bytes", mount.total_bytes},
                {"used_bytes", mount.used_bytes()},
                {"usage_percent", mount.usage_percent()},
            });
        }
        root["host"] = h;
    }
    return root;
}

std::string render_json_text(const std::vector<ServerStatus>& servers,
                             const std::optional<host_metrics::HostMetricsSnapshot>& host) {
    return render_json(servers, host).dump(-1, ' ', false,
                                           nlohmann::json::error_handler_t::replace);
}

}  // namespace keeper::monitor
