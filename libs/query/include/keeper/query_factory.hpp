// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file query_factory.hpp
/// @brief Selects a QueryService implementation by game type

#include "keeper/fallback_resolver.hpp"
#include "keeper/http_client.hpp"
#include "keeper/query_service.hpp"

#include <memory>
#include <optional>
#include <string>

namespace keeper::query {

enum class GameType {
    MinecraftJava,
    MinecraftBedrock,
    Source,
    Rcon
};

const char* to_string(GameType type);

/// Case-insensitive. Accepts the to_string() names and the aliases
/// minecraft, java, bedrock, steam, a2s.
std::optional<GameType> game_type_from_string(const std::string& name);

/// Settings shared by every probe family; each uses what applies to it
struct QueryOptions {
    std::chrono::milliseconds timeout = kDefaultProbeTimeout;
    int32_t protocol_version = 754;

    std::string rcon_password;
    std::string rcon_command = "ListPlayers";

    /// Java fallback. When null, an McStatusResolver over http_client is used.
    std::shared_ptr<FallbackResolver> fallback;

    /// When null, make_default_http_client() is used
    std::shared_ptr<HttpClient> http_client;
};

std::unique_ptr<QueryService> create_query_service(GameType type,
                                                   const QueryOptions& options = {});

}  // namespace keeper::query
