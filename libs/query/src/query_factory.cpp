// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/query_factory.hpp"

#include "keeper/bedrock_query.hpp"
#include "keeper/minecraft_java_query.hpp"
#include "keeper/rcon_query.hpp"
#include "keeper/source_query.hpp"

#include <algorithm>
#include <cctype>

namespace keeper::query {

const char* to_string(GameType type) {
    switch (type) {
        case GameType::MinecraftJava:    return "minecraft_java";
        case GameType::MinecraftBedrock: return "minecraft_bedrock";
        case GameType::Source:           return "source";
        case GameType::Rcon:             return "rcon";
        default:                         return "unknown";
    }
}

std::optional<GameType> game_type_from_string(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (key == "minecraft_java" || key == "minecraft" || key == "java") {
        return GameType::MinecraftJava;
    }
    if (key == "minecraft_bedrock" || key == "bedrock") {
        return GameType::MinecraftBedrock;
    }
    if (key == "source" || key == "steam" || key == "a2s") {
        return GameType::Source;
    }
    if (key == "rcon") {
        return GameType::Rcon;
    }
    return std::nullopt;
}

std::unique_ptr<QueryService> create_query_service(GameType type,
                                                   const QueryOptions& options) {
    switch (type) {
        case GameType::MinecraftJava: {
            std::shared_ptr<FallbackResolver> fallback = options.fallback;
            if (!fallback) {
                auto http = options.http_client ? options.http_client
                                                : make_default_http_client();
                fallback = std::make_shared<McStatusResolver>(http);
            }
            MinecraftJavaQueryConfig config;
            config.timeout = options.timeout;
            config.protocol_version = options.protocol_version;
            return std::make_unique<MinecraftJavaQuery>(fallback, config);
        }
        case GameType::MinecraftBedrock: {
            BedrockQueryConfig config;
            config.timeout = options.timeout;
            return std::make_unique<BedrockQuery>(config);
        }
        case GameType::Source: {
            SourceQueryConfig config;
            config.timeout = options.timeout;
            return std::make_unique<SourceQuery>(config);
        }
        case GameType::Rcon: {
            RconQueryConfig config;
            config.timeout = options.timeout;
            config.password = options.rcon_password;
            config.command = options.rcon_command;
            return std::make_unique<RconQuery>(config);
        }
    }
    return nullptr;
}

}  // namespace keeper::query
