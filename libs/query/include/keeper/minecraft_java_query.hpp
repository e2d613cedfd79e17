// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file minecraft_java_query.hpp
/// @brief Minecraft Java Server List Ping probe
///
/// Exchange on one TCP connection:
///   -> [len][0x00][varint protocol][string host][u16 port][varint 1]
///   -> [0x01][0x00]
///   <- [varint len][varint id][string status_json]
///
/// Any failure during the exchange resolves through the configured
/// FallbackResolver (mcstatus.io in production).

#include "keeper/fallback_resolver.hpp"
#include "keeper/query_service.hpp"
#include "keeper/socket_transport.hpp"

#include <memory>
#include <vector>

namespace keeper::query {

/// Protocol version announced in the handshake (1.16.5)
constexpr int32_t kDefaultJavaProtocolVersion = 754;

/// Configuration for MinecraftJavaQuery
struct MinecraftJavaQueryConfig {
    std::chrono::milliseconds timeout = kDefaultProbeTimeout;
    int32_t protocol_version = kDefaultJavaProtocolVersion;
};

class MinecraftJavaQuery : public QueryService {
public:
    /// @param fallback Resolver used when the exchange fails; may be null
    explicit MinecraftJavaQuery(std::shared_ptr<FallbackResolver> fallback,
                                const MinecraftJavaQueryConfig& config = {});
    ~MinecraftJavaQuery() override;

    void connect(const ProbeTarget& target) override;
    void dispose() override;
    ProbeResult query() override;
    ProbeResult fallback(const ProbeTarget& target) override;
    std::string name() const override { return "minecraft_java"; }

private:
    std::shared_ptr<FallbackResolver> fallback_;
    MinecraftJavaQueryConfig config_;
    TcpConnection connection_;
    ProbeTarget target_;
};

// =============================================================================
// Packet helpers (exposed for testing)
// =============================================================================

/// Length-prefixed handshake packet with next-state 1 (status)
std::vector<uint8_t> build_handshake_packet(const ProbeTarget& target,
                                            int32_t protocol_version = kDefaultJavaProtocolVersion);

/// The two-byte status request [0x01, 0x00]
std::vector<uint8_t> build_status_request();

/// Read one status response frame and return its JSON text
/// @throws ProtocolError on malformed framing
std::string read_status_response(ByteSource& source);

/// "<online>/<max>" from the status JSON, or "N/A" if it carries no counts
ProbeResult parse_status_players(const std::string& status_json);

}  // namespace keeper::query
