// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file bedrock_query.hpp
/// @brief Minecraft Bedrock probe using the RakNet unconnected ping
///
/// Ping: 0x01 <u64 time BE> <16-byte magic> <u64 client guid BE>
/// Pong: 0x1C <u64 time> <u64 server guid> <magic> <u16 len BE> <server id>
/// The server id is "MCPE;motd;protocol;version;online;max;..."

#include "keeper/query_service.hpp"
#include "keeper/socket_transport.hpp"

#include <array>
#include <vector>

namespace keeper::query {

/// RakNet offline-message magic
constexpr std::array<uint8_t, 16> kRakNetMagic = {
    0x00, 0xFF, 0xFF, 0x00, 0xFE, 0xFE, 0xFE, 0xFE,
    0xFD, 0xFD, 0xFD, 0xFD, 0x12, 0x34, 0x56, 0x78};

struct BedrockQueryConfig {
    std::chrono::milliseconds timeout = kDefaultProbeTimeout;
    uint64_t client_guid = 0x4B656570657221ULL;
};

class BedrockQuery : public QueryService {
public:
    explicit BedrockQuery(const BedrockQueryConfig& config = {});
    ~BedrockQuery() override;

    void connect(const ProbeTarget& target) override;
    void dispose() override;
    ProbeResult query() override;
    std::string name() const override { return "minecraft_bedrock"; }

private:
    BedrockQueryConfig config_;
    UdpConnection connection_;
    ProbeTarget target_;
};

/// Fields of the pong server-id string
struct BedrockPong {
    std::string edition;
    std::string motd;
    int protocol = 0;
    std::string version;
    int64_t online = 0;
    int64_t max = 0;
};

std::vector<uint8_t> build_unconnected_ping(uint64_t timestamp_ms, uint64_t client_guid);

/// @throws ProtocolError on a malformed pong or server-id string
BedrockPong parse_unconnected_pong(const std::vector<uint8_t>& datagram);

}  // namespace keeper::query
