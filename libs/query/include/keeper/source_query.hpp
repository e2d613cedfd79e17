// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file source_query.hpp
/// @brief Source-engine A2S_INFO probe over UDP
///
/// Request:   FF FF FF FF 'T' "Source Engine Query\0" [challenge]
/// Challenge: FF FF FF FF 'A' <4-byte challenge>
/// Info:      FF FF FF FF 'I' protocol name map folder game appid
///            players max bots ...

#include "keeper/query_service.hpp"
#include "keeper/socket_transport.hpp"

#include <optional>
#include <vector>

namespace keeper::query {

struct SourceQueryConfig {
    std::chrono::milliseconds timeout = kDefaultProbeTimeout;
};

class SourceQuery : public QueryService {
public:
    explicit SourceQuery(const SourceQueryConfig& config = {});
    ~SourceQuery() override;

    void connect(const ProbeTarget& target) override;
    void dispose() override;
    ProbeResult query() override;
    std::string name() const override { return "source"; }

private:
    SourceQueryConfig config_;
    UdpConnection connection_;
    ProbeTarget target_;
};

/// Decoded A2S_INFO reply (fields after game are ignored)
struct A2sInfo {
    uint8_t protocol = 0;
    std::string name;
    std::string map;
    std::string folder;
    std::string game;
    uint16_t app_id = 0;
    uint8_t players = 0;
    uint8_t max_players = 0;
    uint8_t bots = 0;
};

/// A2S_INFO request, with @p challenge appended when non-empty
std::vector<uint8_t> build_a2s_info_request(const std::vector<uint8_t>& challenge = {});

/// The 4-byte challenge if @p datagram is an 'A' reply
std::optional<std::vector<uint8_t>> parse_a2s_challenge(const std::vector<uint8_t>& datagram);

/// @throws ProtocolError if @p datagram is not a complete 'I' reply
A2sInfo parse_a2s_info(const std::vector<uint8_t>& datagram);

}  // namespace keeper::query
