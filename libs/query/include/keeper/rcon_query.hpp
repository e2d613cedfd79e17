// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file rcon_query.hpp
/// @brief Source RCON probe returning a player-list command's raw output
///
/// Packet: <i32 size LE> <i32 id LE> <i32 type LE> <body> 0x00 0x00
/// where size counts everything after itself. query() authenticates,
/// runs the configured command and returns the response body for
/// extract_player_count(). A body that fills a packet is followed by an
/// empty RESPONSE_VALUE marker; the server echoes it after the last part
/// of the output, which ends the read.

#include "keeper/query_service.hpp"
#include "keeper/socket_transport.hpp"

#include <vector>

namespace keeper::query {

/// RCON packet types. Exec and auth-response share the value 2.
enum class RconPacketType : int32_t {
    ResponseValue = 0,
    ExecCommand = 2,
    AuthResponse = 2,
    Auth = 3
};

/// id, type, two nulls
constexpr int32_t kMinRconPacketSize = 10;
constexpr int32_t kMaxRconPacketSize = 64 * 1024;

/// A command response body at least this long may continue in further
/// packets. Servers split output at 4096 body bytes.
constexpr size_t kRconSplitBodySize = 4000;

/// Upper bound on a reassembled command response
constexpr size_t kMaxRconResponseSize = 1024 * 1024;

/// Auth response id signalling a rejected password
constexpr int32_t kRconAuthFailedId = -1;

struct RconPacket {
    int32_t id = 0;
    RconPacketType type = RconPacketType::ResponseValue;
    std::string body;
};

struct RconQueryConfig {
    std::chrono::milliseconds timeout = kDefaultProbeTimeout;
    std::string password;
    std::string command = "ListPlayers";
};

class RconQuery : public QueryService {
public:
    explicit RconQuery(const RconQueryConfig& config);
    ~RconQuery() override;

    void connect(const ProbeTarget& target) override;
    void dispose() override;

    /// Raw command output, or "N/A" on auth or transport failure
    ProbeResult query() override;
    std::string name() const override { return "rcon"; }

private:
    /// @throws ProtocolError when the server rejects the password
    void authenticate();
    std::string execute(const std::string& command);

    RconQueryConfig config_;
    TcpConnection connection_;
    ProbeTarget target_;
    int32_t next_id_ = 1;
};

std::vector<uint8_t> encode_rcon_packet(const RconPacket& packet);

/// @throws ProtocolError on an out-of-range size or missing terminator
RconPacket read_rcon_packet(ByteSource& source);

}  // namespace keeper::query
