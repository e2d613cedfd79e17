// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/probe_runner.hpp"
#include "keeper/rcon_query.hpp"

#include "loopback_server.hpp"

#include <gtest/gtest.h>

namespace keeper::test {

using query::encode_rcon_packet;
using query::kNotAvailable;
using query::RconPacket;
using query::RconPacketType;
using query::RconQuery;
using query::RconQueryConfig;
using query::read_rcon_packet;

namespace {

constexpr const char* kPalworldListing =
    "name,playeruid,steamid\n"
    "Alice,1234567,76561198000000001\n"
    "Bob,7654321,76561198000000002\n";

/// Minimal RCON server: checks the password, answers one command
LoopbackTcpServer::Handler rcon_responder(const std::string& password,
                                          const std::string& output,
                                          std::string& seen_command) {
    return [password, output, &seen_command](int fd) {
        FdSource source(fd);
        RconPacket auth = read_rcon_packet(source);
        if (auth.type != RconPacketType::Auth) {
            return;
        }

        // Source servers lead with an empty RESPONSE_VALUE
        send_all(fd, encode_rcon_packet({auth.id, RconPacketType::ResponseValue, ""}));
        if (auth.body != password) {
            send_all(fd, encode_rcon_packet({-1, RconPacketType::AuthResponse, ""}));
            drain_until_closed(fd);
            return;
        }
        send_all(fd, encode_rcon_packet({auth.id, RconPacketType::AuthResponse, ""}));

        RconPacket command = read_rcon_packet(source);
        seen_command = command.body;
        send_all(fd, encode_rcon_packet({command.id, RconPacketType::ResponseValue, output}));
        drain_until_closed(fd);
    };
}

/// Sends the output in 4096-byte parts, then echoes the client's empty
/// RESPONSE_VALUE marker
LoopbackTcpServer::Handler split_rcon_responder(const std::string& output,
                                                int& parts_sent,
                                                bool& marker_seen) {
    return [output, &parts_sent, &marker_seen](int fd) {
        FdSource source(fd);
        RconPacket auth = read_rcon_packet(source);
        send_all(fd, encode_rcon_packet({auth.id, RconPacketType::AuthResponse, ""}));

        RconPacket command = read_rcon_packet(source);
        for (size_t offset = 0; offset < output.size(); offset += 4096) {
            send_all(fd, encode_rcon_packet(
                             {command.id, RconPacketType::ResponseValue, output.substr(offset, 4096)}));
            ++parts_sent;
        }

        RconPacket marker = read_rcon_packet(source);
        marker_seen = marker.type == RconPacketType::ResponseValue && marker.body.empty();
        send_all(fd, encode_rcon_packet({marker.id, RconPacketType::ResponseValue, ""}));
        drain_until_closed(fd);
    };
}

std::string large_palworld_listing(int players) {
    std::string listing = "name,playeruid,steamid\n";
    for (int i = 0; i < players; ++i) {
        listing += "Player" + std::to_string(i) + "," + std::to_string(1000000 + i) +
                   ",7656119800000" + std::to_string(1000 + i) + "\n";
    }
    return listing;
}

}  // namespace

class RconQueryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.timeout = std::chrono::milliseconds(2000);
        config_.password = "hunter2";
        config_.command = "ShowPlayers";
    }

    RconQueryConfig config_;
};

// =============================================================================
// Packet encoding / decoding
// =============================================================================

TEST_F(RconQueryTest, EncodeAuthPacket) {
    auto bytes = encode_rcon_packet({1, RconPacketType::Auth, "pw"});
    std::vector<uint8_t> expected = {
        0x0C, 0x00, 0x00, 0x00,   // size 12
        0x01, 0x00, 0x00, 0x00,   // id
        0x03, 0x00, 0x00, 0x00,   // type auth
        'p', 'w', 0x00, 0x00};
    EXPECT_EQ(bytes, expected);
}

TEST_F(RconQueryTest, ReadPacket) {
    std::vector<uint8_t> bytes = {
        0x0F, 0x00, 0x00, 0x00,
        0xFF, 0xFF, 0xFF, 0xFF,   // id -1
        0x02, 0x00, 0x00, 0x00,
        'h', 'e', 'l', 'l', 'o', 0x00, 0x00};
    BufferReader reader(bytes);

    RconPacket packet = read_rcon_packet(reader);
    EXPECT_EQ(packet.id, -1);
    EXPECT_EQ(packet.type, RconPacketType::AuthResponse);
    EXPECT_EQ(packet.body, "hello");
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST_F(RconQueryTest, ReadPacketRejectsBadSize) {
    std::vector<uint8_t> too_small = {0x05, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00};
    BufferReader small_reader(too_small);
    EXPECT_THROW(read_rcon_packet(small_reader), ProtocolError);

    std::vector<uint8_t> too_large = {0x00, 0x00, 0x00, 0x7F};
    BufferReader large_reader(too_large);
    EXPECT_THROW(read_rcon_packet(large_reader), ProtocolError);
}

TEST_F(RconQueryTest, ReadPacketRejectsMissingTerminator) {
    std::vector<uint8_t> bytes = {
        0x0B, 0x00, 0x00, 0x00,
        0x01, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00,
        'a', 'b', 'c'};
    BufferReader reader(bytes);
    EXPECT_THROW(read_rcon_packet(reader), ProtocolError);
}

// =============================================================================
// Exchange against a loopback server
// =============================================================================

TEST_F(RconQueryTest, AuthenticatesAndReturnsRawOutput) {
    std::string seen_command;
    query::ProbeResult result;
    {
        LoopbackTcpServer server(rcon_responder("hunter2", kPalworldListing, seen_command));
        RconQuery query(config_);
        result = query::probe_server(query, {"127.0.0.1", server.port()});
    }

    EXPECT_EQ(result, kPalworldListing);
    EXPECT_EQ(seen_command, "ShowPlayers");
}

TEST_F(RconQueryTest, ReassemblesSplitResponse) {
    std::string listing = large_palworld_listing(300);
    ASSERT_GT(listing.size(), 2u * 4096u);

    int parts_sent = 0;
    bool marker_seen = false;
    query::ProbeResult result;
    {
        LoopbackTcpServer server(split_rcon_responder(listing, parts_sent, marker_seen));
        RconQuery query(config_);
        result = query::probe_server(query, {"127.0.0.1", server.port()});
    }

    EXPECT_GE(parts_sent, 3);
    EXPECT_TRUE(marker_seen);
    EXPECT_EQ(result, listing);
}

TEST_F(RconQueryTest, RejectedPasswordIsNotAvailable) {
    std::string seen_command;
    config_.password = "wrong";
    query::ProbeResult result;
    {
        LoopbackTcpServer server(rcon_responder("hunter2", kPalworldListing, seen_command));
        RconQuery query(config_);
        result = query::probe_server(query, {"127.0.0.1", server.port()});
    }

    EXPECT_EQ(result, kNotAvailable);
    EXPECT_TRUE(seen_command.empty());
}

TEST_F(RconQueryTest, ConnectRefusedIsNotAvailable) {
    RconQuery query(config_);
    EXPECT_EQ(query::probe_server(query, {"127.0.0.1", closed_loopback_port()}), kNotAvailable);
}

}  // namespace keeper::test
