// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/minecraft_java_query.hpp"

#include "keeper/errors.hpp"
#include "keeper/status_text.hpp"
#include "keeper/varint.hpp"

#include <glog/logging.h>

namespace keeper::query {

namespace {

constexpr int32_t kHandshakePacketId = 0x00;
constexpr int32_t kNextStateStatus = 1;

}  // namespace

MinecraftJavaQuery::MinecraftJavaQuery(std::shared_ptr<FallbackResolver> fallback,
                                       const MinecraftJavaQueryConfig& config)
    : fallback_(std::move(fallback))
    , config_(config) {
}

MinecraftJavaQuery::~MinecraftJavaQuery() {
    dispose();
}

void MinecraftJavaQuery::connect(const ProbeTarget& target) {
    target_ = target;
    VLOG(1) << "[minecraft_java] Connecting to " << target.to_string();
    connection_.connect(target.host, target.port, config_.timeout);
}

void MinecraftJavaQuery::dispose() {
    connection_.close();
}

ProbeResult MinecraftJavaQuery::query() {
    if (!connection_.is_open()) {
        LOG(WARNING) << "[minecraft_java] query() called without a connection";
        return kNotAvailable;
    }

    try {
        connection_.write_all(build_handshake_packet(target_, config_.protocol_version));
        VLOG(1) << "[minecraft_java] Handshake sent to " << target_.to_string();

        connection_.write_all(build_status_request());
        VLOG(1) << "[minecraft_java] Status request sent";

        std::string status = read_status_response(connection_);
        VLOG(1) << "[minecraft_java] Status response read (" << status.size() << " bytes)";
        VLOG(2) << "[minecraft_java] Status: " << status;

        ProbeResult result = parse_status_players(status);
        if (result == kNotAvailable) {
            LOG(WARNING) << "[minecraft_java] No player counts in status from "
                         << target_.to_string();
        }
        return result;
    } catch (const std::exception& e) {
        LOG(WARNING) << "[minecraft_java] Query of " << target_.to_string()
                     << " failed: " << e.what() << ", trying fallback";
        return fallback(target_);
    }
}

ProbeResult MinecraftJavaQuery::fallback(const ProbeTarget& target) {
    if (!fallback_) {
        return kNotAvailable;
    }
    VLOG(1) << "[minecraft_java] Fallback via " << fallback_->name()
            << " for " << target.to_string();
    return fallback_->resolve(target);
}

std::vector<uint8_t> build_handshake_packet(const ProbeTarget& target,
                                            int32_t protocol_version) {
    std::vector<uint8_t> payload;
    write_varint(payload, kHandshakePacketId);
    write_varint(payload, protocol_version);
    write_string(payload, target.host);
    write_u16_be(payload, target.port);
    write_varint(payload, kNextStateStatus);

    std::vector<uint8_t> packet;
    packet.reserve(payload.size() + kMaxVarIntBytes);
    write_varint(packet, static_cast<int32_t>(payload.size()));
    packet.insert(packet.end(), payload.begin(), payload.end());
    return packet;
}

std::vector<uint8_t> build_status_request() {
    return {0x01, 0x00};
}

std::string read_status_response(ByteSource& source) {
    int32_t length = read_varint(source);
    if (length <= 0) {
        throw ProtocolError("invalid status frame length " + std::to_string(length));
    }
    int32_t packet_id = read_varint(source);
    VLOG(2) << "[minecraft_java] Frame length " << length << ", packet id " << packet_id;
    return read_string(source);
}

ProbeResult parse_status_players(const std::string& status_json) {
    auto counts = find_player_counts(status_json);
    if (!counts) {
        return kNotAvailable;
    }
    return counts->to_result();
}

}  // namespace keeper::query
