// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/bedrock_query.hpp"

#include "keeper/errors.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <sstream>

namespace keeper::query {

namespace {

constexpr uint8_t kUnconnectedPing = 0x01;
constexpr uint8_t kUnconnectedPong = 0x1C;

// id + time + server guid + magic + string length
constexpr size_t kPongHeaderSize = 1 + 8 + 8 + kRakNetMagic.size() + 2;
constexpr size_t kPongMagicOffset = 1 + 8 + 8;

// edition;motd;protocol;version;online;max is the minimum useful prefix
constexpr size_t kMinServerIdFields = 6;

void write_u64_be(std::vector<uint8_t>& buffer, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

int64_t parse_count(const std::string& field, const char* what) {
    if (field.empty()) {
        throw ProtocolError(std::string("empty ") + what + " in server id");
    }
    char* end = nullptr;
    long long value = std::strtoll(field.c_str(), &end, 10);
    if (*end != '\0' || value < 0) {
        throw ProtocolError(std::string("invalid ") + what + " '" + field + "' in server id");
    }
    return value;
}

}  // namespace

BedrockQuery::BedrockQuery(const BedrockQueryConfig& config)
    : config_(config) {
}

BedrockQuery::~BedrockQuery() {
    dispose();
}

void BedrockQuery::connect(const ProbeTarget& target) {
    target_ = target;
    VLOG(1) << "[bedrock] Connecting to " << target.to_string();
    connection_.connect(target.host, target.port, config_.timeout);
}

void BedrockQuery::dispose() {
    connection_.close();
}

ProbeResult BedrockQuery::query() {
    if (!connection_.is_open()) {
        LOG(WARNING) << "[bedrock] query() called without a connection";
        return kNotAvailable;
    }

    try {
        auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch());
        connection_.send(build_unconnected_ping(static_cast<uint64_t>(now.count()),
                                                config_.client_guid));
        VLOG(1) << "[bedrock] Unconnected ping sent to " << target_.to_string();

        BedrockPong pong = parse_unconnected_pong(connection_.receive());
        VLOG(1) << "[bedrock] " << target_.to_string() << " '" << pong.motd << "' "
                << pong.version << " " << pong.online << "/" << pong.max;
        return std::to_string(pong.online) + "/" + std::to_string(pong.max);
    } catch (const std::exception& e) {
        LOG(WARNING) << "[bedrock] Query of " << target_.to_string() << " failed: " << e.what();
        return kNotAvailable;
    }
}

std::vector<uint8_t> build_unconnected_ping(uint64_t timestamp_ms, uint64_t client_guid) {
    std::vector<uint8_t> packet;
    packet.reserve(1 + 8 + kRakNetMagic.size() + 8);
    packet.push_back(kUnconnectedPing);
    write_u64_be(packet, timestamp_ms);
    packet.insert(packet.end(), kRakNetMagic.begin(), kRakNetMagic.end());
    write_u64_be(packet, client_guid);
    return packet;
}

BedrockPong parse_unconnected_pong(const std::vector<uint8_t>& datagram) {
    if (datagram.size() < kPongHeaderSize) {
        throw ProtocolError("truncated unconnected pong (" + std::to_string(datagram.size()) +
                            " bytes)");
    }
    if (datagram[0] != kUnconnectedPong) {
        throw ProtocolError("unexpected RakNet packet id " + std::to_string(datagram[0]));
    }
    if (!std::equal(kRakNetMagic.begin(), kRakNetMagic.end(),
                    datagram.begin() + kPongMagicOffset)) {
        throw ProtocolError("bad RakNet magic in unconnected pong");
    }

    size_t length = (static_cast<size_t>(datagram[kPongHeaderSize - 2]) << 8) |
                    datagram[kPongHeaderSize - 1];
    if (kPongHeaderSize + length > datagram.size()) {
        throw ProtocolError("server id length " + std::to_string(length) +
                            " exceeds datagram");
    }
    std::string server_id(datagram.begin() + kPongHeaderSize,
                          datagram.begin() + kPongHeaderSize + length);

    std::vector<std::string> fields;
    std::stringstream ss(server_id);
    std::string field;
    while (std::getline(ss, field, ';')) {
        fields.push_back(field);
    }
    if (fields.size() < kMinServerIdFields) {
        throw ProtocolError("server id has " + std::to_string(fields.size()) + " fields");
    }

    BedrockPong pong;
    pong.edition = fields[0];
    pong.motd = fields[1];
    pong.protocol = static_cast<int>(parse_count(fields[2], "protocol"));
    pong.version = fields[3];
    pong.online = parse_count(fields[4], "online count");
    pong.max = parse_count(fields[5], "max count");
    return pong;
}

}  // namespace keeper::query
