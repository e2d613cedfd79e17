// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/rcon_query.hpp"

#include "keeper/errors.hpp"

#include <glog/logging.h>

namespace keeper::query {

namespace {

void write_i32_le(std::vector<uint8_t>& buffer, int32_t value) {
    uint32_t bits = static_cast<uint32_t>(value);
    for (int shift = 0; shift < 32; shift += 8) {
        buffer.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
    }
}

int32_t read_i32_le(ByteSource& source) {
    uint8_t bytes[4];
    source.read_exact(bytes, sizeof(bytes));
    uint32_t bits = static_cast<uint32_t>(bytes[0]) |
                    (static_cast<uint32_t>(bytes[1]) << 8) |
                    (static_cast<uint32_t>(bytes[2]) << 16) |
                    (static_cast<uint32_t>(bytes[3]) << 24);
    return static_cast<int32_t>(bits);
}

void check_command_response(const RconPacket& packet) {
    if (packet.type != RconPacketType::ResponseValue) {
        throw ProtocolError("unexpected packet type " +
                            std::to_string(static_cast<int32_t>(packet.type)) +
                            " in command response");
    }
}

}  // namespace

RconQuery::RconQuery(const RconQueryConfig& config)
    : config_(config) {
}

RconQuery::~RconQuery() {
    dispose();
}

void RconQuery::connect(const ProbeTarget& target) {
    target_ = target;
    VLOG(1) << "[rcon] Connecting to " << target.to_string();
    connection_.connect(target.host, target.port, config_.timeout);
}

void RconQuery::dispose() {
    connection_.close();
}

ProbeResult RconQuery::query() {
    if (!connection_.is_open()) {
        LOG(WARNING) << "[rcon] query() called without a connection";
        return kNotAvailable;
    }

    try {
        authenticate();
        std::string output = execute(config_.command);
        VLOG(1) << "[rcon] '" << config_.command << "' on " << target_.to_string()
                << " returned " << output.size() << " bytes";
        VLOG(2) << "[rcon] Output: " << output;
        return output;
    } catch (const std::exception& e) {
        LOG(WARNING) << "[rcon] Query of " << target_.to_string() << " failed: " << e.what();
        return kNotAvailable;
    }
}

void RconQuery::authenticate() {
    RconPacket request{next_id_++, RconPacketType::Auth, config_.password};
    connection_.write_all(encode_rcon_packet(request));

    // Some servers send an empty RESPONSE_VALUE before the auth response
    RconPacket response = read_rcon_packet(connection_);
    if (response.type == RconPacketType::ResponseValue) {
        response = read_rcon_packet(connection_);
    }

    if (response.type != RconPacketType::AuthResponse) {
        throw ProtocolError("unexpected packet type " +
                            std::to_string(static_cast<int32_t>(response.type)) +
                            " during authentication");
    }
    if (response.id == kRconAuthFailedId) {
        throw ProtocolError("authentication rejected");
    }
    if (response.id != request.id) {
        throw ProtocolError("auth response id " + std::to_string(response.id) +
                            " does not match request " + std::to_string(request.id));
    }
    VLOG(1) << "[rcon] Authenticated with " << target_.to_string();
}

std::string RconQuery::execute(const std::string& command) {
    RconPacket request{next_id_++, RconPacketType::ExecCommand, command};
    connection_.write_all(encode_rcon_packet(request));

    RconPacket response = read_rcon_packet(connection_);
    check_command_response(response);
    std::string output = response.body;
    if (output.size() < kRconSplitBodySize) {
        return output;
    }

    RconPacket marker{next_id_++, RconPacketType::ResponseValue, ""};
    connection_.write_all(encode_rcon_packet(marker));
    VLOG(1) << "[rcon] " << output.size() << " byte response from "
            << target_.to_string() << ", reading continuation packets";

    while (true) {
        RconPacket part = read_rcon_packet(connection_);
        if (part.id == marker.id) {
            break;
        }
        check_command_response(part);
        if (part.id != response.id) {
            throw ProtocolError("continuation packet id " + std::to_string(part.id) +
                                " does not match " + std::to_string(response.id));
        }
        output += part.body;
        if (output.size() > kMaxRconResponseSize) {
            throw ProtocolError("RCON response exceeds " +
                                std::to_string(kMaxRconResponseSize) + " bytes");
        }
    }
    return output;
}

std::vector<uint8_t> encode_rcon_packet(const RconPacket& packet) {
    std::vector<uint8_t> buffer;
    int32_t size = kMinRconPacketSize + static_cast<int32_t>(packet.body.size());
    buffer.reserve(4 + static_cast<size_t>(size));
    write_i32_le(buffer, size);
    write_i32_le(buffer, packet.id);
    write_i32_le(buffer, static_cast<int32_t>(packet.type));
    buffer.insert(buffer.end(), packet.body.begin(), packet.body.end());
    buffer.push_back(0x00);
    buffer.push_back(0x00);
    return buffer;
}

RconPacket read_rcon_packet(ByteSource& source) {
    int32_t size = read_i32_le(source);
    if (size < kMinRconPacketSize || size > kMaxRconPacketSize) {
        throw ProtocolError("RCON packet size " + std::to_string(size) + " out of range");
    }

    RconPacket packet;
    packet.id = read_i32_le(source);
    packet.type = static_cast<RconPacketType>(read_i32_le(source));

    std::vector<uint8_t> rest(static_cast<size_t>(size - 8));
    source.read_exact(rest.data(), rest.size());
    if (rest[rest.size() - 1] != 0 || rest[rest.size() - 2] != 0) {
        throw ProtocolError("RCON packet missing null terminator");
    }
    packet.body.assign(rest.begin(), rest.end() - 2);
    return packet;
}

}  // namespace keeper::query
