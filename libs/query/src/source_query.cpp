// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/source_query.hpp"

#include "keeper/errors.hpp"

#include <glog/logging.h>

#include <cstring>

namespace keeper::query {

namespace {

constexpr uint8_t kSimpleHeader[] = {0xFF, 0xFF, 0xFF, 0xFF};
constexpr uint8_t kInfoRequest = 'T';
constexpr uint8_t kChallengeReply = 'A';
constexpr uint8_t kInfoReply = 'I';
constexpr const char* kInfoPayload = "Source Engine Query";
constexpr size_t kChallengeLength = 4;

bool has_simple_header(const std::vector<uint8_t>& datagram) {
    return datagram.size() >= 5 &&
           std::memcmp(datagram.data(), kSimpleHeader, sizeof(kSimpleHeader)) == 0;
}

/// Sequential reader over an A2S reply
class A2sReader {
public:
    A2sReader(const std::vector<uint8_t>& data, size_t offset)
        : data_(data), pos_(offset) {}

    uint8_t u8() {
        require(1);
        return data_[pos_++];
    }

    uint16_t u16_le() {
        require(2);
        uint16_t value = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return value;
    }

    std::string cstring() {
        size_t start = pos_;
        while (pos_ < data_.size() && data_[pos_] != 0) {
            ++pos_;
        }
        if (pos_ >= data_.size()) {
            throw ProtocolError("unterminated string in A2S_INFO reply");
        }
        std::string value(data_.begin() + start, data_.begin() + pos_);
        ++pos_;
        return value;
    }

private:
    void require(size_t count) const {
        if (pos_ + count > data_.size()) {
            throw ProtocolError("truncated A2S_INFO reply");
        }
    }

    const std::vector<uint8_t>& data_;
    size_t pos_;
};

}  // namespace

SourceQuery::SourceQuery(const SourceQueryConfig& config)
    : config_(config) {
}

SourceQuery::~SourceQuery() {
    dispose();
}

void SourceQuery::connect(const ProbeTarget& target) {
    target_ = target;
    VLOG(1) << "[source] Connecting to " << target.to_string();
    connection_.connect(target.host, target.port, config_.timeout);
}

void SourceQuery::dispose() {
    connection_.close();
}

ProbeResult SourceQuery::query() {
    if (!connection_.is_open()) {
        LOG(WARNING) << "[source] query() called without a connection";
        return kNotAvailable;
    }

    try {
        connection_.send(build_a2s_info_request());
        std::vector<uint8_t> reply = connection_.receive();

        if (auto challenge = parse_a2s_challenge(reply)) {
            VLOG(1) << "[source] Challenge received, resending request";
            connection_.send(build_a2s_info_request(*challenge));
            reply = connection_.receive();
        }

        A2sInfo info = parse_a2s_info(reply);
        VLOG(1) << "[source] " << target_.to_string() << " '" << info.name << "' "
                << static_cast<int>(info.players) << "/" << static_cast<int>(info.max_players);
        return std::to_string(info.players) + "/" + std::to_string(info.max_players);
    } catch (const std::exception& e) {
        LOG(WARNING) << "[source] Query of " << target_.to_string() << " failed: " << e.what();
        return kNotAvailable;
    }
}

std::vector<uint8_t> build_a2s_info_request(const std::vector<uint8_t>& challenge) {
    std::vector<uint8_t> packet(std::begin(kSimpleHeader), std::end(kSimpleHeader));
    packet.push_back(kInfoRequest);
    packet.insert(packet.end(), kInfoPayload, kInfoPayload + std::strlen(kInfoPayload));
    packet.push_back(0x00);
    packet.insert(packet.end(), challenge.begin(), challenge.end());
    return packet;
}

std::optional<std::vector<uint8_t>> parse_a2s_challenge(const std::vector<uint8_t>& datagram) {
    if (!has_simple_header(datagram) || datagram[4] != kChallengeReply ||
        datagram.size() < 5 + kChallengeLength) {
        return std::nullopt;
    }
    return std::vector<uint8_t>(datagram.begin() + 5, datagram.begin() + 5 + kChallengeLength);
}

A2sInfo parse_a2s_info(const std::vector<uint8_t>& datagram) {
    if (!has_simple_header(datagram)) {
        throw ProtocolError("A2S reply without simple header");
    }
    if (datagram[4] != kInfoReply) {
        throw ProtocolError("unexpected A2S reply type " + std::to_string(datagram[4]));
    }

    A2sReader reader(datagram, 5);
    A2sInfo info;
    info.protocol = reader.u8();
    info.name = reader.cstring();
    info.map = reader.cstring();
    info.folder = reader.cstring();
    info.game = reader.cstring();
    info.app_id = reader.u16_le();
    info.players = reader.u8();
    info.max_players = reader.u8();
    info.bots = reader.u8();
    return info;
}

}  // namespace keeper::query
