// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file socket_transport.hpp
/// @brief Blocking POSIX sockets with explicit deadlines
///
/// Both connections close their descriptor in the destructor, so a probe
/// that unwinds through an exception still releases its socket.

#include "keeper/varint.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace keeper::query {

/// Stream connection used by the SLP and RCON probes
class TcpConnection : public ByteSource {
public:
    TcpConnection() = default;
    ~TcpConnection() override;

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    /// Resolve @p host and connect, trying each address in turn.
    /// Once connected, all reads and writes together must finish within
    /// @p timeout; a peer that trickles bytes cannot extend it.
    /// @throws ConnectError on resolution failure, refusal or timeout
    void connect(const std::string& host, uint16_t port,
                 std::chrono::milliseconds timeout);

    /// Send all of @p data
    /// @throws ConnectError on write failure or timeout
    void write_all(const std::vector<uint8_t>& data);

    /// @throws ConnectError on read failure or timeout
    /// @throws ProtocolError if the peer closes before @p length bytes
    void read_exact(uint8_t* out, size_t length) override;

    bool is_open() const { return fd_ >= 0; }

    void close();

private:
    /// Wait for @p events on the socket before the exchange deadline
    /// @throws ConnectError once the deadline has passed
    void wait_ready(short events, const char* operation);

    int fd_ = -1;
    std::string peer_;
    std::chrono::milliseconds timeout_{0};
    std::chrono::steady_clock::time_point deadline_;
};

/// Connected datagram socket used by the A2S and RakNet probes
class UdpConnection {
public:
    UdpConnection() = default;
    ~UdpConnection();

    UdpConnection(const UdpConnection&) = delete;
    UdpConnection& operator=(const UdpConnection&) = delete;

    /// Resolve @p host and bind the socket to that peer. No packet is sent.
    /// @throws ConnectError on resolution or socket failure
    void connect(const std::string& host, uint16_t port,
                 std::chrono::milliseconds timeout);

    /// @throws ConnectError on send failure
    void send(const std::vector<uint8_t>& datagram);

    /// Wait for one datagram
    /// @throws ConnectError on timeout or ICMP unreachable
    std::vector<uint8_t> receive(size_t max_size = 65535);

    bool is_open() const { return fd_ >= 0; }

    void close();

private:
    int fd_ = -1;
    std::string peer_;
};

}  // namespace keeper::query
