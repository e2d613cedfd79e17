// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file query_service.hpp
/// @brief Abstract interface for game server status probes
///
/// QueryService is the capability set every protocol family implements:
/// - connect(target): open the transport, throws ConnectError
/// - query(): run the protocol exchange, never throws
/// - dispose(): release the transport, idempotent
///
/// Each implementation owns its transport exclusively; different instances
/// share no mutable state and may run concurrently.
///
/// Implementations:
/// - MinecraftJavaQuery: Server List Ping over TCP, mcstatus.io fallback
/// - BedrockQuery: RakNet unconnected ping over UDP
/// - SourceQuery: A2S_INFO over UDP
/// - RconQuery: Source RCON player listing over TCP

#include <chrono>
#include <cstdint>
#include <string>

namespace keeper::query {

/// Normalized probe output: "<online>/<max>", raw protocol text, or "N/A"
using ProbeResult = std::string;

/// Sentinel for "no data available". Zero players is "0/<max>", not this.
constexpr const char* kNotAvailable = "N/A";

/// Default connect/read/write budget for every probe
constexpr std::chrono::milliseconds kDefaultProbeTimeout{5000};

/// Network endpoint of one game server
struct ProbeTarget {
    std::string host;
    uint16_t port = 0;

    std::string to_string() const { return host + ":" + std::to_string(port); }
};

/// Abstract interface for one protocol family's status probe
class QueryService {
public:
    virtual ~QueryService() = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Open the transport to @p target
    /// @throws ConnectError on refusal, unreachable host or timeout
    virtual void connect(const ProbeTarget& target) = 0;

    /// Release transport resources. Safe to call more than once.
    virtual void dispose() = 0;

    // =========================================================================
    // Query
    // =========================================================================

    /// Run the status exchange on the connected transport.
    /// Never throws: failures resolve to fallback() or kNotAvailable.
    virtual ProbeResult query() = 0;

    /// Result used when connect() fails. Families without a secondary
    /// source return kNotAvailable.
    virtual ProbeResult fallback(const ProbeTarget& target) {
        (void)target;
        return kNotAvailable;
    }

    // =========================================================================
    // Metadata
    // =========================================================================

    /// Protocol family name for logging
    virtual std::string name() const = 0;
};

}  // namespace keeper::query
