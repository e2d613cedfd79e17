// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file fallback_resolver.hpp
/// @brief Secondary player-count source used when a direct probe fails
///
/// A resolver is the terminal tier: it never throws and returns either
/// "<online>/<max>" or "N/A".

#include "keeper/http_client.hpp"
#include "keeper/query_service.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace keeper::query {

/// Abstract interface for fallback resolution
class FallbackResolver {
public:
    virtual ~FallbackResolver() = default;

    /// Resolve a player count for @p target. Never throws.
    virtual ProbeResult resolve(const ProbeTarget& target) = 0;

    /// Resolver name for logging
    virtual std::string name() const = 0;
};

/// Configuration for McStatusResolver
struct McStatusResolverConfig {
    std::string base_url = "https://api.mcstatus.io/v2/status/java/";
    std::chrono::milliseconds timeout{5000};
};

/// Asks the mcstatus.io aggregation API for a Java server's status
class McStatusResolver : public FallbackResolver {
public:
    explicit McStatusResolver(std::shared_ptr<HttpClient> http,
                              const McStatusResolverConfig& config = {});

    ProbeResult resolve(const ProbeTarget& target) override;
    std::string name() const override { return "mcstatus"; }

    /// "<base_url><host>:<port>"
    std::string status_url(const ProbeTarget& target) const;

private:
    std::shared_ptr<HttpClient> http_;
    McStatusResolverConfig config_;
};

/// Parse an mcstatus.io body into "<online>/<max>", or "N/A"
ProbeResult parse_mcstatus_response(const std::string& body);

}  // namespace keeper::query
