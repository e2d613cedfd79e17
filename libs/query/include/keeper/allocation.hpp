// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file allocation.hpp
/// @brief Which address to show for a server and which to probe
///
/// The panel supplies one or more (ip, port) allocations per server.
/// The display address depends on whether the allocation lies in the
/// configured internal range; the probe address is the allocation ip
/// unless that is the 0.0.0.0 wildcard.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace keeper::query {

struct ServerAllocation {
    std::string ip;
    uint16_t port = 0;
    bool is_default = false;
};

/// Wildcard bind address that is never a valid probe target
constexpr const char* kWildcardIp = "0.0.0.0";

/// The default allocation, else the first, else nothing
std::optional<ServerAllocation> select_default_allocation(
    const std::vector<ServerAllocation>& allocations);

/// True if @p ip matches @p pattern, where '*' stands for one numeric
/// octet (e.g. "192.168.*.*"). An empty pattern matches nothing.
bool is_internal_ip(const std::string& ip, const std::string& pattern);

/// Allocation ip if internal, else @p external_ip, else "0.0.0.0"
std::string display_ip(const ServerAllocation& allocation,
                       const std::string& internal_ip_structure,
                       const std::string& external_ip);

/// Allocation ip, or display_ip() when it is empty or the wildcard
std::string query_host(const ServerAllocation& allocation,
                       const std::string& internal_ip_structure,
                       const std::string& external_ip);

}  // namespace keeper::query
