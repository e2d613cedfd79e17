// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/allocation.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>

namespace keeper::query {

namespace {

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// '*' takes one or more digits, shortest run first
bool matches_from(const std::string& ip, size_t i, const std::string& pattern, size_t p) {
    for (; p < pattern.size(); ++p, ++i) {
        if (pattern[p] == '*') {
            for (size_t end = i + 1; end <= ip.size() && is_digit(ip[end - 1]); ++end) {
                if (matches_from(ip, end, pattern, p + 1)) {
                    return true;
                }
            }
            return false;
        }
        if (i >= ip.size() || ip[i] != pattern[p]) {
            return false;
        }
    }
    return i == ip.size();
}

}  // namespace

std::optional<ServerAllocation> select_default_allocation(
    const std::vector<ServerAllocation>& allocations) {
    if (allocations.empty()) {
        return std::nullopt;
    }
    auto it = std::find_if(allocations.begin(), allocations.end(),
                           [](const ServerAllocation& a) { return a.is_default; });
    return it != allocations.end() ? *it : allocations.front();
}

bool is_internal_ip(const std::string& ip, const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }
    return matches_from(ip, 0, pattern, 0);
}

std::string display_ip(const ServerAllocation& allocation,
                       const std::string& internal_ip_structure,
                       const std::string& external_ip) {
    if (is_internal_ip(allocation.ip, internal_ip_structure)) {
        return allocation.ip;
    }
    return external_ip.empty() ? kWildcardIp : external_ip;
}

std::string query_host(const ServerAllocation& allocation,
                       const std::string& internal_ip_structure,
                       const std::string& external_ip) {
    if (allocation.ip.empty() || allocation.ip == kWildcardIp) {
        std::string host = display_ip(allocation, internal_ip_structure, external_ip);
        VLOG(1) << "Allocation ip '" << allocation.ip << "' is not queryable, using " << host;
        return host;
    }
    return allocation.ip;
}

}  // namespace keeper::query
