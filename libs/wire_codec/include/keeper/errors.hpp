// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file errors.hpp
/// @brief Exception types raised inside probe implementations
///
/// These never cross a public probe entry point. QueryService::query() and
/// probe_server() convert them into a fallback result or "N/A".

#include <stdexcept>
#include <string>

namespace keeper {

/// Transport could not be established or broke mid-exchange
/// (refused, unreachable, DNS failure, read/write timeout).
class ConnectError : public std::runtime_error {
public:
    explicit ConnectError(const std::string& what) : std::runtime_error(what) {}
};

/// Peer sent bytes that do not decode (oversized varint, truncated frame,
/// unexpected packet type).
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace keeper
