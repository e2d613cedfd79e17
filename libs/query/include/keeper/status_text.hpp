// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file status_text.hpp
/// @brief Tolerant extraction of player counts from JSON-like status text
///
/// Status payloads (the SLP response, the mcstatus.io body) are not parsed
/// as structured JSON: upstream formats drift, and only two integers are
/// needed. The scanner looks for "online": N and "max": M, first inside the
/// "players" object (either order), then anywhere with "online" before "max".

#include <cstdint>
#include <optional>
#include <string>

namespace keeper::query {

struct PlayerCounts {
    int64_t online = 0;
    int64_t max = 0;

    /// "<online>/<max>"
    std::string to_result() const;
};

/// Counts scoped to the first "players": { ... } object that has both
std::optional<PlayerCounts> find_players_object_counts(const std::string& text);

/// First numeric "online" anywhere, then the first numeric "max" after it
std::optional<PlayerCounts> find_loose_counts(const std::string& text);

/// find_players_object_counts, then find_loose_counts
std::optional<PlayerCounts> find_player_counts(const std::string& text);

}  // namespace keeper::query
