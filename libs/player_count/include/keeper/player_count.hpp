// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file player_count.hpp
/// @brief Format-sniffing player count extraction
///
/// Turns whatever text a probe produced into an integer player count.
/// Recognised shapes, tried in order (first match wins):
///   1. empty / whitespace-only / digit-free text      -> 0
///   2. "<online>/<max>"                               -> online
///   3. numbered listing, one "N. name, ..." per line  -> number of lines
///   4. CSV with a "name,playeruid,steamid" header     -> number of data lines
///   5. "Online players (N):"                          -> N
///   6. caller-supplied regex, whole match is the int  -> match
///   7. nothing matched                                -> 0
///
/// None of these functions throw. A result of 0 does not tell "empty server"
/// apart from "unparseable"; callers that care look at the raw text too.

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace keeper {

/// One recognised response shape. Returns the count if the text has that
/// shape, nullopt otherwise.
using PlayerCountMatcher = std::function<std::optional<int>(const std::string& response)>;

/// "5/20" (surrounding whitespace allowed) -> 5
std::optional<int> match_slash_count(const std::string& response);

/// Ark-style RCON listing:
///   0. Alice, 76561190000000001
///   1. Bob, 76561190000000002
/// -> 2
std::optional<int> match_numbered_listing(const std::string& response);

/// Palworld-style CSV:
///   name,playeruid,steamid
///   Alice,1234,7656...
/// -> 1
std::optional<int> match_csv_listing(const std::string& response);

/// Factorio-style "Online players (3):" -> 3
std::optional<int> match_online_players_header(const std::string& response);

/// First match of @p pattern (ECMAScript syntax), searched line by line over
/// the first 1 KiB of each line; the match's full text must parse as an
/// integer. An invalid pattern is logged and treated as no match.
std::optional<int> match_custom_pattern(const std::string& response,
                                        const std::string& pattern);

/// Built-in matchers 2-5 in priority order
const std::vector<PlayerCountMatcher>& builtin_player_count_matchers();

/// Extract a player count from a raw server response.
/// @param response Raw probe output (ProbeResult text or RCON body)
/// @param custom_pattern Optional regex tried after the built-in shapes
/// @return Player count, 0 if nothing could be extracted
int extract_player_count(const std::string& response,
                         const std::optional<std::string>& custom_pattern = std::nullopt);

/// Display form used next to a server name:
///   empty response, max > 0  -> "N/A/<max>"
///   empty response           -> "N/A"
///   otherwise                -> "<response>/<max>" or "<response>/Unknown"
std::string format_player_count(const std::string& response, int max_players = 0);

}  // namespace keeper
