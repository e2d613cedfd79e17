// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/status_text.hpp"

#include <cctype>

namespace keeper::query {

namespace {

// Counts above this many digits are treated as garbage
constexpr size_t kMaxDigits = 18;

size_t skip_whitespace(const std::string& text, size_t pos, size_t end) {
    while (pos < end && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    return pos;
}

// Value of the first `"key": <digits>` in [from, end); non-numeric values
// (e.g. "online": true) are skipped.
std::optional<int64_t> find_int_field(const std::string& text, const std::string& key,
                                      size_t from, size_t end, size_t* found_at = nullptr) {
    const std::string quoted = "\"" + key + "\"";
    size_t pos = text.find(quoted, from);
    while (pos != std::string::npos && pos + quoted.size() <= end) {
        size_t cursor = skip_whitespace(text, pos + quoted.size(), end);
        if (cursor < end && text[cursor] == ':') {
            cursor = skip_whitespace(text, cursor + 1, end);
            size_t digits_start = cursor;
            while (cursor < end && std::isdigit(static_cast<unsigned char>(text[cursor]))) {
                ++cursor;
            }
            size_t digit_count = cursor - digits_start;
            if (digit_count > 0 && digit_count <= kMaxDigits) {
                if (found_at) {
                    *found_at = pos;
                }
                return std::stoll(text.substr(digits_start, digit_count));
            }
        }
        pos = text.find(quoted, pos + quoted.size());
    }
    return std::nullopt;
}

// Index one past the '}' matching the '{' at @p open, or text.size() if the
// object is unterminated. Braces inside string literals are ignored.
size_t object_end(const std::string& text, size_t open) {
    int depth = 0;
    bool in_string = false;
    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) {
                return i + 1;
            }
        }
    }
    return text.size();
}

}  // namespace

std::string PlayerCounts::to_result() const {
    return std::to_string(online) + "/" + std::to_string(max);
}

std::optional<PlayerCounts> find_players_object_counts(const std::string& text) {
    const std::string key = "\"players\"";
    size_t pos = text.find(key);
    while (pos != std::string::npos) {
        size_t cursor = skip_whitespace(text, pos + key.size(), text.size());
        if (cursor < text.size() && text[cursor] == ':') {
            cursor = skip_whitespace(text, cursor + 1, text.size());
            if (cursor < text.size() && text[cursor] == '{') {
                size_t end = object_end(text, cursor);
                auto online = find_int_field(text, "online", cursor, end);
                auto max = find_int_field(text, "max", cursor, end);
                if (online && max) {
                    return PlayerCounts{*online, *max};
                }
            }
        }
        pos = text.find(key, pos + key.size());
    }
    return std::nullopt;
}

std::optional<PlayerCounts> find_loose_counts(const std::string& text) {
    size_t online_at = 0;
    auto online = find_int_field(text, "online", 0, text.size(), &online_at);
    if (!online) {
        return std::nullopt;
    }
    auto max = find_int_field(text, "max", online_at, text.size());
    if (!max) {
        return std::nullopt;
    }
    return PlayerCounts{*online, *max};
}

std::optional<PlayerCounts> find_player_counts(const std::string& text) {
    if (auto counts = find_players_object_counts(text)) {
        return counts;
    }
    return find_loose_counts(text);
}

}  // namespace keeper::query
