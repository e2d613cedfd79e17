// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/player_count.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace keeper {

namespace {

// Custom patterns run line by line on at most this many bytes per line
constexpr size_t kMaxPatternLineLength = 1024;

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool has_digit(const std::string& text) {
    return std::any_of(text.begin(), text.end(), is_digit);
}

bool all_digits(const std::string& text, size_t begin, size_t end) {
    return std::all_of(text.begin() + static_cast<std::ptrdiff_t>(begin),
                       text.begin() + static_cast<std::ptrdiff_t>(end), is_digit);
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n\f\v";
    auto start = text.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

// Whole-string integer parse; surrounding whitespace and a sign are allowed
std::optional<int> parse_int(const std::string& text) {
    std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(trimmed.c_str(), &end, 10);
    if (errno == ERANGE || end == trimmed.c_str() || *end != '\0' ||
        value < INT_MIN || value > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// "<digits>." then a non-empty name up to the first comma, then a non-empty
// remainder. The digits and the dot may appear anywhere in the line.
bool is_numbered_entry(const std::string& line) {
    size_t comma = std::string::npos;
    for (size_t dot = 1; dot < line.size(); ++dot) {
        if (line[dot] != '.' || !is_digit(line[dot - 1])) {
            continue;
        }
        if (comma == std::string::npos || comma <= dot) {
            comma = line.find(',', dot + 1);
            if (comma == std::string::npos) {
                return false;
            }
        }
        if (comma > dot + 1 && comma + 1 < line.size()) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::optional<int> match_slash_count(const std::string& response) {
    std::string trimmed = trim(response);
    size_t slash = trimmed.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == trimmed.size()) {
        return std::nullopt;
    }
    if (!all_digits(trimmed, 0, slash) ||
        !all_digits(trimmed, slash + 1, trimmed.size())) {
        return std::nullopt;
    }
    return parse_int(trimmed.substr(0, slash));
}

std::optional<int> match_numbered_listing(const std::string& response) {
    int count = 0;
    for (const auto& line : split_lines(response)) {
        if (is_numbered_entry(line)) {
            ++count;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return count;
}

std::optional<int> match_csv_listing(const std::string& response) {
    if (response.find("name,playeruid,steamid") == std::string::npos) {
        return std::nullopt;
    }
    int count = 0;
    for (const auto& line : split_lines(response)) {
        if (line.empty() || line.rfind("name,", 0) == 0) {
            continue;
        }
        ++count;
    }
    if (count == 0) {
        return std::nullopt;
    }
    return count;
}

std::optional<int> match_online_players_header(const std::string& response) {
    static const std::string kPrefix = "Online players (";
    for (size_t pos = response.find(kPrefix); pos != std::string::npos;
         pos = response.find(kPrefix, pos + 1)) {
        size_t start = pos + kPrefix.size();
        size_t end = start;
        while (end < response.size() && is_digit(response[end])) {
            ++end;
        }
        if (end > start && response.compare(end, 2, "):") == 0) {
            return parse_int(response.substr(start, end - start));
        }
    }
    return std::nullopt;
}

std::optional<int> match_custom_pattern(const std::string& response,
                                        const std::string& pattern) {
    if (pattern.empty()) {
        return std::nullopt;
    }
    try {
        std::regex custom(pattern);
        std::smatch match;
        for (const auto& line : split_lines(response)) {
            std::string bounded = line.substr(0, kMaxPatternLineLength);
            if (std::regex_search(bounded, match, custom)) {
                return parse_int(match.str(0));
            }
        }
        return std::nullopt;
    } catch (const std::regex_error& e) {
        LOG_EVERY_N(WARNING, 50) << "Invalid player count pattern '" << pattern
                                 << "': " << e.what();
        return std::nullopt;
    }
}

const std::vector<PlayerCountMatcher>& builtin_player_count_matchers() {
    static const std::vector<PlayerCountMatcher> matchers = {
        match_slash_count,
        match_numbered_listing,
        match_csv_listing,
        match_online_players_header,
    };
    return matchers;
}

int extract_player_count(const std::string& response,
                         const std::optional<std::string>& custom_pattern) {
    if (trim(response).empty()) {
        VLOG(1) << "Empty server response for player count";
        return 0;
    }
    if (!has_digit(response)) {
        return 0;
    }

    for (const auto& matcher : builtin_player_count_matchers()) {
        if (auto count = matcher(response)) {
            return *count;
        }
    }

    if (custom_pattern) {
        if (auto count = match_custom_pattern(response, *custom_pattern)) {
            return *count;
        }
    }

    VLOG(1) << "No player count shape matched response of " << response.size() << " bytes";
    return 0;
}

std::string format_player_count(const std::string& response, int max_players) {
    if (response.empty()) {
        return max_players > 0 ? "N/A/" + std::to_string(max_players) : "N/A";
    }
    std::string max_display = max_players > 0 ? std::to_string(max_players) : "Unknown";
    return response + "/" + max_display;
}

}  // namespace keeper
