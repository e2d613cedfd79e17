// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/fallback_resolver.hpp"

#include "keeper/status_text.hpp"

#include <glog/logging.h>

#include <algorithm>

namespace keeper::query {

McStatusResolver::McStatusResolver(std::shared_ptr<HttpClient> http,
                                   const McStatusResolverConfig& config)
    : http_(std::move(http))
    , config_(config) {
}

std::string McStatusResolver::status_url(const ProbeTarget& target) const {
    return config_.base_url + target.to_string();
}

ProbeResult McStatusResolver::resolve(const ProbeTarget& target) {
    if (!http_) {
        return kNotAvailable;
    }

    std::string url = status_url(target);
    VLOG(1) << "[mcstatus] Querying " << url;

    try {
        HttpResponse response = http_->get(url, config_.timeout);
        if (!response.ok()) {
            LOG(WARNING) << "[mcstatus] Fallback failed for " << target.to_string()
                         << ": " << response.error_message;
            return kNotAvailable;
        }

        VLOG(2) << "[mcstatus] Response: "
                << response.body.substr(0, std::min<size_t>(100, response.body.size()));

        ProbeResult result = parse_mcstatus_response(response.body);
        if (result == kNotAvailable) {
            LOG(WARNING) << "[mcstatus] Response for " << target.to_string()
                         << " carries no player counts";
        } else {
            VLOG(1) << "[mcstatus] " << target.to_string() << " -> " << result;
        }
        return result;
    } catch (const std::exception& e) {
        LOG(WARNING) << "[mcstatus] Fallback failed for " << target.to_string()
                     << ": " << e.what();
        return kNotAvailable;
    }
}

ProbeResult parse_mcstatus_response(const std::string& body) {
    auto counts = find_player_counts(body);
    if (!counts) {
        return kNotAvailable;
    }
    return counts->to_result();
}

}  // namespace keeper::query
