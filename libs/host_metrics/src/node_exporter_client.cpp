// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/metrics_scraper.hpp"

#include "keeper/prometheus_parser.hpp"

#include <glog/logging.h>

namespace keeper::host_metrics {

namespace {

std::string describe_failure(const HttpResponse& response) {
    switch (response.error) {
        case HttpError::Timeout:
            return "Request timeout";
        case HttpError::HttpStatus:
            return "HTTP status " + std::to_string(response.status_code);
        case HttpError::ConnectionFailed:
        case HttpError::Internal:
        default:
            return "Connection failed: " + response.error_message;
    }
}

}  // namespace

HostMetricsSnapshot invalid_snapshot(const std::string& message) {
    HostMetricsSnapshot snapshot;
    snapshot.is_valid = false;
    snapshot.error_message = message;
    return snapshot;
}

NodeExporterClient::NodeExporterClient(std::shared_ptr<HttpClient> http,
                                       std::chrono::milliseconds timeout)
    : http_(std::move(http))
    , timeout_(timeout) {
}

HostMetricsSnapshot NodeExporterClient::fetch_metrics(const std::string& url) {
    if (!http_) {
        return invalid_snapshot("Connection failed: no HTTP client");
    }

    HttpResponse response;
    try {
        response = http_->get(url, timeout_);
    } catch (const std::exception& e) {
        LOG(ERROR) << "[node_exporter] Host metrics error: " << e.what();
        return invalid_snapshot(std::string("Connection failed: ") + e.what());
    }

    if (!response.ok()) {
        std::string message = describe_failure(response);
        LOG(ERROR) << "[node_exporter] Host metrics error: " << message;
        return invalid_snapshot(message);
    }

    VLOG(2) << "[node_exporter] Raw response:\n" << response.body;

    try {
        HostMetricsSnapshot snapshot = parse_node_exporter_metrics(response.body);
        if (!snapshot.is_valid) {
            LOG(WARNING) << "[node_exporter] Incomplete metrics from " << url << ": "
                         << snapshot.error_message.value_or("unknown");
        }
        return snapshot;
    } catch (const std::exception& e) {
        LOG(ERROR) << "[node_exporter] Host metrics parse error: " << e.what();
        return invalid_snapshot(std::string("Parse error: ") + e.what());
    }
}

}  // namespace keeper::host_metrics
