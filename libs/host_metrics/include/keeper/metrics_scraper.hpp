// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file metrics_scraper.hpp
/// @brief One-shot fetch of host metrics from a node-exporter endpoint

#include "keeper/host_metrics.hpp"
#include "keeper/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace keeper::host_metrics {

/// Default node-exporter endpoint inside the compose network
constexpr const char* kDefaultMetricsUrl = "http://node-exporter:9100/metrics";

/// Abstract interface for metrics sources
class MetricsScraper {
public:
    virtual ~MetricsScraper() = default;

    /// Fetch and parse one snapshot. Never throws: failures produce an
    /// invalid snapshot with error_message set.
    virtual HostMetricsSnapshot fetch_metrics(const std::string& url) = 0;
};

/// Scrapes the Prometheus text endpoint of node-exporter over HTTP
class NodeExporterClient : public MetricsScraper {
public:
    explicit NodeExporterClient(std::shared_ptr<HttpClient> http,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    HostMetricsSnapshot fetch_metrics(const std::string& url) override;

private:
    std::shared_ptr<HttpClient> http_;
    std::chrono::milliseconds timeout_;
};

/// Invalid snapshot carrying @p message
HostMetricsSnapshot invalid_snapshot(const std::string& message);

}  // namespace keeper::host_metrics
