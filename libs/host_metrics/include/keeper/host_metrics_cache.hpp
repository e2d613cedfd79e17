// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file host_metrics_cache.hpp
/// @brief TTL-gated, single-flight cache in front of a MetricsScraper
///
/// Within the TTL the cached snapshot is returned without a fetch.
/// Once it expires, the first caller fetches without holding the lock;
/// callers arriving meanwhile wait for that fetch and share its result.
/// CPU usage is recomputed from counter deltas against the previous
/// snapshot when both are valid and the counters advanced.

#include "keeper/host_metrics.hpp"
#include "keeper/metrics_scraper.hpp"

#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace keeper::host_metrics {

struct HostMetricsCacheConfig {
    std::string url = kDefaultMetricsUrl;
    std::chrono::milliseconds ttl{1000};
};

class HostMetricsCache {
public:
    HostMetricsCache(std::shared_ptr<MetricsScraper> scraper,
                     const HostMetricsCacheConfig& config = {});

    HostMetricsCache(const HostMetricsCache&) = delete;
    HostMetricsCache& operator=(const HostMetricsCache&) = delete;

    /// Cached snapshot if fresh, else a new one. Never throws.
    HostMetricsSnapshot get_metrics();

    /// get_metrics() on a separate thread
    std::future<HostMetricsSnapshot> get_metrics_async();

    /// Number of upstream fetches performed so far
    uint64_t fetch_count() const;

private:
    using Clock = std::chrono::steady_clock;

    bool fresh_locked(Clock::time_point now) const;

    std::shared_ptr<MetricsScraper> scraper_;
    HostMetricsCacheConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable fetch_done_;
    bool fetching_ = false;
    bool has_fetched_ = false;
    uint64_t generation_ = 0;
    HostMetricsSnapshot current_;
    Clock::time_point last_fetch_time_;
};

}  // namespace keeper::host_metrics
