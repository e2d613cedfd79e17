// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/host_metrics_cache.hpp"

#include <glog/logging.h>

namespace keeper::host_metrics {

HostMetricsCache::HostMetricsCache(std::shared_ptr<MetricsScraper> scraper,
                                   const HostMetricsCacheConfig& config)
    : scraper_(std::move(scraper))
    , config_(config) {
}

bool HostMetricsCache::fresh_locked(Clock::time_point now) const {
    return has_fetched_ && now - last_fetch_time_ < config_.ttl;
}

HostMetricsSnapshot HostMetricsCache::get_metrics() {
    HostMetricsSnapshot previous;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (fresh_locked(Clock::now())) {
            return current_;
        }
        if (fetching_) {
            uint64_t waiting_for = generation_ + 1;
            fetch_done_.wait(lock, [&] { return generation_ >= waiting_for; });
            return current_;
        }
        fetching_ = true;
        previous = current_;
    }

    HostMetricsSnapshot fetched;
    if (scraper_) {
        try {
            fetched = scraper_->fetch_metrics(config_.url);
        } catch (const std::exception& e) {
            LOG(ERROR) << "[host_metrics] Scraper raised: " << e.what();
            fetched = invalid_snapshot(std::string("Connection failed: ") + e.what());
        }
    } else {
        fetched = invalid_snapshot("Connection failed: no metrics scraper");
    }

    if (auto usage = delta_cpu_usage(previous, fetched)) {
        VLOG(1) << "[host_metrics] CPU " << fetched.cpu_usage_percent << "% (snapshot) -> "
                << *usage << "% (delta)";
        fetched.cpu_usage_percent = *usage;
    }
    if (!fetched.is_valid) {
        LOG_EVERY_N(WARNING, 10) << "[host_metrics] Invalid snapshot: "
                                 << fetched.error_message.value_or("unknown");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = fetched;
        last_fetch_time_ = Clock::now();
        has_fetched_ = true;
        fetching_ = false;
        ++generation_;
    }
    fetch_done_.notify_all();
    return fetched;
}

std::future<HostMetricsSnapshot> HostMetricsCache::get_metrics_async() {
    return std::async(std::launch::async, [this] { return get_metrics(); });
}

uint64_t HostMetricsCache::fetch_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace keeper::host_metrics
