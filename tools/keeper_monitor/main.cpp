// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

/// @file main.cpp
/// @brief keeper_monitor - polls game servers and host metrics
///
/// Each cycle probes every configured server concurrently, reads host
/// metrics through the cache, and prints one summary.
///
/// Usage:
///   keeper_monitor --config servers.yaml [--once] [--output json]

#include "keeper/host_metrics_cache.hpp"
#include "keeper/http_client.hpp"
#include "keeper/probe_runner.hpp"
#include "keeper/query_factory.hpp"
#include "monitor_config.hpp"
#include "monitor_report.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

DEFINE_string(config, "", "YAML server list");
DEFINE_string(metrics_url, "http://node-exporter:9100/metrics", "node-exporter metrics endpoint");
DEFINE_int32(interval, 30, "Seconds between poll cycles");
DEFINE_bool(once, false, "Run a single cycle and exit");
DEFINE_string(output, "text", "Summary format: text or json");
DEFINE_bool(host_metrics, true, "Read host metrics from node-exporter");
DEFINE_int32(timeout_ms, 5000, "Probe connect/read/write timeout in milliseconds");

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    LOG(INFO) << "Received signal " << sig << ", shutting down...";
    g_shutdown = true;
}

using keeper::monitor::MonitorConfig;
using keeper::monitor::ServerStatus;

std::vector<ServerStatus> probe_all(const MonitorConfig& config,
                                    const std::shared_ptr<keeper::HttpClient>& http) {
    struct Pending {
        const keeper::monitor::ServerEntry* server;
        std::optional<keeper::query::ProbeTarget> target;
        std::future<keeper::query::ProbeResult> result;
    };

    std::vector<Pending> pending;
    for (const auto& server : config.servers) {
        Pending p{&server, keeper::monitor::resolve_probe_target(server, config), {}};
        if (p.target) {
            keeper::query::QueryOptions options;
            options.timeout = std::chrono::milliseconds(FLAGS_timeout_ms);
            options.rcon_password = server.rcon_password;
            options.rcon_command = server.rcon_command;
            options.http_client = http;
            p.result = keeper::query::probe_server_async(
                keeper::query::create_query_service(server.game, options), *p.target);
        } else {
            LOG(WARNING) << "No allocation for server: " << server.name;
        }
        pending.push_back(std::move(p));
    }

    std::vector<ServerStatus> statuses;
    statuses.reserve(pending.size());
    for (auto& p : pending) {
        keeper::query::ProbeResult result =
            p.result.valid() ? p.result.get() : keeper::query::ProbeResult(keeper::query::kNotAvailable);
        statuses.push_back(keeper::monitor::summarize_probe(*p.server, p.target, result));
    }
    return statuses;
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    gflags::SetUsageMessage("keeper_monitor - game server status and host metrics poller");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    FLAGS_logtostderr = true;

    if (FLAGS_output != "text" && FLAGS_output != "json") {
        LOG(ERROR) << "Unknown --output format: " << FLAGS_output;
        return 1;
    }

    MonitorConfig config;
    if (!FLAGS_config.empty()) {
        try {
            config = keeper::monitor::load_monitor_config(FLAGS_config);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Failed to load config file: " << e.what();
            return 1;
        }
    }

    // Explicitly set flags win over file values
    gflags::CommandLineFlagInfo info;
    if (gflags::GetCommandLineFlagInfo("metrics_url", &info) && !info.is_default) {
        config.metrics_url = FLAGS_metrics_url;
    } else if (FLAGS_config.empty()) {
        config.metrics_url = FLAGS_metrics_url;
    }
    if (gflags::GetCommandLineFlagInfo("interval", &info) && !info.is_default) {
        config.interval_seconds = FLAGS_interval;
    }
    if (config.interval_seconds <= 0) {
        LOG(ERROR) << "--interval must be positive";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    LOG(INFO) << "Starting keeper_monitor";
    LOG(INFO) << "  Servers: " << config.servers.size();
    LOG(INFO) << "  Interval: " << config.interval_seconds << "s";
    LOG(INFO) << "  Probe timeout: " << FLAGS_timeout_ms << "ms";
    if (FLAGS_host_metrics) {
        LOG(INFO) << "  Metrics URL: " << config.metrics_url;
    }

    auto http = keeper::make_default_http_client();

    std::unique_ptr<keeper::host_metrics::HostMetricsCache> metrics_cache;
    if (FLAGS_host_metrics) {
        keeper::host_metrics::HostMetricsCacheConfig cache_config;
        cache_config.url = config.metrics_url;
        metrics_cache = std::make_unique<keeper::host_metrics::HostMetricsCache>(
            std::make_shared<keeper::host_metrics::NodeExporterClient>(http), cache_config);
    }

    uint64_t cycles = 0;
    while (!g_shutdown) {
        auto start = std::chrono::steady_clock::now();

        auto metrics_future = metrics_cache
                                  ? metrics_cache->get_metrics_async()
                                  : std::future<keeper::host_metrics::HostMetricsSnapshot>();
        std::vector<ServerStatus> statuses = probe_all(config, http);

        std::optional<keeper::host_metrics::HostMetricsSnapshot> host;
        if (metrics_future.valid()) {
            host = metrics_future.get();
        }

        if (FLAGS_output == "json") {
            std::cout << keeper::monitor::render_json_text(statuses, host) << std::endl;
        } else {
            std::cout << keeper::monitor::render_text(statuses, host) << std::flush;
        }
        ++cycles;

        if (FLAGS_once) {
            break;
        }

        auto next = start + std::chrono::seconds(config.interval_seconds);
        while (!g_shutdown && std::chrono::steady_clock::now() < next) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    LOG(INFO) << "keeper_monitor stopped after " << cycles << " cycle(s)";
    gflags::ShutDownCommandLineFlags();
    return 0;
}
