// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/probe_runner.hpp"

#include "keeper/errors.hpp"

#include <glog/logging.h>

namespace keeper::query {

namespace {

class DisposeGuard {
public:
    explicit DisposeGuard(QueryService& service) : service_(service) {}
    ~DisposeGuard() { service_.dispose(); }

    DisposeGuard(const DisposeGuard&) = delete;
    DisposeGuard& operator=(const DisposeGuard&) = delete;

private:
    QueryService& service_;
};

}  // namespace

ProbeResult probe_server(QueryService& service, const ProbeTarget& target) {
    DisposeGuard guard(service);

    try {
        service.connect(target);
    } catch (const ConnectError& e) {
        LOG(WARNING) << "[" << service.name() << "] Connect to " << target.to_string()
                     << " failed: " << e.what();
        return service.fallback(target);
    } catch (const std::exception& e) {
        LOG(WARNING) << "[" << service.name() << "] Connect to " << target.to_string()
                     << " raised: " << e.what();
        return service.fallback(target);
    }

    return service.query();
}

std::future<ProbeResult> probe_server_async(std::unique_ptr<QueryService> service,
                                            ProbeTarget target) {
    std::shared_ptr<QueryService> owned(std::move(service));
    return std::async(std::launch::async, [owned, target]() -> ProbeResult {
        if (!owned) {
            return kNotAvailable;
        }
        return probe_server(*owned, target);
    });
}

}  // namespace keeper::query
