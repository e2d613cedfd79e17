// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file probe_runner.hpp
/// @brief connect -> query -> dispose with guaranteed cleanup

#include "keeper/query_service.hpp"

#include <future>
#include <memory>

namespace keeper::query {

/// Probe @p target once. A failed connect yields service.fallback(target).
/// Never throws; dispose() runs on every path.
ProbeResult probe_server(QueryService& service, const ProbeTarget& target);

/// probe_server on a separate thread. The future owns @p service.
std::future<ProbeResult> probe_server_async(std::unique_ptr<QueryService> service,
                                            ProbeTarget target);

}  // namespace keeper::query
