// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file http_client.hpp
/// @brief Bounded-timeout HTTP GET abstraction
///
/// Used by the mcstatus.io fallback resolver and the node-exporter scraper.
/// Failures are reported in the returned HttpResponse, never thrown, so
/// callers can turn them into "N/A" or an invalid snapshot directly.

#include <chrono>
#include <memory>
#include <string>

namespace keeper {

/// Failure category of an HTTP request
enum class HttpError {
    None,              ///< 2xx response received
    ConnectionFailed,  ///< DNS, refused, reset, TLS failure
    Timeout,           ///< Request exceeded its deadline
    HttpStatus,        ///< Response received with a non-2xx status
    Internal           ///< Client could not be set up
};

/// Convert HttpError to string for logging
const char* to_string(HttpError error);

/// Result of one GET
struct HttpResponse {
    HttpError error = HttpError::None;
    long status_code = 0;
    std::string body;
    std::string error_message;  ///< Human-readable detail when error != None

    bool ok() const { return error == HttpError::None; }
};

/// Abstract HTTP client
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /// Perform a GET with the given overall timeout
    virtual HttpResponse get(const std::string& url,
                             std::chrono::milliseconds timeout) = 0;
};

/// Configuration for CurlHttpClient
struct CurlHttpClientConfig {
    std::string user_agent = "keeper/0.1";
    bool follow_redirects = true;
    long max_redirects = 3;
};

/// libcurl-backed client. One easy handle per request, safe to share
/// between threads.
class CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(const CurlHttpClientConfig& config = {});

    HttpResponse get(const std::string& url,
                     std::chrono::milliseconds timeout) override;

private:
    CurlHttpClientConfig config_;
};

/// Shared default client
std::shared_ptr<HttpClient> make_default_http_client();

}  // namespace keeper
