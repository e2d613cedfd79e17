// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/http_client.hpp"

#include <curl/curl.h>
#include <glog/logging.h>

#include <mutex>

namespace keeper {

namespace {

std::once_flag g_curl_init_flag;

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

size_t write_callback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

HttpError classify(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return HttpError::Timeout;
        case CURLE_OUT_OF_MEMORY:
        case CURLE_FAILED_INIT:
            return HttpError::Internal;
        default:
            return HttpError::ConnectionFailed;
    }
}

}  // namespace

const char* to_string(HttpError error) {
    switch (error) {
        case HttpError::None: return "none";
        case HttpError::ConnectionFailed: return "connection_failed";
        case HttpError::Timeout: return "timeout";
        case HttpError::HttpStatus: return "http_status";
        case HttpError::Internal: return "internal";
    }
    return "unknown";
}

CurlHttpClient::CurlHttpClient(const CurlHttpClientConfig& config)
    : config_(config) {
    std::call_once(g_curl_init_flag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG(ERROR) << "curl_global_init failed: " << curl_easy_strerror(rc);
        }
    });
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 std::chrono::milliseconds timeout) {
    HttpResponse response;

    std::unique_ptr<CURL, CurlEasyDeleter> handle(curl_easy_init());
    if (!handle) {
        response.error = HttpError::Internal;
        response.error_message = "failed to create curl handle";
        return response;
    }

    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, config_.follow_redirects ? 1L : 0L);
    curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, config_.max_redirects);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);

    CURLcode rc = curl_easy_perform(handle.get());
    if (rc != CURLE_OK) {
        response.error = classify(rc);
        response.error_message = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        response.body.clear();
        VLOG(1) << "GET " << url << " failed (" << to_string(response.error)
                << "): " << response.error_message;
        return response;
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    if (response.status_code < 200 || response.status_code >= 300) {
        response.error = HttpError::HttpStatus;
        response.error_message = "HTTP status " + std::to_string(response.status_code);
        VLOG(1) << "GET " << url << " returned " << response.status_code;
        return response;
    }

    VLOG(2) << "GET " << url << " -> " << response.status_code
            << " (" << response.body.size() << " bytes)";
    return response;
}

std::shared_ptr<HttpClient> make_default_http_client() {
    static std::shared_ptr<HttpClient> client = std::make_shared<CurlHttpClient>();
    return client;
}

}  // namespace keeper
