// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/http_client.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace keeper::test {

namespace {

// Bind an ephemeral loopback port, then release it so nothing listens there
uint16_t closed_loopback_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    close(fd);
    return ntohs(addr.sin_port);
}

}  // namespace

TEST(HttpErrorTest, ToString) {
    EXPECT_STREQ(to_string(HttpError::None), "none");
    EXPECT_STREQ(to_string(HttpError::ConnectionFailed), "connection_failed");
    EXPECT_STREQ(to_string(HttpError::Timeout), "timeout");
    EXPECT_STREQ(to_string(HttpError::HttpStatus), "http_status");
    EXPECT_STREQ(to_string(HttpError::Internal), "internal");
}

TEST(HttpResponseTest, DefaultIsOk) {
    HttpResponse response;
    EXPECT_TRUE(response.ok());
    response.error = HttpError::Timeout;
    EXPECT_FALSE(response.ok());
}

TEST(CurlHttpClientTest, RefusedConnectionIsReportedNotThrown) {
    CurlHttpClient client;
    std::string url = "http://127.0.0.1:" + std::to_string(closed_loopback_port()) + "/metrics";

    HttpResponse response = client.get(url, std::chrono::milliseconds(2000));

    EXPECT_FALSE(response.ok());
    EXPECT_EQ(response.error, HttpError::ConnectionFailed);
    EXPECT_FALSE(response.error_message.empty());
    EXPECT_TRUE(response.body.empty());
}

TEST(CurlHttpClientTest, MalformedUrlIsReportedNotThrown) {
    CurlHttpClient client;
    HttpResponse response = client.get("not a url at all", std::chrono::milliseconds(500));
    EXPECT_FALSE(response.ok());
    EXPECT_FALSE(response.error_message.empty());
}

TEST(CurlHttpClientTest, DefaultClientIsShared) {
    auto a = make_default_http_client();
    auto b = make_default_http_client();
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a.get(), b.get());
}

}  // namespace keeper::test
