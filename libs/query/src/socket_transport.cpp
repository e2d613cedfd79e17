// Copyright 2025 Keeper Contributors
// SPDX-License-Identifier: Apache-2.0

#include "keeper/socket_transport.hpp"

#include "keeper/errors.hpp"

#include <glog/logging.h>

#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace keeper::query {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const { freeaddrinfo(info); }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr resolve(const std::string& host, uint16_t port, int socktype) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socktype;

    addrinfo* result = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw ConnectError("failed to resolve " + host + ": " + gai_strerror(rc));
    }
    return AddrInfoPtr(result);
}

void set_io_timeout(int fd, std::chrono::milliseconds timeout) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        LOG(WARNING) << "Failed to set receive timeout: " << strerror(errno);
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        LOG(WARNING) << "Failed to set send timeout: " << strerror(errno);
    }
}

// Non-blocking connect bounded by poll(). Returns 0 or an errno value.
int connect_with_timeout(int fd, const sockaddr* addr, socklen_t addr_len,
                         std::chrono::milliseconds timeout) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return errno;
    }

    if (::connect(fd, addr, addr_len) < 0) {
        if (errno != EINPROGRESS) {
            return errno;
        }

        pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        pfd.revents = 0;

        int rc;
        do {
            rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);

        if (rc == 0) {
            return ETIMEDOUT;
        }
        if (rc < 0) {
            return errno;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            return errno;
        }
        if (so_error != 0) {
            return so_error;
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        return errno;
    }
    return 0;
}

std::string describe_connect_error(int err, std::chrono::milliseconds timeout) {
    if (err == ETIMEDOUT) {
        return "timed out after " + std::to_string(timeout.count()) + " ms";
    }
    return strerror(err);
}

}  // namespace

// =============================================================================
// TcpConnection
// =============================================================================

TcpConnection::~TcpConnection() {
    close();
}

void TcpConnection::connect(const std::string& host, uint16_t port,
                            std::chrono::milliseconds timeout) {
    close();
    peer_ = host + ":" + std::to_string(port);

    AddrInfoPtr addresses = resolve(host, port, SOCK_STREAM);

    int last_error = ECONNREFUSED;
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }

        int err = connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout);
        if (err != 0) {
            ::close(fd);
            last_error = err;
            continue;
        }

        int nodelay = 1;
        setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
        set_io_timeout(fd, timeout);
        fd_ = fd;
        timeout_ = timeout;
        deadline_ = std::chrono::steady_clock::now() + timeout;
        VLOG(2) << "TCP connected to " << peer_;
        return;
    }

    throw ConnectError("connect to " + peer_ + " failed: " +
                       describe_connect_error(last_error, timeout));
}

void TcpConnection::write_all(const std::vector<uint8_t>& data) {
    if (fd_ < 0) {
        throw ConnectError("write to " + peer_ + " on closed connection");
    }

    size_t offset = 0;
    while (offset < data.size()) {
        wait_ready(POLLOUT, "write to ");
        ssize_t sent = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw ConnectError("write to " + peer_ + " timed out");
            }
            throw ConnectError("write to " + peer_ + " failed: " + strerror(errno));
        }
        offset += static_cast<size_t>(sent);
    }
}

void TcpConnection::read_exact(uint8_t* out, size_t length) {
    if (fd_ < 0) {
        throw ConnectError("read from " + peer_ + " on closed connection");
    }

    size_t offset = 0;
    while (offset < length) {
        wait_ready(POLLIN, "read from ");
        ssize_t received = ::recv(fd_, out + offset, length - offset, 0);
        if (received == 0) {
            throw ProtocolError("connection closed by " + peer_ + " after " +
                                std::to_string(offset) + " of " +
                                std::to_string(length) + " bytes");
        }
        if (received < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw ConnectError("read from " + peer_ + " timed out");
            }
            throw ConnectError("read from " + peer_ + " failed: " + strerror(errno));
        }
        offset += static_cast<size_t>(received);
    }
}

void TcpConnection::wait_ready(short events, const char* operation) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_ - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        pollfd pfd;
        pfd.fd = fd_;
        pfd.events = events;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc > 0) {
            return;
        }
        if (rc < 0 && errno != EINTR) {
            // Let the following send/recv report the socket error
            return;
        }
    }
    throw ConnectError(std::string(operation) + peer_ + " timed out after " +
                       std::to_string(timeout_.count()) + " ms");
}

void TcpConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        VLOG(2) << "TCP connection to " << peer_ << " closed";
    }
}

// =============================================================================
// UdpConnection
// =============================================================================

UdpConnection::~UdpConnection() {
    close();
}

void UdpConnection::connect(const std::string& host, uint16_t port,
                            std::chrono::milliseconds timeout) {
    close();
    peer_ = host + ":" + std::to_string(port);

    AddrInfoPtr addresses = resolve(host, port, SOCK_DGRAM);

    int last_error = EHOSTUNREACH;
    for (addrinfo* ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = errno;
            ::close(fd);
            continue;
        }
        set_io_timeout(fd, timeout);
        fd_ = fd;
        VLOG(2) << "UDP socket bound to " << peer_;
        return;
    }

    throw ConnectError("UDP connect to " + peer_ + " failed: " + strerror(last_error));
}

void UdpConnection::send(const std::vector<uint8_t>& datagram) {
    if (fd_ < 0) {
        throw ConnectError("send to " + peer_ + " on closed socket");
    }

    ssize_t sent;
    do {
        sent = ::send(fd_, datagram.data(), datagram.size(), MSG_NOSIGNAL);
    } while (sent < 0 && errno == EINTR);

    if (sent < 0) {
        throw ConnectError("send to " + peer_ + " failed: " + strerror(errno));
    }
}

std::vector<uint8_t> UdpConnection::receive(size_t max_size) {
    if (fd_ < 0) {
        throw ConnectError("receive from " + peer_ + " on closed socket");
    }

    std::vector<uint8_t> buffer(max_size);
    ssize_t received;
    do {
        received = ::recv(fd_, buffer.data(), buffer.size(), 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw ConnectError("no response from " + peer_ + " within timeout");
        }
        throw ConnectError("receive from " + peer_ + " failed: " + strerror(errno));
    }

    buffer.resize(static_cast<size_t>(received));
    return buffer;
}

void UdpConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

}  // namespace keeper::query
