/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * TCP/TLS Socket Helpers
 */

#include "minerproxy/net.h"
#include "minerproxy/util.h"
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>

#include <openssl/ssl.h>
#include <openssl/err.h>

namespace minerproxy {
namespace net {

namespace {

using SteadyClock = std::chrono::steady_clock;

bool SetNonBlocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

/// Milliseconds left until the deadline (-1 waits forever when there is none)
int RemainingMs(bool has_deadline, SteadyClock::time_point deadline) {
    if (!has_deadline) return -1;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

/// Wait for readiness; returns >0 ready, 0 timeout, <0 error
int WaitFor(int fd, short events, int timeout_ms) {
    while (true) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int rc = poll(&pfd, 1, timeout_ms);
        if (rc < 0 && errno == EINTR) continue;
        return rc;
    }
}

std::string LastSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

/// Shared client context; upstream pools commonly present self-signed certificates
SSL_CTX* ClientContext() {
    static SSL_CTX* ctx = [] {
        SSL_CTX* c = SSL_CTX_new(TLS_client_method());
        if (c) {
            SSL_CTX_set_verify(c, SSL_VERIFY_NONE, nullptr);
            SSL_CTX_set_min_proto_version(c, TLS1_2_VERSION);
        }
        return c;
    }();
    return ctx;
}

Result<int> ConnectTcp(const std::string& host, uint16_t port, SteadyClock::time_point deadline) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (rc != 0) {
        return Result<int>::Error("Failed to resolve " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "No addresses for " + host;
    int connected_fd = -1;

    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("Failed to create socket: ") + std::strerror(errno);
            continue;
        }
        if (!SetNonBlocking(fd)) {
            last_error = std::string("Failed to set non-blocking: ") + std::strerror(errno);
            close(fd);
            continue;
        }

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            connected_fd = fd;
            break;
        }
        if (errno != EINPROGRESS) {
            last_error = std::string("Connection refused: ") + std::strerror(errno);
            close(fd);
            continue;
        }

        int ready = WaitFor(fd, POLLOUT, RemainingMs(true, deadline));
        if (ready == 0) {
            last_error = "Connection timeout";
            close(fd);
            break;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (ready < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            last_error = std::string("Connection failed: ") + std::strerror(so_error ? so_error : errno);
            close(fd);
            continue;
        }

        connected_fd = fd;
        break;
    }

    freeaddrinfo(results);

    if (connected_fd < 0) {
        return Result<int>::Error(last_error);
    }

    int one = 1;
    setsockopt(connected_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return Result<int>::Ok(connected_fd);
}

} // namespace

// ============================================================================
// Stream
// ============================================================================

Stream::Stream(int fd)
    : fd_(fd)
{}

Stream::~Stream() {
    if (ssl_) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

Result<std::unique_ptr<Stream>> Stream::Connect(const std::string& host, uint16_t port,
                                                bool tls, std::chrono::milliseconds timeout) {
    auto deadline = SteadyClock::now() + timeout;

    auto fd_result = ConnectTcp(host, port, deadline);
    if (fd_result.IsError()) {
        return Result<std::unique_ptr<Stream>>::Error(fd_result.GetError());
    }

    std::unique_ptr<Stream> stream(new Stream(fd_result.GetValue()));

    if (tls) {
        auto tls_result = stream->StartTls(host, deadline);
        if (tls_result.IsError()) {
            return Result<std::unique_ptr<Stream>>::Error(tls_result.GetError());
        }
    }

    return Result<std::unique_ptr<Stream>>::Ok(std::move(stream));
}

std::unique_ptr<Stream> Stream::Adopt(int fd) {
    SetNonBlocking(fd);
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return std::unique_ptr<Stream>(new Stream(fd));
}

Result<void> Stream::StartTls(const std::string& host, SteadyClock::time_point deadline) {
    SSL_CTX* ctx = ClientContext();
    if (!ctx) {
        return Result<void>::Error("Failed to create TLS context: " + LastSslError());
    }

    ssl_ = SSL_new(ctx);
    if (!ssl_) {
        return Result<void>::Error("Failed to create TLS session: " + LastSslError());
    }

    SSL_set_fd(ssl_, fd_);
    SSL_set_tlsext_host_name(ssl_, host.c_str());

    while (true) {
        ERR_clear_error();
        int rc = SSL_connect(ssl_);
        if (rc == 1) {
            return Result<void>::Ok();
        }

        int err = SSL_get_error(ssl_, rc);
        short events;
        if (err == SSL_ERROR_WANT_READ) {
            events = POLLIN;
        } else if (err == SSL_ERROR_WANT_WRITE) {
            events = POLLOUT;
        } else {
            return Result<void>::Error("TLS handshake failed: " + LastSslError());
        }

        int ready = WaitFor(fd_, events, RemainingMs(true, deadline));
        if (ready == 0) {
            return Result<void>::Error("TLS handshake timeout");
        }
        if (ready < 0) {
            return Result<void>::Error(std::string("TLS handshake failed: ") + std::strerror(errno));
        }
    }
}

ReadStatus Stream::Read(char* buffer, size_t len, size_t& bytes_read) {
    bytes_read = 0;
    bool has_deadline = read_timeout_.count() > 0;
    auto deadline = SteadyClock::now() + read_timeout_;

    while (true) {
        short events = POLLIN;

        if (ssl_) {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            ERR_clear_error();
            int n = SSL_read(ssl_, buffer, static_cast<int>(len));
            if (n > 0) {
                bytes_read = static_cast<size_t>(n);
                return ReadStatus::DATA;
            }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_ZERO_RETURN) {
                return ReadStatus::CLOSED;
            }
            if (err == SSL_ERROR_WANT_WRITE) {
                events = POLLOUT;
            } else if (err != SSL_ERROR_WANT_READ) {
                return ReadStatus::ERROR;
            }
        } else {
            ssize_t n = recv(fd_, buffer, len, 0);
            if (n > 0) {
                bytes_read = static_cast<size_t>(n);
                return ReadStatus::DATA;
            }
            if (n == 0) {
                return ReadStatus::CLOSED;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return ReadStatus::ERROR;
            }
        }

        int remaining = RemainingMs(has_deadline, deadline);
        if (remaining == 0) {
            return ReadStatus::TIMEOUT;
        }
        int ready = WaitFor(fd_, events, remaining);
        if (ready == 0) {
            return ReadStatus::TIMEOUT;
        }
        if (ready < 0) {
            return ReadStatus::ERROR;
        }
    }
}

Result<void> Stream::WriteAll(const std::string& data) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);

    auto deadline = SteadyClock::now() + write_timeout_;
    size_t sent = 0;

    while (sent < data.size()) {
        short events = POLLOUT;

        if (ssl_) {
            std::lock_guard<std::mutex> lock(ssl_mutex_);
            ERR_clear_error();
            int n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            int err = SSL_get_error(ssl_, n);
            if (err == SSL_ERROR_WANT_READ) {
                events = POLLIN;
            } else if (err != SSL_ERROR_WANT_WRITE) {
                return Result<void>::Error("TLS write failed: " + LastSslError());
            }
        } else {
            ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                return Result<void>::Error(std::string("Send failed: ") + std::strerror(errno));
            }
        }

        int ready = WaitFor(fd_, events, RemainingMs(true, deadline));
        if (ready == 0) {
            return Result<void>::Error("Write timeout");
        }
        if (ready < 0) {
            return Result<void>::Error(std::string("Send failed: ") + std::strerror(errno));
        }
    }

    return Result<void>::Ok();
}

void Stream::Shutdown() {
    if (fd_ >= 0) {
        shutdown(fd_, SHUT_RDWR);
    }
}

std::string Stream::GetPeerAddress() const {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getpeername(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return "unknown";
    }
    return FormatAddress(reinterpret_cast<struct sockaddr*>(&addr));
}

// ============================================================================
// Listening Sockets
// ============================================================================

Result<int> Listen(const std::string& host, uint16_t port, int backlog) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return Result<int>::Error("Failed to create socket");
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close(fd);
        return Result<int>::Error("Failed to set socket options");
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        address.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) != 1) {
        close(fd);
        return Result<int>::Error("Invalid bind address: " + host);
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        close(fd);
        return Result<int>::Error("Failed to bind to " + host + ":" + std::to_string(port));
    }

    if (listen(fd, backlog) < 0) {
        close(fd);
        return Result<int>::Error("Failed to listen on socket");
    }

    return Result<int>::Ok(fd);
}

uint16_t GetLocalPort(int fd) {
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::string FormatAddress(const struct sockaddr* addr) {
    char ip[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;

    if (addr->sa_family == AF_INET) {
        auto in = reinterpret_cast<const struct sockaddr_in*>(addr);
        inet_ntop(AF_INET, &in->sin_addr, ip, sizeof(ip));
        port = ntohs(in->sin_port);
    } else if (addr->sa_family == AF_INET6) {
        auto in6 = reinterpret_cast<const struct sockaddr_in6*>(addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }

    return std::string(ip) + ":" + std::to_string(port);
}

} // namespace net
} // namespace minerproxy
