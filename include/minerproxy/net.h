/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * TCP/TLS Socket Helpers
 */

#ifndef MINERPROXY_NET_H
#define MINERPROXY_NET_H

#include "minerproxy/types.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

typedef struct ssl_st SSL;
struct sockaddr;

namespace minerproxy {
namespace net {

enum class ReadStatus {
    DATA,
    CLOSED,     // orderly shutdown by peer (or local Shutdown)
    TIMEOUT,
    ERROR
};

/// Non-blocking socket (optionally TLS) exposing blocking reads/writes with deadlines.
/// Reads and writes may run concurrently from two threads.
class Stream {
public:
    ~Stream();

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    /// Resolve, connect and (optionally) complete a TLS handshake within the timeout
    static Result<std::unique_ptr<Stream>> Connect(const std::string& host, uint16_t port,
                                                   bool tls, std::chrono::milliseconds timeout);

    /// Take ownership of an accepted plaintext socket
    static std::unique_ptr<Stream> Adopt(int fd);

    /// Read up to len bytes. A zero read timeout waits indefinitely.
    ReadStatus Read(char* buffer, size_t len, size_t& bytes_read);

    /// Write everything or fail (write timeout applies to the whole call)
    Result<void> WriteAll(const std::string& data);

    void SetReadTimeout(std::chrono::milliseconds timeout) { read_timeout_ = timeout; }
    void SetWriteTimeout(std::chrono::milliseconds timeout) { write_timeout_ = timeout; }

    /// Wake any blocked reader; the descriptor stays valid until destruction
    void Shutdown();

    bool IsTls() const { return ssl_ != nullptr; }
    int GetFd() const { return fd_; }

    /// "ip:port" of the remote end
    std::string GetPeerAddress() const;

private:
    explicit Stream(int fd);

    int fd_;
    SSL* ssl_ = nullptr;
    std::mutex ssl_mutex_;      // SSL objects are not safe for concurrent calls
    std::mutex write_mutex_;    // one writer at a time keeps lines whole
    std::chrono::milliseconds read_timeout_{0};
    std::chrono::milliseconds write_timeout_{std::chrono::seconds(30)};

    Result<void> StartTls(const std::string& host, std::chrono::steady_clock::time_point deadline);
};

/// Bind and listen; returns the listening descriptor
Result<int> Listen(const std::string& host, uint16_t port, int backlog = 128);

/// Port a bound socket actually listens on (for port 0 binds)
uint16_t GetLocalPort(int fd);

/// "ip:port" of a sockaddr produced by accept()
std::string FormatAddress(const struct sockaddr* addr);

} // namespace net
} // namespace minerproxy

#endif // MINERPROXY_NET_H
