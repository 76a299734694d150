/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Stratum Proxy Listener
 */

#include "minerproxy/proxy.h"
#include "minerproxy/util.h"
#include <algorithm>
#include <condition_variable>
#include <deque>

#include <sys/socket.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

namespace minerproxy {

// ============================================================================
// Proxy Server Implementation
// ============================================================================

class ProxyServer::Impl {
public:
    Impl(ListenerConfig config, SessionManager& sessions)
        : config_(std::move(config))
        , sessions_(sessions)
    {}

    ~Impl() {
        Stop();
    }

    Result<void> Start() {
        if (is_running_) {
            return Result<void>::Error("Proxy server already running");
        }

        auto listen_result = net::Listen(config_.host, config_.port);
        if (listen_result.IsError()) {
            return Result<void>::Error(listen_result.GetError());
        }
        server_socket_ = listen_result.GetValue();
        bound_port_ = net::GetLocalPort(server_socket_);

        is_running_ = true;

        // Start accept thread
        accept_thread_ = std::thread(&Impl::AcceptLoop, this);

        // Start upstream redial workers
        size_t workers = std::max<size_t>(config_.reconnect_workers, 1);
        for (size_t i = 0; i < workers; i++) {
            reconnect_threads_.emplace_back(&Impl::ReconnectWorker, this);
        }

        // Start reconnect scheduling / idle sweep thread
        maintenance_thread_ = std::thread(&Impl::MaintenanceLoop, this);

        LogInfo("Proxy", "Stratum proxy listening on " + config_.host + ":" +
                std::to_string(bound_port_));
        return Result<void>::Ok();
    }

    void Stop() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            if (!is_running_) return;
            is_running_ = false;
        }
        wait_cv_.notify_all();
        {
            std::lock_guard<std::mutex> lock(reconnect_mutex_);
            reconnect_queue_.clear();
        }
        reconnect_cv_.notify_all();

        // Wait for accept thread
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }

        // Wait for maintenance thread
        if (maintenance_thread_.joinable()) {
            maintenance_thread_.join();
        }

        // Wait for redials in flight
        for (auto& thread : reconnect_threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        reconnect_threads_.clear();

        // Close server socket
        if (server_socket_ >= 0) {
            close(server_socket_);
            server_socket_ = -1;
        }

        // Disconnect every miner, then wait for their readers
        sessions_.Shutdown("Server shutdown");

        std::vector<std::weak_ptr<TcpChannel>> channels;
        {
            std::lock_guard<std::mutex> lock(channels_mutex_);
            channels.swap(channels_);
        }
        for (auto& weak : channels) {
            if (auto channel = weak.lock()) {
                channel->Close();
                channel->Join();
            }
        }

        LogInfo("Proxy", "Stratum proxy stopped");
    }

    bool IsRunning() const { return is_running_; }
    uint16_t GetPort() const { return bound_port_; }

private:
    ListenerConfig config_;
    SessionManager& sessions_;

    std::atomic<bool> is_running_{false};
    int server_socket_ = -1;
    uint16_t bound_port_ = 0;

    std::thread accept_thread_;
    std::thread maintenance_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::vector<std::thread> reconnect_threads_;
    std::deque<uint64_t> reconnect_queue_;
    std::mutex reconnect_mutex_;
    std::condition_variable reconnect_cv_;

    std::vector<std::weak_ptr<TcpChannel>> channels_;
    std::mutex channels_mutex_;

    void AcceptLoop() {
        while (is_running_) {
            struct pollfd pfd;
            pfd.fd = server_socket_;
            pfd.events = POLLIN;
            pfd.revents = 0;

            // Wake periodically so Stop() is noticed
            int ready = poll(&pfd, 1, 500);
            if (ready <= 0) {
                continue;
            }

            struct sockaddr_storage client_addr;
            socklen_t client_len = sizeof(client_addr);
            int client_fd = accept(server_socket_, reinterpret_cast<struct sockaddr*>(&client_addr),
                                   &client_len);
            if (client_fd < 0) {
                continue;
            }

            auto stream = net::Stream::Adopt(client_fd);
            stream->SetReadTimeout(config_.miner_read_timeout);
            auto channel = std::make_shared<TcpChannel>(std::move(stream));

            auto session = sessions_.OpenSession(channel);
            if (session.IsError()) {
                LogWarning("Proxy", "Rejecting miner " + channel->GetRemoteAddress() + ": " +
                           session.GetError());
                channel->Close();
                continue;
            }

            uint64_t session_id = session.GetValue();
            SessionManager& sessions = sessions_;
            channel->StartReader(
                [&sessions, session_id](const std::string& data) {
                    sessions.OnMinerData(session_id, data);
                },
                [&sessions, session_id](const std::string& reason) {
                    sessions.OnMinerClosed(session_id, reason);
                });

            std::lock_guard<std::mutex> lock(channels_mutex_);
            channels_.erase(std::remove_if(channels_.begin(), channels_.end(),
                                           [](const std::weak_ptr<TcpChannel>& c) { return c.expired(); }),
                            channels_.end());
            channels_.push_back(channel);
        }
    }

    void ReconnectWorker() {
        while (true) {
            uint64_t session_id = 0;
            {
                std::unique_lock<std::mutex> lock(reconnect_mutex_);
                reconnect_cv_.wait(lock, [this] { return !is_running_ || !reconnect_queue_.empty(); });
                if (!is_running_) return;
                session_id = reconnect_queue_.front();
                reconnect_queue_.pop_front();
            }
            sessions_.ReconnectSession(session_id);
        }
    }

    void MaintenanceLoop() {
        auto last_sweep = std::chrono::steady_clock::now();
        auto tick = std::min(config_.reconnect_interval, config_.sweep_interval);

        while (is_running_) {
            {
                std::unique_lock<std::mutex> lock(wait_mutex_);
                wait_cv_.wait_for(lock, tick, [this] { return !is_running_; });
            }
            if (!is_running_) break;

            // Only schedule here; the workers do the dialing
            std::vector<uint64_t> due = sessions_.TakeDueReconnects();
            if (!due.empty()) {
                {
                    std::lock_guard<std::mutex> lock(reconnect_mutex_);
                    reconnect_queue_.insert(reconnect_queue_.end(), due.begin(), due.end());
                }
                reconnect_cv_.notify_all();
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_sweep >= config_.sweep_interval) {
                last_sweep = now;
                size_t closed = sessions_.SweepIdleSessions();

                auto totals = sessions_.GetTotals();
                LogDebug("Proxy", "Active sessions: " + std::to_string(totals.active_sessions) +
                         ", Shares: " + std::to_string(totals.submitted) +
                         " (Accepted: " + std::to_string(totals.accepted) +
                         ", Rejected: " + std::to_string(totals.rejected) +
                         "), Idle closed: " + std::to_string(closed));
            }
        }
    }
};

// ============================================================================
// Proxy Server Public Interface
// ============================================================================

ProxyServer::ProxyServer(ListenerConfig config, SessionManager& sessions)
    : impl_(std::make_unique<Impl>(std::move(config), sessions))
{}

ProxyServer::~ProxyServer() = default;

Result<void> ProxyServer::Start() {
    return impl_->Start();
}

void ProxyServer::Stop() {
    impl_->Stop();
}

bool ProxyServer::IsRunning() const {
    return impl_->IsRunning();
}

uint16_t ProxyServer::GetPort() const {
    return impl_->GetPort();
}

} // namespace minerproxy
