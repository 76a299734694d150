/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Proxy Statistics HTTP API
 */

#ifndef MINERPROXY_STATS_H
#define MINERPROXY_STATS_H

#include "minerproxy/pool.h"
#include "minerproxy/proxy.h"
#include "minerproxy/types.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace minerproxy {

// ============================================================================
// HTTP Request/Response Structures
// ============================================================================

struct HttpRequest {
    std::string method;         // GET, OPTIONS, ...
    std::string path;           // /api/miners
    std::string query_string;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int status_code = 200;
    std::string status_text = "OK";
    std::map<std::string, std::string> headers;
    std::string body;

    std::string ToString() const;
};

struct StatsConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    std::chrono::seconds interval{10};
    size_t history_length = 60;
};

/// One periodic sample kept for /api/history
struct StatsSample {
    TimePoint timestamp;
    HashrateSnapshot hashrate;
    ProxyTotals totals;
};

// ============================================================================
// HTTP API Server
// ============================================================================

/// Read-only JSON endpoints over the proxy's live state
class HttpApiServer {
public:
    HttpApiServer(StatsConfig config,
                  SessionManager& sessions,
                  HashrateAggregator& hashrate,
                  PoolRegistry& registry,
                  const PoolHealthMonitor* health = nullptr);
    ~HttpApiServer();

    HttpApiServer(const HttpApiServer&) = delete;
    HttpApiServer& operator=(const HttpApiServer&) = delete;

    Result<void> Start();
    void Stop();
    bool IsRunning() const { return is_running_; }
    uint16_t GetPort() const { return bound_port_; }

    /// Route a parsed request
    HttpResponse HandleRequest(const HttpRequest& request) const;

    /// Take one history sample now
    void CollectSample();

    static HttpRequest ParseRequest(const std::string& raw);

    nlohmann::json GetStats() const;
    nlohmann::json GetMiners() const;
    nlohmann::json GetPools() const;
    nlohmann::json GetHashrate() const;
    nlohmann::json GetHistory() const;

private:
    StatsConfig config_;
    SessionManager& sessions_;
    HashrateAggregator& hashrate_;
    PoolRegistry& registry_;
    const PoolHealthMonitor* health_;
    TimePoint start_time_;

    std::atomic<bool> is_running_{false};
    int server_socket_ = -1;
    uint16_t bound_port_ = 0;
    std::thread server_thread_;
    std::thread collector_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::deque<StatsSample> history_;
    mutable std::mutex history_mutex_;

    void RunServer();
    void RunCollector();
    void HandleClient(int client_socket) const;
};

} // namespace minerproxy

#endif // MINERPROXY_STATS_H
