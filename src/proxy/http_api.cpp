/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Proxy Statistics HTTP API Server
 */

#include "minerproxy/stats.h"
#include "minerproxy/net.h"
#include "minerproxy/util.h"
#include <sstream>

#include <sys/socket.h>
#include <netinet/in.h>
#include <poll.h>
#include <unistd.h>

namespace minerproxy {

using json = nlohmann::json;

namespace {

constexpr size_t kMaxRequestSize = 8192;

json ErrorBody(const std::string& message) {
    return json{{"error", message}};
}

json SessionToJson(const SessionSnapshot& s) {
    return json{
        {"id", s.id},
        {"remote_address", s.remote_address},
        {"address", s.address},
        {"worker", s.worker},
        {"state", ToString(s.state)},
        {"coin", ToString(s.coin)},
        {"authorized", s.authorized},
        {"upstream_connected", s.upstream_connected},
        {"shares_submitted", s.submitted},
        {"shares_accepted", s.accepted},
        {"shares_rejected", s.rejected},
        {"fee_shares", s.fee_shares},
        {"difficulty", s.difficulty},
        {"pool", s.pool_name},
        {"extranonce1", s.extranonce1},
        {"job_id", s.job_id},
        {"connected_at", ToUnixMillis(s.connected_at)},
        {"last_activity", ToUnixMillis(s.last_activity)}
    };
}

json HashrateToJson(const HashrateSnapshot& h) {
    return json{
        {"realtime", h.realtime},
        {"avg_15min", h.avg_15min},
        {"avg_24h", h.avg_24h},
        {"unit", h.unit}
    };
}

json TotalsToJson(const ProxyTotals& t) {
    return json{
        {"active", t.active_sessions},
        {"authorized", t.authorized_sessions},
        {"upstream_connected", t.upstream_connected},
        {"total_connections", t.total_connections},
        {"reconnects", t.total_reconnects}
    };
}

} // namespace

// ============================================================================
// HTTP Response
// ============================================================================

std::string HttpResponse::ToString() const {
    std::ostringstream oss;

    // Status line
    oss << "HTTP/1.1 " << status_code << " " << status_text << "\r\n";

    // Headers
    for (const auto& [key, value] : headers) {
        oss << key << ": " << value << "\r\n";
    }

    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n";

    // End of headers
    oss << "\r\n";
    oss << body;

    return oss.str();
}

// ============================================================================
// HTTP API Server
// ============================================================================

HttpApiServer::HttpApiServer(StatsConfig config,
                             SessionManager& sessions,
                             HashrateAggregator& hashrate,
                             PoolRegistry& registry,
                             const PoolHealthMonitor* health)
    : config_(std::move(config))
    , sessions_(sessions)
    , hashrate_(hashrate)
    , registry_(registry)
    , health_(health)
    , start_time_(SystemNow())
{}

HttpApiServer::~HttpApiServer() {
    Stop();
}

Result<void> HttpApiServer::Start() {
    if (is_running_) {
        return Result<void>::Error("HTTP API server already running");
    }

    auto listen_result = net::Listen(config_.host, config_.port, 16);
    if (listen_result.IsError()) {
        return Result<void>::Error(listen_result.GetError());
    }
    server_socket_ = listen_result.GetValue();
    bound_port_ = net::GetLocalPort(server_socket_);

    is_running_ = true;

    // Start server thread
    server_thread_ = std::thread([this]() { RunServer(); });

    // Start history collector
    collector_thread_ = std::thread([this]() { RunCollector(); });

    LogInfo("Stats", "Stats API listening on " + config_.host + ":" + std::to_string(bound_port_));
    return Result<void>::Ok();
}

void HttpApiServer::Stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!is_running_) return;
        is_running_ = false;
    }
    wait_cv_.notify_all();

    // Wait for server thread to finish
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    if (collector_thread_.joinable()) {
        collector_thread_.join();
    }

    if (server_socket_ >= 0) {
        close(server_socket_);
        server_socket_ = -1;
    }

    LogInfo("Stats", "Stats API stopped");
}

void HttpApiServer::RunServer() {
    while (is_running_) {
        struct pollfd pfd;
        pfd.fd = server_socket_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (poll(&pfd, 1, 500) <= 0) {
            continue;
        }

        struct sockaddr_storage client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_socket = accept(server_socket_, reinterpret_cast<struct sockaddr*>(&client_addr),
                                   &client_len);
        if (client_socket < 0) {
            continue;  // Accept failed, try again
        }

        HandleClient(client_socket);
    }
}

void HttpApiServer::RunCollector() {
    while (is_running_) {
        CollectSample();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, config_.interval, [this] { return !is_running_; });
    }
}

void HttpApiServer::CollectSample() {
    StatsSample sample;
    sample.timestamp = SystemNow();
    sample.hashrate = hashrate_.GetHashrate();
    sample.totals = sessions_.GetTotals();

    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back(sample);
    while (history_.size() > config_.history_length) {
        history_.pop_front();
    }
}

void HttpApiServer::HandleClient(int client_socket) const {
    auto stream = net::Stream::Adopt(client_socket);
    stream->SetReadTimeout(std::chrono::seconds(5));
    stream->SetWriteTimeout(std::chrono::seconds(5));

    // Read until the end of the headers
    std::string raw;
    char buffer[4096];
    while (raw.find("\r\n\r\n") == std::string::npos && raw.size() < kMaxRequestSize) {
        size_t bytes_read = 0;
        if (stream->Read(buffer, sizeof(buffer), bytes_read) != net::ReadStatus::DATA) {
            break;
        }
        raw.append(buffer, bytes_read);
    }

    if (raw.empty()) {
        return;
    }

    HttpResponse response = HandleRequest(ParseRequest(raw));
    auto result = stream->WriteAll(response.ToString());
    if (result.IsError()) {
        LogDebug("Stats", "Failed to send response: " + result.GetError());
    }
}

HttpRequest HttpApiServer::ParseRequest(const std::string& raw) {
    HttpRequest request;
    std::istringstream stream(raw);
    std::string line;

    // Parse request line (GET /path HTTP/1.1)
    if (std::getline(stream, line)) {
        std::istringstream line_stream(line);
        line_stream >> request.method >> request.path;

        // Extract query string if present
        size_t query_pos = request.path.find('?');
        if (query_pos != std::string::npos) {
            request.query_string = request.path.substr(query_pos + 1);
            request.path = request.path.substr(0, query_pos);
        }
    }

    // Parse headers
    while (std::getline(stream, line) && line != "\r" && !line.empty()) {
        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            request.headers[Trim(line.substr(0, colon_pos))] = Trim(line.substr(colon_pos + 1));
        }
    }

    // Whatever follows the headers
    std::string body;
    while (std::getline(stream, line)) {
        body += line;
    }
    request.body = body;

    return request;
}

HttpResponse HttpApiServer::HandleRequest(const HttpRequest& request) const {
    HttpResponse response;
    response.headers["Content-Type"] = "application/json; charset=utf-8";
    response.headers["Access-Control-Allow-Origin"] = "*";  // CORS support
    response.headers["Access-Control-Allow-Methods"] = "GET, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";

    // Handle OPTIONS request (CORS preflight)
    if (request.method == "OPTIONS") {
        response.status_code = 204;
        response.status_text = "No Content";
        return response;
    }

    if (request.method != "GET") {
        response.status_code = 405;
        response.status_text = "Method Not Allowed";
        response.body = ErrorBody("Method not allowed").dump();
        return response;
    }

    if (request.path == "/stats" || request.path == "/api/stats") {
        response.body = GetStats().dump();
    } else if (request.path == "/api/miners") {
        response.body = GetMiners().dump();
    } else if (request.path == "/api/pools") {
        response.body = GetPools().dump();
    } else if (request.path == "/api/hashrate") {
        response.body = GetHashrate().dump();
    } else if (request.path == "/api/history") {
        response.body = GetHistory().dump();
    } else if (request.path == "/" || request.path == "/health") {
        response.body = json{{"status", "ok"}, {"service", "minerproxy"},
                             {"version", MINERPROXY_VERSION}}.dump();
    } else {
        response.status_code = 404;
        response.status_text = "Not Found";
        response.body = ErrorBody("Endpoint not found").dump();
    }

    return response;
}

// ============================================================================
// API Endpoints
// ============================================================================

/**
 * GET /stats
 * Full proxy overview
 */
json HttpApiServer::GetStats() const {
    TimePoint now = SystemNow();
    ProxyTotals totals = sessions_.GetTotals();
    const FeeInjector& fee = sessions_.GetFeeInjector();

    uint64_t resolved = totals.accepted + totals.rejected;
    double rate = resolved > 0 ? 100.0 * static_cast<double>(totals.accepted) /
                                 static_cast<double>(resolved) : 0.0;

    json stats;
    stats["start_time"] = ToUnixMillis(start_time_);
    stats["uptime"] = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
    stats["miners"] = TotalsToJson(totals);
    stats["shares"] = json{
        {"total", totals.submitted},
        {"accepted", totals.accepted},
        {"rejected", totals.rejected},
        {"fee", totals.fee_shares},
        {"rate", rate}
    };
    stats["hashrate"] = GetHashrate();
    stats["fee"] = json{
        {"enabled", fee.IsEnabled()},
        {"percent", fee.GetConfig().percent},
        {"submits_seen", fee.GetSubmitCount()},
        {"redirected", fee.GetFeeCount()}
    };
    stats["pools"] = GetPools();
    stats["sessions"] = GetMiners();
    return stats;
}

/**
 * GET /api/miners
 * Live session list
 */
json HttpApiServer::GetMiners() const {
    json miners = json::array();
    for (const auto& session : sessions_.GetSessions()) {
        miners.push_back(SessionToJson(session));
    }
    return miners;
}

/**
 * GET /api/pools
 * Configured pools with their latest health record
 */
json HttpApiServer::GetPools() const {
    json pools = json::array();
    auto snapshot = registry_.GetSnapshot();

    for (const auto& pool : *snapshot) {
        json entry{
            {"name", pool.name},
            {"host", pool.host},
            {"port", pool.port},
            {"weight", pool.weight},
            {"enabled", pool.enabled},
            {"protocol", ToString(pool.protocol)},
            {"coin", ToString(pool.coin)},
            {"tls", pool.tls},
            {"connected", false},
            {"latency", 0},
            {"last_check", nullptr},
            {"error", nullptr}
        };

        if (health_) {
            auto record = health_->GetStatus(pool.host, pool.port);
            if (record) {
                entry["connected"] = record->connected;
                entry["latency"] = static_cast<int64_t>(record->latency_ms);
                entry["checks"] = record->check_count;
                entry["failures"] = record->fail_count;
                if (record->last_check) {
                    entry["last_check"] = ToUnixMillis(*record->last_check);
                }
                if (!record->error.empty()) {
                    entry["error"] = record->error;
                }
            }
        }

        pools.push_back(entry);
    }
    return pools;
}

/**
 * GET /api/hashrate
 */
json HttpApiServer::GetHashrate() const {
    json result = HashrateToJson(hashrate_.GetHashrate());
    ShareStatistics shares = hashrate_.GetShareStats();
    result["shares"] = json{
        {"total", shares.total},
        {"accepted", shares.accepted},
        {"rejected", shares.rejected},
        {"accept_rate", shares.accept_rate}
    };
    return result;
}

/**
 * GET /api/history
 * Periodic samples, oldest first
 */
json HttpApiServer::GetHistory() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    json history = json::array();
    for (const auto& sample : history_) {
        history.push_back(json{
            {"timestamp", ToUnixMillis(sample.timestamp)},
            {"hashrate", HashrateToJson(sample.hashrate)},
            {"miners", TotalsToJson(sample.totals)},
            {"accepted", sample.totals.accepted},
            {"rejected", sample.totals.rejected}
        });
    }
    return history;
}

} // namespace minerproxy
