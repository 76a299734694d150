/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Upstream Pool Health Monitor
 */

#include "minerproxy/pool.h"
#include "minerproxy/net.h"
#include "minerproxy/stratum.h"
#include "minerproxy/util.h"

namespace minerproxy {

namespace {

using SteadyClock = std::chrono::steady_clock;

double ElapsedMs(SteadyClock::time_point start) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

} // namespace

// ============================================================================
// Default Probe
// ============================================================================

ProbeOutcome ProbeStratumPool(const PoolDescriptor& pool, std::chrono::milliseconds timeout) {
    ProbeOutcome outcome;
    auto start = SteadyClock::now();
    auto deadline = start + timeout;

    auto stream_result = net::Stream::Connect(pool.host, pool.port, pool.tls, timeout);
    if (stream_result.IsError()) {
        outcome.status = stream_result.GetError().find("timeout") != std::string::npos
            ? ProbeOutcome::Status::TIMEOUT
            : ProbeOutcome::Status::FAILED;
        outcome.error = stream_result.GetError();
        return outcome;
    }
    auto& stream = stream_result.GetValue();

    stratum::Message probe = stratum::MakeRequest(
        1, stratum::MethodName(stratum::Method::SUBSCRIBE), stratum::json::array({"pool-checker/1.0"}));

    auto remaining = [&]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(1);
    };

    stream->SetWriteTimeout(remaining());
    auto write_result = stream->WriteAll(stratum::SerializeMessage(probe));
    if (write_result.IsError()) {
        outcome.status = ProbeOutcome::Status::FAILED;
        outcome.error = write_result.GetError();
        return outcome;
    }

    // Read until the first complete line
    std::string line;
    char buffer[4096];
    while (true) {
        stream->SetReadTimeout(remaining());
        size_t bytes_read = 0;
        net::ReadStatus status = stream->Read(buffer, sizeof(buffer), bytes_read);

        if (status != net::ReadStatus::DATA && !line.empty()) {
            // Bytes arrived but no line ended; the port still answered
            outcome.latency_ms = ElapsedMs(start);
            outcome.status = ProbeOutcome::Status::MALFORMED;
            outcome.error = "Unterminated response";
            return outcome;
        }
        if (status == net::ReadStatus::TIMEOUT) {
            outcome.status = ProbeOutcome::Status::TIMEOUT;
            outcome.error = "Timeout waiting for response";
            return outcome;
        }
        if (status != net::ReadStatus::DATA) {
            outcome.status = ProbeOutcome::Status::FAILED;
            outcome.error = "Connection closed before response";
            return outcome;
        }

        line.append(buffer, bytes_read);
        size_t pos = line.find('\n');
        if (pos != std::string::npos) {
            line.resize(pos);
            break;
        }
        if (line.size() > stratum::kMaxLineLength) {
            break;
        }
    }

    outcome.latency_ms = ElapsedMs(start);
    if (stratum::ParseMessage(Trim(line)).IsOk()) {
        outcome.status = ProbeOutcome::Status::RESPONDED;
    } else {
        outcome.status = ProbeOutcome::Status::MALFORMED;
    }
    return outcome;
}

// ============================================================================
// Pool Health Monitor
// ============================================================================

PoolHealthMonitor::PoolHealthMonitor(std::vector<PoolDescriptor> pools,
                                     HealthMonitorConfig config,
                                     ProbeFunction probe)
    : pools_(std::move(pools))
    , config_(config)
    , probe_(std::move(probe))
{
    for (const auto& pool : pools_) {
        PoolHealthRecord record;
        record.name = pool.name;
        record.host = pool.host;
        record.port = pool.port;
        record.enabled = pool.enabled;
        records_.emplace(pool.Endpoint(), record);
    }
}

PoolHealthMonitor::~PoolHealthMonitor() {
    Stop();
}

Result<void> PoolHealthMonitor::Start() {
    if (is_running_) {
        return Result<void>::Error("Health monitor already running");
    }

    is_running_ = true;

    size_t started = 0;
    for (size_t i = 0; i < pools_.size(); i++) {
        if (!pools_[i].enabled) continue;
        threads_.emplace_back(&PoolHealthMonitor::MonitorLoop, this, i);
        started++;
    }

    LogInfo("Health", "Monitoring " + std::to_string(started) + " pools every " +
            std::to_string(config_.interval.count() / 1000) + "s");
    return Result<void>::Ok();
}

void PoolHealthMonitor::Stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!is_running_) return;
        is_running_ = false;
    }
    wait_cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    LogInfo("Health", "Health monitor stopped");
}

void PoolHealthMonitor::MonitorLoop(size_t index) {
    while (is_running_) {
        CheckPool(index);

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, config_.interval, [this] { return !is_running_; });
    }
}

bool PoolHealthMonitor::CheckPool(size_t index) {
    if (index >= pools_.size()) {
        return false;
    }
    const PoolDescriptor& pool = pools_[index];

    ProbeOutcome outcome = probe_(pool, config_.timeout);
    TimePoint now = SystemNow();
    bool connected = outcome.status == ProbeOutcome::Status::RESPONDED ||
                     outcome.status == ProbeOutcome::Status::MALFORMED;

    bool was_connected;
    {
        std::lock_guard<std::mutex> lock(records_mutex_);
        PoolHealthRecord& record = records_[pool.Endpoint()];
        was_connected = record.connected;

        record.check_count++;
        record.last_check = now;
        record.connected = connected;

        if (connected) {
            record.success_count++;
            record.last_success = now;
            record.latency_ms = outcome.latency_ms;
            record.error = outcome.status == ProbeOutcome::Status::MALFORMED
                ? "Port open but response malformed"
                : "";
        } else {
            record.fail_count++;
            record.error = outcome.error;
        }
    }

    if (connected && !was_connected) {
        LogInfo("Health", "Pool " + pool.name + " (" + pool.Endpoint() + ") reachable, latency " +
                std::to_string(static_cast<int>(outcome.latency_ms)) + "ms");
    } else if (!connected) {
        LogWarning("Health", "Pool " + pool.name + " (" + pool.Endpoint() + ") unreachable: " +
                   outcome.error);
    }

    return connected;
}

void PoolHealthMonitor::CheckAllPools() {
    for (size_t i = 0; i < pools_.size(); i++) {
        if (pools_[i].enabled) {
            CheckPool(i);
        }
    }
}

std::vector<PoolHealthRecord> PoolHealthMonitor::GetAllStatus() const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    std::vector<PoolHealthRecord> result;
    result.reserve(pools_.size());
    for (const auto& pool : pools_) {
        auto it = records_.find(pool.Endpoint());
        if (it != records_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::optional<PoolHealthRecord> PoolHealthMonitor::GetStatus(const std::string& host, uint16_t port) const {
    std::lock_guard<std::mutex> lock(records_mutex_);
    auto it = records_.find(host + ":" + std::to_string(port));
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace minerproxy
