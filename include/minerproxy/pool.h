/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Upstream Pool Registry, Health Monitor and Hashrate Aggregation
 */

#ifndef MINERPROXY_POOL_H
#define MINERPROXY_POOL_H

#include "minerproxy/types.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace minerproxy {

// ============================================================================
// Pool Descriptors
// ============================================================================

enum class ProtocolVariant {
    STRATUM,
    ALEO
};

enum class CoinType {
    UNKNOWN,    // not yet classified (before authorize)
    BTC,
    ETH,
    ETC,
    LTC,
    ALEO,
    OTHER
};

std::string ToString(ProtocolVariant protocol);
std::string ToString(CoinType coin);
Result<ProtocolVariant> ParseProtocolVariant(const std::string& name);
Result<CoinType> ParseCoinType(const std::string& name);

/// Upstream pool as configured. Immutable after load.
struct PoolDescriptor {
    std::string name;
    std::string host;
    uint16_t port = 0;
    double weight = 1.0;
    bool enabled = true;
    ProtocolVariant protocol = ProtocolVariant::STRATUM;
    CoinType coin = CoinType::OTHER;
    bool tls = false;

    /// "host:port"
    std::string Endpoint() const { return host + ":" + std::to_string(port); }
};

/// True for aleo1 followed by 58 lowercase alphanumerics
bool IsAleoAddress(const std::string& address);

/// Classify a miner payout address (ALEO or OTHER)
CoinType ClassifyAddress(const std::string& address);

// ============================================================================
// Pool Registry
// ============================================================================

/// Weighted pool list. Readers share an immutable snapshot; Reload swaps it.
class PoolRegistry {
public:
    using PoolList = std::vector<PoolDescriptor>;
    using Snapshot = std::shared_ptr<const PoolList>;

    explicit PoolRegistry(PoolList pools = {});
    PoolRegistry(PoolList pools, uint64_t seed);

    /// Replace the whole descriptor set atomically
    void Reload(PoolList pools);

    /// Current descriptor set
    Snapshot GetSnapshot() const;

    /// Enabled descriptors matching the coin class (UNKNOWN matches all)
    PoolList GetEnabledPools(CoinType coin = CoinType::UNKNOWN) const;

    /// Weighted random pick; falls back to all enabled pools if the coin subset is empty
    std::optional<PoolDescriptor> SelectPool(CoinType coin = CoinType::UNKNOWN);

    /// Deterministic weighted pick for a draw in [0, 1)
    static std::optional<PoolDescriptor> SelectWeighted(const PoolList& pools, double draw);

    /// Whether a descriptor serves miners of the given coin class
    static bool MatchesCoin(const PoolDescriptor& pool, CoinType coin);

private:
    mutable std::mutex mutex_;
    Snapshot pools_;
    std::mt19937_64 rng_;
};

// ============================================================================
// Pool Health Monitor
// ============================================================================

/// Reachability record for one pool
struct PoolHealthRecord {
    std::string name;
    std::string host;
    uint16_t port = 0;
    bool enabled = true;
    bool connected = false;
    double latency_ms = 0.0;
    std::optional<TimePoint> last_check;
    std::optional<TimePoint> last_success;
    uint64_t check_count = 0;
    uint64_t success_count = 0;
    uint64_t fail_count = 0;
    std::string error;
};

/// Result of a single probe
struct ProbeOutcome {
    enum class Status {
        RESPONDED,      // well-formed reply
        MALFORMED,      // port open, undecodable reply
        TIMEOUT,
        FAILED          // connect or I/O error
    };

    Status status = Status::FAILED;
    double latency_ms = 0.0;
    std::string error;
};

using ProbeFunction = std::function<ProbeOutcome(const PoolDescriptor&, std::chrono::milliseconds)>;

/// Connect (TLS if flagged), send mining.subscribe and wait for one line
ProbeOutcome ProbeStratumPool(const PoolDescriptor& pool, std::chrono::milliseconds timeout);

struct HealthMonitorConfig {
    std::chrono::milliseconds interval{std::chrono::seconds(30)};
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
};

/// Periodic probe loop per enabled pool. Results feed reporting only.
class PoolHealthMonitor {
public:
    PoolHealthMonitor(std::vector<PoolDescriptor> pools,
                      HealthMonitorConfig config = HealthMonitorConfig(),
                      ProbeFunction probe = ProbeStratumPool);
    ~PoolHealthMonitor();

    PoolHealthMonitor(const PoolHealthMonitor&) = delete;
    PoolHealthMonitor& operator=(const PoolHealthMonitor&) = delete;

    /// Start one probe thread per enabled pool (first probe runs immediately)
    Result<void> Start();

    /// Cancel all loops; safe to call more than once
    void Stop();

    bool IsRunning() const { return is_running_; }

    /// Probe one pool synchronously and update its record
    bool CheckPool(size_t index);

    /// Probe every enabled pool synchronously
    void CheckAllPools();

    std::vector<PoolHealthRecord> GetAllStatus() const;
    std::optional<PoolHealthRecord> GetStatus(const std::string& host, uint16_t port) const;

private:
    std::vector<PoolDescriptor> pools_;
    HealthMonitorConfig config_;
    ProbeFunction probe_;

    std::map<std::string, PoolHealthRecord> records_;   // keyed by host:port
    mutable std::mutex records_mutex_;

    std::atomic<bool> is_running_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::vector<std::thread> threads_;

    void MonitorLoop(size_t index);
};

// ============================================================================
// Hashrate Aggregator
// ============================================================================

struct ShareRecord {
    TimePoint timestamp;
    double difficulty = 0.0;
    bool accepted = false;
};

/// Windowed rates in the display unit (difficulty per second / 10^6)
struct HashrateSnapshot {
    double realtime = 0.0;      // 60 s
    double avg_15min = 0.0;     // 900 s
    double avg_24h = 0.0;       // 86400 s
    std::string unit = "M";
};

struct ShareStatistics {
    uint64_t total = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    double accept_rate = 0.0;   // percent
};

/// Sliding-window share rate over a 24 hour horizon
class HashrateAggregator {
public:
    static constexpr std::chrono::seconds kRealtimeWindow{60};
    static constexpr std::chrono::seconds kShortWindow{900};
    static constexpr std::chrono::seconds kHorizon{86400};
    static constexpr double kDisplayDivisor = 1e6;

    explicit HashrateAggregator(Clock clock = SystemNow);

    /// Record a resolved share; prunes records older than the horizon
    void AddShare(double difficulty, bool accepted);
    void AddShare(double difficulty, bool accepted, TimePoint now);

    /// Raw difficulty-per-second over the window ending at now
    double CalculateHashrate(std::chrono::seconds window, TimePoint now) const;
    double CalculateHashrate(std::chrono::seconds window) const;

    HashrateSnapshot GetHashrate() const;
    HashrateSnapshot GetHashrate(TimePoint now) const;

    ShareStatistics GetShareStats() const;

    size_t GetRecordCount() const;
    void Clear();

private:
    Clock clock_;
    std::deque<ShareRecord> shares_;
    mutable std::mutex mutex_;
};

} // namespace minerproxy

#endif // MINERPROXY_POOL_H
