/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Stratum Proxy Sessions, Fee Injection and Listener
 */

#ifndef MINERPROXY_PROXY_H
#define MINERPROXY_PROXY_H

#include "minerproxy/net.h"
#include "minerproxy/pool.h"
#include "minerproxy/stratum.h"
#include "minerproxy/types.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace minerproxy {

// ============================================================================
// Constants
// ============================================================================

constexpr std::chrono::seconds kUpstreamReconnectDelay{5};
constexpr std::chrono::seconds kUpstreamConnectTimeout{10};
constexpr std::chrono::seconds kMinerReadTimeout{300};
constexpr std::chrono::seconds kIdleSweepInterval{60};
constexpr std::chrono::seconds kIdleTimeout{600};
constexpr double kDefaultShareDifficulty = 1000000.0;
constexpr size_t kMaxPendingRequests = 1024;
constexpr int64_t kInternalRequestIdBase = 1000000000;

enum class SessionState {
    CONNECTING,
    AWAITING_UPSTREAM,
    SUBSCRIBED,
    AUTHORIZED,
    ACTIVE,
    CLOSED
};

std::string ToString(SessionState state);

// ============================================================================
// Transport Seams
// ============================================================================

/// One leg of a session: a connection that carries newline-terminated lines
class LineChannel {
public:
    virtual ~LineChannel() = default;

    /// Write one serialized line (already newline-terminated)
    virtual Result<void> Send(const std::string& line) = 0;

    /// Tear down the connection; idempotent
    virtual void Close() = 0;

    virtual std::string GetRemoteAddress() const = 0;
};

/// Callbacks for an upstream leg, invoked from the leg's reader
struct UpstreamHandlers {
    std::function<void(const std::string& data)> on_data;
    std::function<void(const std::string& reason)> on_closed;
};

/// Opens upstream legs to pools
class UpstreamDialer {
public:
    virtual ~UpstreamDialer() = default;
    virtual Result<std::shared_ptr<LineChannel>> Dial(const PoolDescriptor& pool,
                                                      UpstreamHandlers handlers) = 0;
};

// ============================================================================
// Fee Injection
// ============================================================================

struct FeeConfig {
    bool enabled = false;
    double percent = 0.0;           // 0 < percent <= 100
    std::string wallet;
    std::string worker_prefix;
};

/// Fleet-wide share redirection: every Nth submit (N = floor(100 / percent)) pays the fee wallet
class FeeInjector {
public:
    explicit FeeInjector(FeeConfig config);

    bool IsEnabled() const { return config_.enabled && interval_ > 0; }

    /// Submits per redirected submit (0 when disabled)
    uint64_t GetInterval() const { return interval_; }

    /// Count one submit and decide whether it is redirected
    bool NextSubmitIsFee();

    /// Rewrite only the payee of a submit; false if the params carry none
    bool RewriteSubmit(stratum::Message& submit);

    /// Worker string written into redirected submits
    std::string GetFeeWorker() const;

    uint64_t GetSubmitCount() const { return submit_count_.load(); }
    uint64_t GetFeeCount() const { return fee_count_.load(); }
    const FeeConfig& GetConfig() const { return config_; }

private:
    FeeConfig config_;
    uint64_t interval_ = 0;
    std::atomic<uint64_t> submit_count_{0};
    std::atomic<uint64_t> fee_count_{0};
};

// ============================================================================
// Session Observation
// ============================================================================

/// Point-in-time copy of one session
struct SessionSnapshot {
    uint64_t id = 0;
    std::string remote_address;
    std::string address;
    std::string worker;
    SessionState state = SessionState::CONNECTING;
    CoinType coin = CoinType::UNKNOWN;
    bool subscribed = false;
    bool authorized = false;
    bool upstream_connected = false;
    uint64_t submitted = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t fee_shares = 0;
    double difficulty = kDefaultShareDifficulty;
    std::string pool_name;
    std::string extranonce1;
    int extranonce2_size = 0;
    std::string job_id;
    uint64_t job_count = 0;
    size_t pending_requests = 0;
    TimePoint connected_at;
    TimePoint last_activity;
};

struct ProxyTotals {
    uint64_t active_sessions = 0;
    uint64_t authorized_sessions = 0;
    uint64_t upstream_connected = 0;
    uint64_t submitted = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t fee_shares = 0;
    uint64_t total_connections = 0;
    uint64_t total_reconnects = 0;
};

/// Session Manager events. Called without any session lock held.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void OnSessionConnected(const SessionSnapshot& session) { (void)session; }
    virtual void OnSessionDisconnected(const SessionSnapshot& session, const std::string& reason) {
        (void)session; (void)reason;
    }
    virtual void OnShareResolved(const SessionSnapshot& session, bool accepted,
                                 double difficulty, bool fee) {
        (void)session; (void)accepted; (void)difficulty; (void)fee;
    }
    virtual void OnDialFailed(const SessionSnapshot& session, const std::string& pool,
                              const std::string& error) {
        (void)session; (void)pool; (void)error;
    }
    virtual void OnUpstreamLost(const SessionSnapshot& session, const std::string& reason) {
        (void)session; (void)reason;
    }
    virtual void OnUpstreamRestored(const SessionSnapshot& session) { (void)session; }
};

/// Writes session events to the process log
class LoggingObserver : public SessionObserver {
public:
    void OnSessionConnected(const SessionSnapshot& session) override;
    void OnSessionDisconnected(const SessionSnapshot& session, const std::string& reason) override;
    void OnShareResolved(const SessionSnapshot& session, bool accepted,
                         double difficulty, bool fee) override;
    void OnDialFailed(const SessionSnapshot& session, const std::string& pool,
                      const std::string& error) override;
    void OnUpstreamLost(const SessionSnapshot& session, const std::string& reason) override;
    void OnUpstreamRestored(const SessionSnapshot& session) override;
};

// ============================================================================
// Session Manager
// ============================================================================

struct SessionManagerConfig {
    std::chrono::seconds reconnect_delay{kUpstreamReconnectDelay};
    std::chrono::seconds idle_timeout{kIdleTimeout};
    std::string user_agent = "minerproxy/1.0";
    size_t max_sessions = 1000;     // 0 = unlimited
};

/// Owns every miner session and routes messages between its two legs
class SessionManager {
public:
    SessionManager(PoolRegistry& registry,
                   UpstreamDialer& dialer,
                   HashrateAggregator& hashrate,
                   FeeConfig fee_config,
                   SessionManagerConfig config = SessionManagerConfig(),
                   Clock clock = SystemNow);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    void AddObserver(std::shared_ptr<SessionObserver> observer);

    /// Register a freshly accepted miner connection
    Result<uint64_t> OpenSession(std::shared_ptr<LineChannel> miner);

    /// Bytes read from the miner leg
    void OnMinerData(uint64_t session_id, const std::string& data);

    /// Miner leg ended (close, error or read timeout)
    void OnMinerClosed(uint64_t session_id, const std::string& reason);

    /// Destroy both legs and remove the session
    bool CloseSession(uint64_t session_id, const std::string& reason);

    /// Disconnect sessions whose miner has been silent beyond the idle timeout
    size_t SweepIdleSessions();

    /// Claim every session whose reconnect delay has elapsed
    std::vector<uint64_t> TakeDueReconnects();

    /// Redial one session and replay its handshake; true once the leg is back
    bool ReconnectSession(uint64_t session_id);

    /// Redial every due session on the calling thread
    size_t RunPendingReconnects();

    /// Close every session
    void Shutdown(const std::string& reason = "Server shutdown");

    std::optional<SessionSnapshot> GetSession(uint64_t session_id) const;
    std::vector<SessionSnapshot> GetSessions() const;
    ProxyTotals GetTotals() const;
    size_t GetSessionCount() const;

    const FeeInjector& GetFeeInjector() const { return fee_; }
    const SessionManagerConfig& GetConfig() const { return config_; }

private:
    struct Session;
    struct PendingRequest;
    using SessionPtr = std::shared_ptr<Session>;
    using Events = std::vector<std::function<void()>>;

    PoolRegistry& registry_;
    UpstreamDialer& dialer_;
    HashrateAggregator& hashrate_;
    FeeInjector fee_;
    SessionManagerConfig config_;
    Clock clock_;

    // Lock order: sessions_mutex_ before any Session::mutex
    std::map<uint64_t, SessionPtr> sessions_;
    mutable std::mutex sessions_mutex_;
    uint64_t next_session_id_ = 1;

    std::vector<std::shared_ptr<SessionObserver>> observers_;
    mutable std::mutex observers_mutex_;

    std::atomic<uint64_t> total_connections_{0};
    std::atomic<uint64_t> total_reconnects_{0};

    SessionPtr FindSession(uint64_t session_id) const;
    std::vector<SessionPtr> AllSessions() const;
    SessionSnapshot MakeSnapshot(const Session& session) const;

    void Publish(Events& events, std::function<void(SessionObserver&)> notify);
    void Dispatch(Events& events);

    void OnUpstreamData(uint64_t session_id, uint64_t epoch, const std::string& data);
    void OnUpstreamClosed(uint64_t session_id, uint64_t epoch, const std::string& reason);

    // Everything below runs with the session's mutex held
    void HandleMinerMessage(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                            stratum::Message msg, Events& events);
    void HandleSubscribe(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                         stratum::Message& msg, Events& events);
    void HandleAuthorize(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                         stratum::Message& msg, Events& events);
    void HandleSubmit(const SessionPtr& session, stratum::Message& msg, Events& events);
    void HandleUpstreamMessage(const SessionPtr& session, stratum::Message msg, Events& events);
    void HandleUpstreamResponse(const SessionPtr& session, stratum::Message& msg, Events& events);
    void HandleUpstreamNotification(Session& session, const stratum::Message& msg);

    bool EnsureUpstream(const SessionPtr& session, std::unique_lock<std::mutex>& lock, Events& events);
    void HandleUpstreamLoss(const SessionPtr& session, const std::string& reason, Events& events);
    bool Reconnect(const SessionPtr& session, std::unique_lock<std::mutex>& lock, Events& events);

    void AddPending(Session& session, const stratum::json& id, stratum::Method method,
                    bool internal, bool fee);
    void SendInternalRequest(const SessionPtr& session, stratum::Method method,
                             const stratum::json& params, Events& events);
    void SendToMiner(const SessionPtr& session, const stratum::Message& msg, Events& events);
    void SendToUpstream(const SessionPtr& session, const stratum::Message& msg, Events& events);
};

// ============================================================================
// TCP Transport
// ============================================================================

/// LineChannel over a net::Stream with a dedicated reader thread
class TcpChannel : public LineChannel, public std::enable_shared_from_this<TcpChannel> {
public:
    using DataHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void(const std::string&)>;

    explicit TcpChannel(std::unique_ptr<net::Stream> stream);
    ~TcpChannel() override;

    /// Start delivering reads; on_closed fires exactly once when the reader ends
    void StartReader(DataHandler on_data, CloseHandler on_closed);

    Result<void> Send(const std::string& line) override;
    void Close() override;
    std::string GetRemoteAddress() const override { return remote_address_; }

    /// Wait for the reader thread to finish (no-op from the reader itself)
    void Join();

    net::Stream& GetStream() { return *stream_; }

private:
    std::unique_ptr<net::Stream> stream_;
    std::string remote_address_;
    std::thread reader_;
    std::mutex reader_mutex_;
    std::atomic<bool> closed_{false};

    static void ReaderLoop(std::shared_ptr<TcpChannel> self, DataHandler on_data, CloseHandler on_closed);
};

/// Dials pools over TCP (TLS when the descriptor asks for it)
class TcpUpstreamDialer : public UpstreamDialer {
public:
    explicit TcpUpstreamDialer(std::chrono::milliseconds connect_timeout = kUpstreamConnectTimeout);
    ~TcpUpstreamDialer() override;

    Result<std::shared_ptr<LineChannel>> Dial(const PoolDescriptor& pool,
                                              UpstreamHandlers handlers) override;

    /// Close and join every upstream leg this dialer opened
    void Shutdown();

private:
    std::chrono::milliseconds connect_timeout_;
    std::vector<std::weak_ptr<TcpChannel>> channels_;
    std::mutex channels_mutex_;
};

// ============================================================================
// Proxy Listener
// ============================================================================

struct ListenerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3333;
    std::chrono::seconds miner_read_timeout{kMinerReadTimeout};
    std::chrono::milliseconds sweep_interval{kIdleSweepInterval};
    std::chrono::milliseconds reconnect_interval{std::chrono::seconds(1)};
    size_t reconnect_workers = 4;   // threads that redial upstream legs
};

/// Accepts miners, feeds the Session Manager and runs its timers.
/// Upstream redials run on worker threads so a slow pool never delays the idle sweep.
class ProxyServer {
public:
    ProxyServer(ListenerConfig config, SessionManager& sessions);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    Result<void> Start();
    void Stop();
    bool IsRunning() const;

    /// Bound port (useful after binding port 0)
    uint16_t GetPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace minerproxy

#endif // MINERPROXY_PROXY_H
