/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Stratum Proxy Session Manager
 */

#include "minerproxy/proxy.h"
#include "minerproxy/util.h"
#include <condition_variable>

namespace minerproxy {

using stratum::json;
using stratum::Message;
using stratum::MessageKind;
using stratum::Method;

std::string ToString(SessionState state) {
    switch (state) {
        case SessionState::CONNECTING: return "connecting";
        case SessionState::AWAITING_UPSTREAM: return "awaiting_upstream";
        case SessionState::SUBSCRIBED: return "subscribed";
        case SessionState::AUTHORIZED: return "authorized";
        case SessionState::ACTIVE: return "active";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

// ============================================================================
// Session State
// ============================================================================

struct SessionManager::PendingRequest {
    Method method = Method::UNKNOWN;
    bool internal = false;      // proxy-originated, response is consumed
    bool fee = false;           // submit redirected to the fee wallet
    uint64_t sequence = 0;
};

struct SessionManager::Session {
    uint64_t id = 0;
    std::shared_ptr<LineChannel> miner;
    std::shared_ptr<LineChannel> upstream;
    std::optional<PoolDescriptor> pool;

    stratum::LineCodec miner_codec;
    stratum::LineCodec upstream_codec;

    SessionState state = SessionState::CONNECTING;
    bool subscribed = false;
    bool authorized = false;
    bool closed = false;

    // Replayed after an upstream reconnect
    std::optional<json> subscribe_params;
    std::optional<json> authorize_params;

    std::string address;
    std::string worker;
    CoinType coin = CoinType::UNKNOWN;

    uint64_t submitted = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t fee_shares = 0;

    double difficulty = kDefaultShareDifficulty;
    std::string extranonce1;
    int extranonce2_size = 0;
    std::string job_id;
    uint64_t job_count = 0;
    json target;

    std::map<std::string, PendingRequest> pending;
    std::map<std::string, PendingRequest> internal_pending;
    uint64_t pending_sequence = 0;
    int64_t next_internal_id = kInternalRequestIdBase;

    // Upstream callbacks carry the epoch they were created under; older ones are ignored
    uint64_t upstream_epoch = 0;
    bool dialing = false;
    std::optional<TimePoint> reconnect_at;

    TimePoint connected_at;
    TimePoint last_activity;

    std::mutex mutex;
    std::condition_variable dial_cv;

    explicit Session(uint64_t session_id)
        : id(session_id)
        , miner_codec(stratum::kMaxLineLength, "Session")
        , upstream_codec(stratum::kMaxLineLength, "Upstream")
    {}
};

// ============================================================================
// Construction / Registry
// ============================================================================

SessionManager::SessionManager(PoolRegistry& registry,
                               UpstreamDialer& dialer,
                               HashrateAggregator& hashrate,
                               FeeConfig fee_config,
                               SessionManagerConfig config,
                               Clock clock)
    : registry_(registry)
    , dialer_(dialer)
    , hashrate_(hashrate)
    , fee_(std::move(fee_config))
    , config_(std::move(config))
    , clock_(std::move(clock))
{}

SessionManager::~SessionManager() {
    Shutdown();
}

void SessionManager::AddObserver(std::shared_ptr<SessionObserver> observer) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

SessionManager::SessionPtr SessionManager::FindSession(uint64_t session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<SessionManager::SessionPtr> SessionManager::AllSessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<SessionPtr> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

SessionSnapshot SessionManager::MakeSnapshot(const Session& session) const {
    SessionSnapshot snap;
    snap.id = session.id;
    snap.remote_address = session.miner ? session.miner->GetRemoteAddress() : "";
    snap.address = session.address;
    snap.worker = session.worker;
    snap.state = session.state;
    snap.coin = session.coin;
    snap.subscribed = session.subscribed;
    snap.authorized = session.authorized;
    snap.upstream_connected = session.upstream != nullptr;
    snap.submitted = session.submitted;
    snap.accepted = session.accepted;
    snap.rejected = session.rejected;
    snap.fee_shares = session.fee_shares;
    snap.difficulty = session.difficulty;
    snap.pool_name = session.pool ? session.pool->name : "";
    snap.extranonce1 = session.extranonce1;
    snap.extranonce2_size = session.extranonce2_size;
    snap.job_id = session.job_id;
    snap.job_count = session.job_count;
    snap.pending_requests = session.pending.size();
    snap.connected_at = session.connected_at;
    snap.last_activity = session.last_activity;
    return snap;
}

void SessionManager::Publish(Events& events, std::function<void(SessionObserver&)> notify) {
    events.push_back([this, notify]() {
        std::vector<std::shared_ptr<SessionObserver>> observers;
        {
            std::lock_guard<std::mutex> lock(observers_mutex_);
            observers = observers_;
        }
        for (auto& observer : observers) {
            notify(*observer);
        }
    });
}

void SessionManager::Dispatch(Events& events) {
    for (auto& event : events) {
        event();
    }
    events.clear();
}

Result<uint64_t> SessionManager::OpenSession(std::shared_ptr<LineChannel> miner) {
    if (!miner) {
        return Result<uint64_t>::Error("Null miner channel");
    }

    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (config_.max_sessions > 0 && sessions_.size() >= config_.max_sessions) {
            return Result<uint64_t>::Error("Connection limit reached (" +
                                           std::to_string(config_.max_sessions) + ")");
        }

        session = std::make_shared<Session>(next_session_id_++);
        session->miner = std::move(miner);
        session->connected_at = clock_();
        session->last_activity = session->connected_at;
        sessions_[session->id] = session;
    }
    total_connections_++;

    Events events;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        SessionSnapshot snap = MakeSnapshot(*session);
        Publish(events, [snap](SessionObserver& o) { o.OnSessionConnected(snap); });
    }
    Dispatch(events);

    return Result<uint64_t>::Ok(session->id);
}

bool SessionManager::CloseSession(uint64_t session_id, const std::string& reason) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }

    std::shared_ptr<LineChannel> miner;
    std::shared_ptr<LineChannel> upstream;
    SessionSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->closed = true;
        session->state = SessionState::CLOSED;
        session->upstream_epoch++;
        session->reconnect_at.reset();
        session->pending.clear();
        session->internal_pending.clear();
        miner = session->miner;
        upstream = std::move(session->upstream);
        session->upstream.reset();
        snap = MakeSnapshot(*session);
        session->dial_cv.notify_all();
    }

    if (upstream) upstream->Close();
    if (miner) miner->Close();

    Events events;
    Publish(events, [snap, reason](SessionObserver& o) { o.OnSessionDisconnected(snap, reason); });
    Dispatch(events);
    return true;
}

void SessionManager::OnMinerClosed(uint64_t session_id, const std::string& reason) {
    CloseSession(session_id, reason);
}

void SessionManager::Shutdown(const std::string& reason) {
    std::vector<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, session] : sessions_) {
            ids.push_back(id);
        }
    }
    for (uint64_t id : ids) {
        CloseSession(id, reason);
    }
}

// ============================================================================
// Timers
// ============================================================================

size_t SessionManager::SweepIdleSessions() {
    TimePoint now = clock_();
    std::vector<uint64_t> idle;

    for (const auto& session : AllSessions()) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (!session->closed && now - session->last_activity > config_.idle_timeout) {
            idle.push_back(session->id);
        }
    }

    size_t closed = 0;
    for (uint64_t id : idle) {
        LogInfo("Session", "Disconnecting idle session " + std::to_string(id) +
                " (timeout: " + std::to_string(config_.idle_timeout.count()) + "s)");
        if (CloseSession(id, "Idle timeout")) {
            closed++;
        }
    }
    return closed;
}

std::vector<uint64_t> SessionManager::TakeDueReconnects() {
    TimePoint now = clock_();
    std::vector<uint64_t> due;

    for (const auto& session : AllSessions()) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->closed || session->upstream || session->dialing ||
            !session->reconnect_at || *session->reconnect_at > now) {
            continue;
        }
        // Claimed; a failed redial schedules the next attempt
        session->reconnect_at.reset();
        due.push_back(session->id);
    }
    return due;
}

bool SessionManager::ReconnectSession(uint64_t session_id) {
    SessionPtr session = FindSession(session_id);
    if (!session) return false;

    Events events;
    bool restored = false;
    {
        std::unique_lock<std::mutex> lock(session->mutex);
        session->dial_cv.wait(lock, [&] { return !session->dialing; });
        if (session->closed || session->upstream) {
            // Miner traffic already brought the leg back
            return false;
        }
        restored = Reconnect(session, lock, events);
    }
    Dispatch(events);
    return restored;
}

size_t SessionManager::RunPendingReconnects() {
    size_t restored = 0;
    for (uint64_t id : TakeDueReconnects()) {
        if (ReconnectSession(id)) {
            restored++;
        }
    }
    return restored;
}

// ============================================================================
// Upstream Leg
// ============================================================================

bool SessionManager::EnsureUpstream(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                                    Events& events) {
    session->dial_cv.wait(lock, [&] { return !session->dialing; });
    if (session->closed) {
        return false;
    }
    if (session->upstream) {
        return true;
    }

    auto pool = registry_.SelectPool(session->coin);
    if (!pool) {
        SessionSnapshot snap = MakeSnapshot(*session);
        Publish(events, [snap](SessionObserver& o) {
            o.OnDialFailed(snap, "", "No enabled pools");
        });
        return false;
    }

    session->dialing = true;
    uint64_t epoch = ++session->upstream_epoch;
    uint64_t id = session->id;

    UpstreamHandlers handlers;
    handlers.on_data = [this, id, epoch](const std::string& data) {
        OnUpstreamData(id, epoch, data);
    };
    handlers.on_closed = [this, id, epoch](const std::string& reason) {
        OnUpstreamClosed(id, epoch, reason);
    };

    // Dial without holding the session lock
    lock.unlock();
    auto result = dialer_.Dial(*pool, std::move(handlers));
    lock.lock();

    session->dialing = false;
    session->dial_cv.notify_all();

    if (result.IsError()) {
        SessionSnapshot snap = MakeSnapshot(*session);
        std::string pool_name = pool->name;
        std::string error = result.GetError();
        Publish(events, [snap, pool_name, error](SessionObserver& o) {
            o.OnDialFailed(snap, pool_name, error);
        });
        return false;
    }

    std::shared_ptr<LineChannel> channel = result.GetValue();
    if (session->closed || epoch != session->upstream_epoch) {
        // Session closed or the new leg already dropped while dialing
        channel->Close();
        return false;
    }

    session->upstream = std::move(channel);
    session->pool = *pool;
    session->reconnect_at.reset();
    if (session->state == SessionState::CONNECTING) {
        session->state = SessionState::AWAITING_UPSTREAM;
    }

    LogDebug("Upstream", "Session " + std::to_string(session->id) + " connected to pool " +
             pool->name + " (" + pool->Endpoint() + ")");
    return true;
}

void SessionManager::HandleUpstreamLoss(const SessionPtr& session, const std::string& reason,
                                        Events& events) {
    std::shared_ptr<LineChannel> upstream = std::move(session->upstream);
    session->upstream.reset();
    session->upstream_epoch++;
    session->pending.clear();
    session->internal_pending.clear();
    session->upstream_codec.Clear();
    session->subscribed = false;
    session->state = SessionState::AWAITING_UPSTREAM;
    session->reconnect_at = clock_() + config_.reconnect_delay;

    if (upstream) {
        upstream->Close();
    }

    SessionSnapshot snap = MakeSnapshot(*session);
    Publish(events, [snap, reason](SessionObserver& o) { o.OnUpstreamLost(snap, reason); });
}

bool SessionManager::Reconnect(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                               Events& events) {
    if (!EnsureUpstream(session, lock, events)) {
        if (!session->closed && !session->upstream) {
            session->reconnect_at = clock_() + config_.reconnect_delay;
        }
        return false;
    }

    total_reconnects_++;

    json subscribe_params = session->subscribe_params
        ? *session->subscribe_params
        : json::array({config_.user_agent});
    SendInternalRequest(session, Method::SUBSCRIBE, subscribe_params, events);

    if (session->authorized && session->authorize_params) {
        SendInternalRequest(session, Method::AUTHORIZE, *session->authorize_params, events);
    }

    if (session->upstream) {
        SessionSnapshot snap = MakeSnapshot(*session);
        Publish(events, [snap](SessionObserver& o) { o.OnUpstreamRestored(snap); });
        return true;
    }
    return false;
}

void SessionManager::OnUpstreamData(uint64_t session_id, uint64_t epoch, const std::string& data) {
    SessionPtr session = FindSession(session_id);
    if (!session) return;

    Events events;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->closed || epoch != session->upstream_epoch) {
            return;
        }

        for (auto& msg : session->upstream_codec.Feed(data)) {
            if (session->closed || epoch != session->upstream_epoch) break;
            HandleUpstreamMessage(session, std::move(msg), events);
        }
    }
    Dispatch(events);
}

void SessionManager::OnUpstreamClosed(uint64_t session_id, uint64_t epoch, const std::string& reason) {
    SessionPtr session = FindSession(session_id);
    if (!session) return;

    Events events;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->closed || epoch != session->upstream_epoch) {
            return;
        }
        HandleUpstreamLoss(session, reason, events);
    }
    Dispatch(events);
}

// ============================================================================
// Sending
// ============================================================================

void SessionManager::AddPending(Session& session, const json& id, Method method,
                                bool internal, bool fee) {
    PendingRequest entry;
    entry.method = method;
    entry.internal = internal;
    entry.fee = fee;
    entry.sequence = session.pending_sequence++;

    if (internal) {
        session.internal_pending[stratum::IdKey(id)] = entry;
        return;
    }

    if (session.pending.size() >= kMaxPendingRequests) {
        auto oldest = session.pending.begin();
        for (auto it = session.pending.begin(); it != session.pending.end(); ++it) {
            if (it->second.sequence < oldest->second.sequence) {
                oldest = it;
            }
        }
        LogWarning("Session", "Session " + std::to_string(session.id) +
                   " pending table full, dropping request " + oldest->first);
        session.pending.erase(oldest);
    }

    session.pending[stratum::IdKey(id)] = entry;
}

void SessionManager::SendInternalRequest(const SessionPtr& session, Method method,
                                         const json& params, Events& events) {
    if (!session->upstream) return;

    // Never reuse an id that is still awaiting a response
    while (session->pending.count(stratum::IdKey(session->next_internal_id)) ||
           session->internal_pending.count(stratum::IdKey(session->next_internal_id))) {
        session->next_internal_id++;
    }

    json id = session->next_internal_id++;
    AddPending(*session, id, method, true, false);
    SendToUpstream(session, stratum::MakeRequest(id, stratum::MethodName(method), params), events);
}

void SessionManager::SendToMiner(const SessionPtr& session, const Message& msg, Events& events) {
    if (!session->miner || session->closed) return;

    auto result = session->miner->Send(stratum::SerializeMessage(msg));
    if (result.IsError()) {
        uint64_t id = session->id;
        std::string reason = "Miner write failed: " + result.GetError();
        events.push_back([this, id, reason]() { CloseSession(id, reason); });
    }
}

void SessionManager::SendToUpstream(const SessionPtr& session, const Message& msg, Events& events) {
    if (!session->upstream) return;

    auto result = session->upstream->Send(stratum::SerializeMessage(msg));
    if (result.IsError()) {
        HandleUpstreamLoss(session, "Upstream write failed: " + result.GetError(), events);
    }
}

// ============================================================================
// Miner -> Pool
// ============================================================================

void SessionManager::OnMinerData(uint64_t session_id, const std::string& data) {
    SessionPtr session = FindSession(session_id);
    if (!session) return;

    Events events;
    {
        std::unique_lock<std::mutex> lock(session->mutex);
        if (session->closed) return;

        session->last_activity = clock_();
        for (auto& msg : session->miner_codec.Feed(data)) {
            if (session->closed) break;
            HandleMinerMessage(session, lock, std::move(msg), events);
        }
    }
    Dispatch(events);
}

void SessionManager::HandleMinerMessage(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                                        Message msg, Events& events) {
    if (msg.kind == MessageKind::RESPONSE) {
        // Answers to pool-initiated requests pass through
        SendToUpstream(session, msg, events);
        return;
    }

    // Core methods take the same path whatever their id is
    switch (msg.GetMethod()) {
        case Method::SUBSCRIBE:
            HandleSubscribe(session, lock, msg, events);
            break;
        case Method::AUTHORIZE:
            HandleAuthorize(session, lock, msg, events);
            break;
        case Method::SUBMIT:
            HandleSubmit(session, msg, events);
            break;
        default:
            if (msg.kind == MessageKind::NOTIFICATION) {
                SendToUpstream(session, msg, events);
                return;
            }
            if (!session->upstream) {
                SendToMiner(session, stratum::MakeError(msg.id, stratum::error_code::UPSTREAM_UNAVAILABLE,
                                                        "Upstream not connected"), events);
                return;
            }
            AddPending(*session, msg.id, msg.GetMethod(), false, false);
            SendToUpstream(session, msg, events);
            break;
    }
}

void SessionManager::HandleSubscribe(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                                     Message& msg, Events& events) {
    session->subscribe_params = msg.params ? *msg.params : json::array();

    if (!EnsureUpstream(session, lock, events)) {
        if (!session->closed) {
            SendToMiner(session, stratum::MakeError(msg.id, stratum::error_code::UPSTREAM_UNAVAILABLE,
                                                    "Unable to connect to upstream pool"), events);
        }
        return;
    }

    AddPending(*session, msg.id, Method::SUBSCRIBE, false, false);
    SendToUpstream(session, msg, events);
}

void SessionManager::HandleAuthorize(const SessionPtr& session, std::unique_lock<std::mutex>& lock,
                                     Message& msg, Events& events) {
    auto creds = stratum::ParseAuthorizeParams(msg.params ? *msg.params : json());
    if (!creds) {
        SendToMiner(session, stratum::MakeError(msg.id, stratum::error_code::INVALID_AUTHORIZATION,
                                                "Invalid authorization format"), events);
        return;
    }

    session->address = creds->address;
    session->worker = creds->worker;
    session->authorize_params = *msg.params;
    if (session->coin == CoinType::UNKNOWN) {
        session->coin = ClassifyAddress(creds->address);
    }

    LogInfo("Session", "Session " + std::to_string(session->id) + " authorizing " +
            creds->address + "." + creds->worker + " (" + ToString(session->coin) + ")");

    if (!EnsureUpstream(session, lock, events)) {
        if (!session->closed) {
            SendToMiner(session, stratum::MakeError(msg.id, stratum::error_code::UPSTREAM_UNAVAILABLE,
                                                    "Unable to connect to upstream pool"), events);
        }
        return;
    }

    AddPending(*session, msg.id, Method::AUTHORIZE, false, false);
    SendToUpstream(session, msg, events);
}

void SessionManager::HandleSubmit(const SessionPtr& session, Message& msg, Events& events) {
    if (!session->authorized || !session->upstream) {
        SendToMiner(session, stratum::MakeError(msg.id, stratum::error_code::NOT_AUTHORIZED,
                                                "Not authorized"), events);
        return;
    }

    session->submitted++;

    bool fee = false;
    if (fee_.NextSubmitIsFee()) {
        fee = fee_.RewriteSubmit(msg);
        if (!fee) {
            LogWarning("Session", "Session " + std::to_string(session->id) +
                       " submit has no payee field, relaying unchanged");
        }
    }

    AddPending(*session, msg.id, Method::SUBMIT, false, fee);
    SendToUpstream(session, msg, events);
    if (session->upstream) {
        session->state = SessionState::ACTIVE;
    }
}

// ============================================================================
// Pool -> Miner
// ============================================================================

void SessionManager::HandleUpstreamMessage(const SessionPtr& session, Message msg, Events& events) {
    switch (msg.kind) {
        case MessageKind::RESPONSE:
            HandleUpstreamResponse(session, msg, events);
            break;
        case MessageKind::NOTIFICATION:
            HandleUpstreamNotification(*session, msg);
            SendToMiner(session, msg, events);
            break;
        case MessageKind::REQUEST:
            // Pool-initiated request (client.get_version, client.reconnect, ...)
            SendToMiner(session, msg, events);
            break;
    }
}

void SessionManager::HandleUpstreamResponse(const SessionPtr& session, Message& msg, Events& events) {
    if (!msg.has_id) {
        SendToMiner(session, msg, events);
        return;
    }

    // Proxy-originated requests were sent first, so they claim a shared id first
    std::string key = stratum::IdKey(msg.id);
    PendingRequest request;
    auto internal_it = session->internal_pending.find(key);
    auto it = session->pending.find(key);
    if (internal_it != session->internal_pending.end()) {
        request = internal_it->second;
        session->internal_pending.erase(internal_it);
    } else if (it != session->pending.end()) {
        request = it->second;
        session->pending.erase(it);
    } else {
        LogDebug("Session", "Session " + std::to_string(session->id) +
                 " relaying uncorrelated response " + key);
        SendToMiner(session, msg, events);
        return;
    }

    switch (request.method) {
        case Method::SUBSCRIBE: {
            std::optional<stratum::SubscribeResult> sub;
            if (!msg.HasError() && msg.result) {
                sub = stratum::ParseSubscribeResult(*msg.result);
            }
            if (!sub) {
                LogWarning("Session", "Session " + std::to_string(session->id) +
                           " subscribe rejected by pool");
                break;
            }
            bool changed = !session->extranonce1.empty() &&
                           (sub->extranonce1 != session->extranonce1 ||
                            sub->extranonce2_size != session->extranonce2_size);
            session->extranonce1 = sub->extranonce1;
            session->extranonce2_size = sub->extranonce2_size;
            session->subscribed = true;
            if (session->state == SessionState::CONNECTING ||
                session->state == SessionState::AWAITING_UPSTREAM) {
                session->state = SessionState::SUBSCRIBED;
            }
            if (request.internal && changed) {
                SendToMiner(session, stratum::MakeNotification(
                    stratum::MethodName(Method::SET_EXTRANONCE),
                    json::array({sub->extranonce1, sub->extranonce2_size})), events);
            }
            break;
        }
        case Method::AUTHORIZE:
            if (stratum::IsAccepted(msg)) {
                session->authorized = true;
                if (session->state != SessionState::ACTIVE) {
                    session->state = SessionState::AUTHORIZED;
                }
            } else {
                LogWarning("Session", "Session " + std::to_string(session->id) + " authorization for " +
                           session->address + " rejected by pool");
                session->authorized = false;
                if (session->state == SessionState::AUTHORIZED || session->state == SessionState::ACTIVE) {
                    session->state = session->subscribed ? SessionState::SUBSCRIBED
                                                         : SessionState::AWAITING_UPSTREAM;
                }
            }
            break;
        case Method::SUBMIT: {
            bool accepted = stratum::IsAccepted(msg);
            if (accepted) {
                session->accepted++;
                if (request.fee) session->fee_shares++;
            } else {
                session->rejected++;
            }
            double difficulty = session->difficulty;
            hashrate_.AddShare(difficulty, accepted, clock_());

            SessionSnapshot snap = MakeSnapshot(*session);
            bool fee = request.fee;
            Publish(events, [snap, accepted, difficulty, fee](SessionObserver& o) {
                o.OnShareResolved(snap, accepted, difficulty, fee);
            });
            break;
        }
        default:
            break;
    }

    if (!request.internal) {
        SendToMiner(session, msg, events);
    }
}

void SessionManager::HandleUpstreamNotification(Session& session, const Message& msg) {
    const json params = msg.params ? *msg.params : json();

    switch (msg.GetMethod()) {
        case Method::SET_DIFFICULTY: {
            auto difficulty = stratum::ParseDifficulty(params);
            if (difficulty && *difficulty > 0) {
                session.difficulty = *difficulty;
                LogDebug("Session", "Session " + std::to_string(session.id) +
                         " difficulty " + std::to_string(*difficulty));
            }
            break;
        }
        case Method::NOTIFY:
            session.job_count++;
            if (params.is_array() && !params.empty() && params[0].is_string()) {
                session.job_id = params[0].get<std::string>();
            } else if (params.is_object() && params.contains("job_id") && params["job_id"].is_string()) {
                session.job_id = params["job_id"].get<std::string>();
            }
            break;
        case Method::SET_TARGET:
            session.target = params.is_array() && !params.empty() ? params[0] : params;
            break;
        case Method::SET_EXTRANONCE:
            if (params.is_array() && params.size() >= 2 && params[0].is_string() &&
                params[1].is_number_integer()) {
                session.extranonce1 = params[0].get<std::string>();
                session.extranonce2_size = params[1].get<int>();
            }
            break;
        default:
            break;
    }
}

// ============================================================================
// Reporting
// ============================================================================

std::optional<SessionSnapshot> SessionManager::GetSession(uint64_t session_id) const {
    SessionPtr session = FindSession(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    return MakeSnapshot(*session);
}

std::vector<SessionSnapshot> SessionManager::GetSessions() const {
    std::vector<SessionSnapshot> result;
    for (const auto& session : AllSessions()) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (!session->closed) {
            result.push_back(MakeSnapshot(*session));
        }
    }
    return result;
}

ProxyTotals SessionManager::GetTotals() const {
    ProxyTotals totals;
    for (const auto& snap : GetSessions()) {
        totals.active_sessions++;
        if (snap.authorized) totals.authorized_sessions++;
        if (snap.upstream_connected) totals.upstream_connected++;
        totals.submitted += snap.submitted;
        totals.accepted += snap.accepted;
        totals.rejected += snap.rejected;
        totals.fee_shares += snap.fee_shares;
    }
    totals.total_connections = total_connections_.load();
    totals.total_reconnects = total_reconnects_.load();
    return totals;
}

size_t SessionManager::GetSessionCount() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

// ============================================================================
// Logging Observer
// ============================================================================

void LoggingObserver::OnSessionConnected(const SessionSnapshot& session) {
    LogInfo("Session", "Miner " + std::to_string(session.id) + " connected from " +
            session.remote_address);
}

void LoggingObserver::OnSessionDisconnected(const SessionSnapshot& session, const std::string& reason) {
    LogInfo("Session", "Miner " + std::to_string(session.id) + " disconnected: " + reason +
            " (accepted: " + std::to_string(session.accepted) +
            ", rejected: " + std::to_string(session.rejected) + ")");
}

void LoggingObserver::OnShareResolved(const SessionSnapshot& session, bool accepted,
                                      double difficulty, bool fee) {
    std::string who = session.address + "." + session.worker;
    std::string detail = " (session " + std::to_string(session.id) + ", " + who +
                         ", difficulty " + std::to_string(static_cast<uint64_t>(difficulty)) +
                         (fee ? ", fee" : "") + ")";
    if (accepted) {
        LogInfo("Session", "Share accepted" + detail);
    } else {
        LogWarning("Session", "Share rejected" + detail);
    }
}

void LoggingObserver::OnDialFailed(const SessionSnapshot& session, const std::string& pool,
                                   const std::string& error) {
    LogError("Upstream", "Session " + std::to_string(session.id) + " failed to connect to pool " +
             (pool.empty() ? "(none)" : pool) + ": " + error);
}

void LoggingObserver::OnUpstreamLost(const SessionSnapshot& session, const std::string& reason) {
    LogWarning("Upstream", "Session " + std::to_string(session.id) + " lost pool connection: " +
               reason + ", reconnect scheduled");
}

void LoggingObserver::OnUpstreamRestored(const SessionSnapshot& session) {
    LogInfo("Upstream", "Session " + std::to_string(session.id) + " reconnected to pool " +
            session.pool_name);
}

} // namespace minerproxy
