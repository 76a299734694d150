/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Session Manager Tests
 */

#include <gtest/gtest.h>
#include "minerproxy/pool.h"
#include "minerproxy/proxy.h"
#include "minerproxy/stratum.h"
#include "minerproxy/util.h"
#include "test_support.h"
#include <chrono>
#include <memory>
#include <vector>

using namespace minerproxy;
using namespace minerproxy::testing_support;
using stratum::json;

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SetLogLevel(LogLevel::ERROR);
        registry_ = std::make_unique<PoolRegistry>(PoolRegistry::PoolList{MakePool("main")}, 7);
        hashrate_ = std::make_unique<HashrateAggregator>(clock_.AsClock());
    }

    void TearDown() override {
        manager_.reset();
        SetLogLevel(LogLevel::INFO);
    }

    void CreateManager(FeeConfig fee = FeeConfig()) {
        manager_ = std::make_unique<SessionManager>(*registry_, dialer_, *hashrate_, fee, config_,
                                                    clock_.AsClock());
        observer_ = std::make_shared<RecordingObserver>();
        manager_->AddObserver(observer_);
    }

    uint64_t Connect(std::shared_ptr<FakeChannel>& miner, const std::string& address = "10.0.0.2:50000") {
        if (!manager_) CreateManager();
        miner = std::make_shared<FakeChannel>(address);
        auto result = manager_->OpenSession(miner);
        EXPECT_TRUE(result.IsOk()) << result.GetError();
        return result.IsOk() ? result.GetValue() : 0;
    }

    void MinerSends(uint64_t id, const json& message) {
        manager_->OnMinerData(id, Line(message));
    }

    /// subscribe + pool reply with the given extranonce
    void Subscribe(uint64_t id, const std::string& extranonce1 = "08000002") {
        MinerSends(id, {{"id", 1}, {"method", "mining.subscribe"}, {"params", json::array({"cgminer/4.10"})}});
        dialer_.Deliver(json{{"id", 1},
                             {"result", json::array({json::array({json::array({"mining.notify", "ae6812eb4cd7735a302a8a9dd95cf71f"})}),
                                                     extranonce1, 4})},
                             {"error", nullptr}});
    }

    /// authorize + pool acceptance
    void Authorize(uint64_t id, const std::string& user = "1BoatSLRHtKNngkdXEeobR76b53LETtpyT.rig1") {
        MinerSends(id, {{"id", 2}, {"method", "mining.authorize"}, {"params", {user, "x"}}});
        dialer_.Deliver(json{{"id", 2}, {"result", true}, {"error", nullptr}});
    }

    json Submit(int request_id, const std::string& worker = "1BoatSLRHtKNngkdXEeobR76b53LETtpyT.rig1") {
        return json{{"id", request_id}, {"method", "mining.submit"},
                    {"params", {worker, "job1", "00000001", "5f5e1000", "1a2b3c4d"}}};
    }

    /// Last message the miner received
    static json LastTo(const std::shared_ptr<FakeChannel>& channel) {
        auto sent = channel->Sent();
        return sent.empty() ? json() : sent.back();
    }

    ManualClock clock_;
    FakeDialer dialer_;
    SessionManagerConfig config_;
    std::unique_ptr<PoolRegistry> registry_;
    std::unique_ptr<HashrateAggregator> hashrate_;
    std::shared_ptr<RecordingObserver> observer_;
    std::unique_ptr<SessionManager> manager_;
};

// ============================================================================
// Session Lifecycle Tests
// ============================================================================

TEST_F(SessionManagerTest, Lifecycle_OpenAssignsIdsAndNotifies) {
    std::shared_ptr<FakeChannel> a, b;
    uint64_t first = Connect(a);
    uint64_t second = Connect(b, "10.0.0.3:50001");

    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(manager_->GetSessionCount(), 2u);
    EXPECT_EQ(observer_->connected.size(), 2u);

    auto snap = manager_->GetSession(second);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->remote_address, "10.0.0.3:50001");
    EXPECT_EQ(snap->state, SessionState::CONNECTING);
    EXPECT_FALSE(snap->upstream_connected);
    EXPECT_EQ(dialer_.DialCount(), 0u);
}

TEST_F(SessionManagerTest, Lifecycle_ConnectionCap) {
    config_.max_sessions = 1;
    CreateManager();

    std::shared_ptr<FakeChannel> a;
    Connect(a);

    auto rejected = manager_->OpenSession(std::make_shared<FakeChannel>());
    ASSERT_TRUE(rejected.IsError());
    EXPECT_EQ(rejected.GetError(), "Connection limit reached (1)");
    EXPECT_EQ(manager_->GetSessionCount(), 1u);
}

TEST_F(SessionManagerTest, Lifecycle_MinerCloseTearsDownBothLegs) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    auto upstream = dialer_.Last().channel;

    manager_->OnMinerClosed(id, "Connection closed by peer");

    EXPECT_TRUE(upstream->IsClosed());
    EXPECT_TRUE(miner->IsClosed());
    EXPECT_FALSE(manager_->GetSession(id).has_value());
    ASSERT_EQ(observer_->disconnected.size(), 1u);
    EXPECT_EQ(observer_->disconnected[0].second, "Connection closed by peer");

    // Late data for a removed session is ignored
    manager_->OnMinerData(id, Line(Submit(9)));
    EXPECT_FALSE(manager_->CloseSession(id, "again"));
    EXPECT_EQ(observer_->disconnected.size(), 1u);
}

TEST_F(SessionManagerTest, Lifecycle_ShutdownClosesEverySession) {
    std::shared_ptr<FakeChannel> a, b;
    Connect(a);
    Connect(b);

    manager_->Shutdown();

    EXPECT_EQ(manager_->GetSessionCount(), 0u);
    EXPECT_TRUE(a->IsClosed());
    EXPECT_TRUE(b->IsClosed());
    ASSERT_EQ(observer_->disconnected.size(), 2u);
    EXPECT_EQ(observer_->disconnected[0].second, "Server shutdown");
}

TEST_F(SessionManagerTest, Lifecycle_IdleSweep) {
    std::shared_ptr<FakeChannel> quiet, busy;
    uint64_t quiet_id = Connect(quiet);
    uint64_t busy_id = Connect(busy);

    clock_.Advance(std::chrono::seconds(300));
    MinerSends(busy_id, {{"id", 5}, {"method", "mining.extranonce.subscribe"}, {"params", json::array()}});

    clock_.Advance(std::chrono::seconds(300));
    EXPECT_EQ(manager_->SweepIdleSessions(), 0u);

    clock_.Advance(std::chrono::seconds(1));
    EXPECT_EQ(manager_->SweepIdleSessions(), 1u);

    EXPECT_FALSE(manager_->GetSession(quiet_id).has_value());
    EXPECT_TRUE(manager_->GetSession(busy_id).has_value());
    EXPECT_TRUE(quiet->IsClosed());
    ASSERT_EQ(observer_->disconnected.size(), 1u);
    EXPECT_EQ(observer_->disconnected[0].second, "Idle timeout");
}

TEST_F(SessionManagerTest, Lifecycle_MinerWriteFailureClosesSession) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    miner->SetFailSends(true);

    MinerSends(id, Submit(3));

    EXPECT_FALSE(manager_->GetSession(id).has_value());
    ASSERT_EQ(observer_->disconnected.size(), 1u);
    EXPECT_NE(observer_->disconnected[0].second.find("Miner write failed"), std::string::npos);
}

// ============================================================================
// Handshake Tests
// ============================================================================

TEST_F(SessionManagerTest, Handshake_SubscribeDialsAndRelays) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);

    MinerSends(id, {{"id", 1}, {"method", "mining.subscribe"}, {"params", json::array({"cgminer/4.10"})}});
    ASSERT_EQ(dialer_.LegCount(), 1u);
    EXPECT_EQ(dialer_.Last().pool.name, "main");

    auto upstream_sent = dialer_.Last().channel->Sent();
    ASSERT_EQ(upstream_sent.size(), 1u);
    EXPECT_EQ(upstream_sent[0]["method"], "mining.subscribe");
    EXPECT_EQ(upstream_sent[0]["id"], 1);

    auto snap = manager_->GetSession(id);
    EXPECT_EQ(snap->state, SessionState::AWAITING_UPSTREAM);
    EXPECT_TRUE(snap->upstream_connected);
    EXPECT_EQ(snap->pool_name, "main");

    dialer_.Deliver(json{{"id", 1}, {"result", json::array({json::array(), "08000002", 4})}, {"error", nullptr}});

    json reply = LastTo(miner);
    EXPECT_EQ(reply["id"], 1);
    EXPECT_EQ(reply["result"][1], "08000002");

    snap = manager_->GetSession(id);
    EXPECT_EQ(snap->state, SessionState::SUBSCRIBED);
    EXPECT_TRUE(snap->subscribed);
    EXPECT_EQ(snap->extranonce1, "08000002");
    EXPECT_EQ(snap->extranonce2_size, 4);
}

TEST_F(SessionManagerTest, Handshake_AuthorizeRelaysCredentialsUnchanged) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);

    std::string aleo = "aleo1" + std::string(58, 'z');
    MinerSends(id, {{"id", 2}, {"method", "mining.authorize"}, {"params", {aleo + ".rig1", "secret"}}});

    json forwarded = dialer_.Last().channel->Sent().back();
    EXPECT_EQ(forwarded["method"], "mining.authorize");
    EXPECT_EQ(forwarded["params"], json::array({aleo + ".rig1", "secret"}));

    auto snap = manager_->GetSession(id);
    EXPECT_FALSE(snap->authorized);
    EXPECT_EQ(snap->address, aleo);
    EXPECT_EQ(snap->worker, "rig1");
    EXPECT_EQ(snap->coin, CoinType::ALEO);

    dialer_.Deliver(json{{"id", 2}, {"result", true}, {"error", nullptr}});
    EXPECT_EQ(LastTo(miner), json::parse("{\"id\":2,\"result\":true,\"error\":null}"));

    snap = manager_->GetSession(id);
    EXPECT_TRUE(snap->authorized);
    EXPECT_EQ(snap->state, SessionState::AUTHORIZED);
}

TEST_F(SessionManagerTest, Handshake_AuthorizeRejectedByPool) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);

    MinerSends(id, {{"id", 2}, {"method", "mining.authorize"}, {"params", {"bad.worker", "x"}}});
    dialer_.Deliver(json{{"id", 2}, {"result", false}, {"error", {24, "Unauthorized worker", nullptr}}});

    EXPECT_EQ(LastTo(miner)["error"][0], 24);
    EXPECT_FALSE(manager_->GetSession(id)->authorized);

    MinerSends(id, Submit(3, "bad.worker"));
    EXPECT_EQ(LastTo(miner)["error"][0], stratum::error_code::NOT_AUTHORIZED);
}

TEST_F(SessionManagerTest, Handshake_InvalidAuthorizeParams) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    size_t upstream_lines = dialer_.Last().channel->Lines().size();

    MinerSends(id, {{"id", 2}, {"method", "mining.authorize"}, {"params", json::array()}});

    json reply = LastTo(miner);
    EXPECT_EQ(reply["id"], 2);
    EXPECT_TRUE(reply["result"].is_null());
    EXPECT_EQ(reply["error"], json::array({24, "Invalid authorization format", nullptr}));
    EXPECT_EQ(dialer_.Last().channel->Lines().size(), upstream_lines);
}

TEST_F(SessionManagerTest, Handshake_AuthorizeFirstDialsUpstream) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);

    MinerSends(id, {{"id", 1}, {"method", "mining.authorize"}, {"params", {"wallet.w", "x"}}});
    ASSERT_EQ(dialer_.LegCount(), 1u);
    EXPECT_EQ(dialer_.Last().channel->Sent()[0]["method"], "mining.authorize");
}

TEST_F(SessionManagerTest, Handshake_DialFailureKeepsSessionOpen) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    dialer_.SetAlwaysFail(true);

    MinerSends(id, {{"id", 1}, {"method", "mining.subscribe"}, {"params", json::array()}});

    json reply = LastTo(miner);
    EXPECT_EQ(reply["id"], 1);
    EXPECT_EQ(reply["error"], json::array({20, "Unable to connect to upstream pool", nullptr}));
    EXPECT_FALSE(miner->IsClosed());
    ASSERT_TRUE(manager_->GetSession(id).has_value());
    EXPECT_FALSE(manager_->GetSession(id)->upstream_connected);
    ASSERT_EQ(observer_->dial_failures.size(), 1u);
    EXPECT_EQ(observer_->dial_failures[0].second, "Connection refused");

    // Miner may retry once the pool is back
    dialer_.SetAlwaysFail(false);
    Subscribe(id);
    EXPECT_TRUE(manager_->GetSession(id)->subscribed);
}

TEST_F(SessionManagerTest, Handshake_NoEnabledPools) {
    registry_->Reload({MakePool("off", 1.0, ProtocolVariant::STRATUM, CoinType::OTHER, false)});
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);

    MinerSends(id, {{"id", 1}, {"method", "mining.subscribe"}, {"params", json::array()}});

    EXPECT_EQ(LastTo(miner)["error"][0], stratum::error_code::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(dialer_.DialCount(), 0u);
    ASSERT_EQ(observer_->dial_failures.size(), 1u);
    EXPECT_EQ(observer_->dial_failures[0].second, "No enabled pools");
}

// ============================================================================
// Share Tests
// ============================================================================

TEST_F(SessionManagerTest, Shares_SubmitBeforeAuthorizeIsRejectedLocally) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);

    MinerSends(id, Submit(4));
    EXPECT_EQ(LastTo(miner), json::parse("{\"id\":4,\"result\":null,\"error\":[25,\"Not authorized\",null]}"));
    EXPECT_EQ(dialer_.DialCount(), 0u);

    Subscribe(id);
    size_t upstream_lines = dialer_.Last().channel->Lines().size();
    MinerSends(id, Submit(5));

    EXPECT_EQ(LastTo(miner)["error"][0], 25);
    EXPECT_EQ(dialer_.Last().channel->Lines().size(), upstream_lines);
    EXPECT_EQ(manager_->GetSession(id)->submitted, 0u);
}

TEST_F(SessionManagerTest, Shares_ResponseCorrelatesAndFeedsHashrate) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    Authorize(id);

    dialer_.Deliver(json{{"id", nullptr}, {"method", "mining.set_difficulty"}, {"params", json::array({2000000})}});
    EXPECT_EQ(LastTo(miner)["method"], "mining.set_difficulty");

    MinerSends(id, Submit(7));
    EXPECT_EQ(manager_->GetSession(id)->state, SessionState::ACTIVE);
    EXPECT_EQ(dialer_.Last().channel->Sent().back()["params"][0], "1BoatSLRHtKNngkdXEeobR76b53LETtpyT.rig1");

    dialer_.Deliver(json{{"id", 7}, {"result", true}, {"error", nullptr}});
    EXPECT_EQ(LastTo(miner), json::parse("{\"id\":7,\"result\":true,\"error\":null}"));

    MinerSends(id, Submit(8));
    dialer_.Deliver(json{{"id", 8}, {"result", nullptr}, {"error", {23, "Low difficulty share", nullptr}}});
    EXPECT_EQ(LastTo(miner)["error"][0], 23);

    auto snap = manager_->GetSession(id);
    EXPECT_EQ(snap->submitted, 2u);
    EXPECT_EQ(snap->accepted, 1u);
    EXPECT_EQ(snap->rejected, 1u);
    EXPECT_DOUBLE_EQ(snap->difficulty, 2000000.0);

    ShareStatistics stats = hashrate_->GetShareStats();
    EXPECT_EQ(stats.accepted, 1u);
    EXPECT_EQ(stats.rejected, 1u);

    ASSERT_EQ(observer_->shares.size(), 2u);
    EXPECT_TRUE(observer_->shares[0].accepted);
    EXPECT_DOUBLE_EQ(observer_->shares[0].difficulty, 2000000.0);
    EXPECT_FALSE(observer_->shares[1].accepted);

    ProxyTotals totals = manager_->GetTotals();
    EXPECT_EQ(totals.accepted, 1u);
    EXPECT_EQ(totals.rejected, 1u);
    EXPECT_EQ(totals.authorized_sessions, 1u);
}

TEST_F(SessionManagerTest, Shares_StringIdsSurviveTheRoundTrip) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    Authorize(id);

    json submit = Submit(0);
    submit["id"] = "share-7";
    MinerSends(id, submit);
    dialer_.Deliver(json{{"id", "share-7"}, {"result", true}, {"error", nullptr}});

    EXPECT_EQ(LastTo(miner)["id"], "share-7");
    EXPECT_EQ(manager_->GetSession(id)->accepted, 1u);
}

TEST_F(SessionManagerTest, Shares_FeeRedirectIsInvisibleToMiner) {
    CreateManager({true, 10.0, "feewallet", "proxy"});
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    Authorize(id);

    for (int i = 0; i < 10; i++) {
        int request_id = 100 + i;
        MinerSends(id, Submit(request_id));
        dialer_.Deliver(json{{"id", request_id}, {"result", true}, {"error", nullptr}});
        EXPECT_EQ(LastTo(miner), json({{"id", request_id}, {"result", true}, {"error", nullptr}}));
    }

    std::vector<json> submits;
    for (const auto& line : dialer_.Last().channel->Sent()) {
        if (line.value("method", "") == "mining.submit") submits.push_back(line);
    }
    ASSERT_EQ(submits.size(), 10u);
    for (size_t i = 0; i < 9; i++) {
        EXPECT_EQ(submits[i]["params"][0], "1BoatSLRHtKNngkdXEeobR76b53LETtpyT.rig1");
    }
    EXPECT_EQ(submits[9]["params"][0], "feewallet.proxy");
    EXPECT_EQ(submits[9]["id"], 109);
    EXPECT_EQ(submits[9]["params"][1], "job1");

    auto snap = manager_->GetSession(id);
    EXPECT_EQ(snap->accepted, 10u);
    EXPECT_EQ(snap->fee_shares, 1u);
    ASSERT_EQ(observer_->shares.size(), 10u);
    EXPECT_TRUE(observer_->shares[9].fee);
    EXPECT_EQ(manager_->GetFeeInjector().GetFeeCount(), 1u);
}

TEST_F(SessionManagerTest, Shares_FeeCounterIsFleetWide) {
    CreateManager({true, 50.0, "feewallet", ""});
    std::shared_ptr<FakeChannel> a, b;
    uint64_t first = Connect(a);
    Subscribe(first);
    Authorize(first);
    auto leg_a = dialer_.Last().channel;

    uint64_t second = Connect(b);
    Subscribe(second);
    Authorize(second);
    auto leg_b = dialer_.Last().channel;

    MinerSends(first, Submit(10));
    MinerSends(second, Submit(11));

    EXPECT_EQ(leg_a->Sent().back()["params"][0], "1BoatSLRHtKNngkdXEeobR76b53LETtpyT.rig1");
    EXPECT_EQ(leg_b->Sent().back()["params"][0], "feewallet");
}

TEST_F(SessionManagerTest, Shares_NullIdSubmitIsGated) {
    CreateManager({true, 100.0, "feewallet", ""});
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    size_t upstream_lines = dialer_.Last().channel->Lines().size();

    json submit = Submit(0);
    submit["id"] = nullptr;
    MinerSends(id, submit);

    EXPECT_EQ(LastTo(miner), json::parse("{\"id\":null,\"result\":null,\"error\":[25,\"Not authorized\",null]}"));
    EXPECT_EQ(dialer_.Last().channel->Lines().size(), upstream_lines);
    EXPECT_EQ(manager_->GetFeeInjector().GetSubmitCount(), 0u);

    // Once authorized it is counted and redirected like any other submit
    Authorize(id);
    MinerSends(id, submit);

    json forwarded = dialer_.Last().channel->Sent().back();
    EXPECT_EQ(forwarded["method"], "mining.submit");
    EXPECT_TRUE(forwarded["id"].is_null());
    EXPECT_EQ(forwarded["params"][0], "feewallet");
    EXPECT_EQ(manager_->GetFeeInjector().GetSubmitCount(), 1u);

    dialer_.Deliver(json{{"id", nullptr}, {"result", true}, {"error", nullptr}});
    auto snap = manager_->GetSession(id);
    EXPECT_EQ(snap->submitted, 1u);
    EXPECT_EQ(snap->accepted, 1u);
    EXPECT_EQ(snap->fee_shares, 1u);
}

TEST_F(SessionManagerTest, Shares_PendingTableIsBounded) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    Authorize(id);

    const int first_id = 1000;
    const int overflow = 6;
    const int total = static_cast<int>(kMaxPendingRequests) + overflow;
    for (int i = 0; i < total; i++) {
        MinerSends(id, Submit(first_id + i));
    }

    auto snap = manager_->GetSession(id);
    EXPECT_EQ(snap->submitted, static_cast<uint64_t>(total));
    EXPECT_EQ(snap->pending_requests, kMaxPendingRequests);

    // The oldest entry was evicted: its answer is relayed but not counted
    dialer_.Deliver(json{{"id", first_id}, {"result", true}, {"error", nullptr}});
    EXPECT_EQ(LastTo(miner)["id"], first_id);
    snap = manager_->GetSession(id);
    EXPECT_EQ(snap->accepted, 0u);
    EXPECT_EQ(snap->pending_requests, kMaxPendingRequests);

    // The oldest retained and the newest still correlate
    dialer_.Deliver(json{{"id", first_id + overflow}, {"result", true}, {"error", nullptr}});
    dialer_.Deliver(json{{"id", first_id + total - 1}, {"result", true}, {"error", nullptr}});
    snap = manager_->GetSession(id);
    EXPECT_EQ(snap->accepted, 2u);
    EXPECT_EQ(snap->pending_requests, kMaxPendingRequests - 2);
}

// ============================================================================
// Relay Tests
// ============================================================================

TEST_F(SessionManagerTest, Relay_NotificationsUpdateJobState) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);

    json notify{{"id", nullptr}, {"method", "mining.notify"},
                {"params", {"job42", "prevhash", "cb1", "cb2", json::array(), "20000000", "1d00ffff", "5f5e1000", true}}};
    dialer_.Deliver(notify);
    EXPECT_EQ(LastTo(miner), notify);

    dialer_.Deliver(json{{"id", nullptr}, {"method", "mining.set_extranonce"}, {"params", {"0a0b0c0d", 8}}});

    auto snap = manager_->GetSession(id);
    EXPECT_EQ(snap->job_id, "job42");
    EXPECT_EQ(snap->job_count, 1u);
    EXPECT_EQ(snap->extranonce1, "0a0b0c0d");
    EXPECT_EQ(snap->extranonce2_size, 8);
}

TEST_F(SessionManagerTest, Relay_UnknownRequestsAndPoolRequests) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);

    MinerSends(id, {{"id", 3}, {"method", "mining.extranonce.subscribe"}, {"params", json::array()}});
    EXPECT_EQ(LastTo(miner)["error"], json::array({20, "Upstream not connected", nullptr}));

    Subscribe(id);
    MinerSends(id, {{"id", 3}, {"method", "mining.extranonce.subscribe"}, {"params", json::array()}});
    EXPECT_EQ(dialer_.Last().channel->Sent().back()["method"], "mining.extranonce.subscribe");
    dialer_.Deliver(json{{"id", 3}, {"result", true}, {"error", nullptr}});
    EXPECT_EQ(LastTo(miner)["result"], true);

    // Pool asks the miner something, the miner answers through the proxy
    dialer_.Deliver(json{{"id", 50}, {"method", "client.get_version"}, {"params", json::array()}});
    EXPECT_EQ(LastTo(miner)["method"], "client.get_version");

    MinerSends(id, {{"id", 50}, {"result", "cgminer/4.10"}, {"error", nullptr}});
    EXPECT_EQ(dialer_.Last().channel->Sent().back()["result"], "cgminer/4.10");
}

TEST_F(SessionManagerTest, Relay_UncorrelatedResponsePassesThrough) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);

    dialer_.Deliver(json{{"id", 999}, {"result", true}, {"error", nullptr}});
    EXPECT_EQ(LastTo(miner)["id"], 999);
}

TEST_F(SessionManagerTest, Relay_MalformedLinesAreSkipped) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);

    manager_->OnMinerData(id, "garbage\n{\"id\":1,\"method\":\"mining.subscribe\",\"params\":[]}\n");
    EXPECT_EQ(dialer_.LegCount(), 1u);
    EXPECT_TRUE(manager_->GetSession(id).has_value());
}

// ============================================================================
// Upstream Recovery Tests
// ============================================================================

TEST_F(SessionManagerTest, Recovery_ReconnectReplaysHandshake) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id, "08000002");
    Authorize(id);
    auto first_leg = dialer_.Last().channel;
    miner->Clear();

    dialer_.Drop("Connection closed by peer");

    EXPECT_TRUE(first_leg->IsClosed());
    EXPECT_FALSE(miner->IsClosed());
    EXPECT_TRUE(observer_->disconnected.empty());
    ASSERT_EQ(observer_->upstream_lost.size(), 1u);

    auto snap = manager_->GetSession(id);
    EXPECT_FALSE(snap->upstream_connected);
    EXPECT_EQ(snap->state, SessionState::AWAITING_UPSTREAM);

    // Submits while the pool is away are refused
    MinerSends(id, Submit(6));
    EXPECT_EQ(LastTo(miner)["error"][0], 25);
    miner->Clear();

    clock_.Advance(std::chrono::seconds(4));
    EXPECT_EQ(manager_->RunPendingReconnects(), 0u);
    EXPECT_EQ(dialer_.LegCount(), 1u);

    clock_.Advance(std::chrono::seconds(1));
    EXPECT_EQ(manager_->RunPendingReconnects(), 1u);
    ASSERT_EQ(dialer_.LegCount(), 2u);

    auto replay = dialer_.Last().channel->Sent();
    ASSERT_EQ(replay.size(), 2u);
    EXPECT_EQ(replay[0]["method"], "mining.subscribe");
    EXPECT_EQ(replay[0]["id"], kInternalRequestIdBase);
    EXPECT_EQ(replay[0]["params"], json::array({"cgminer/4.10"}));
    EXPECT_EQ(replay[1]["method"], "mining.authorize");
    EXPECT_EQ(replay[1]["id"], kInternalRequestIdBase + 1);
    EXPECT_EQ(replay[1]["params"], json::array({"1BoatSLRHtKNngkdXEeobR76b53LETtpyT.rig1", "x"}));

    dialer_.Deliver(json{{"id", kInternalRequestIdBase},
                         {"result", json::array({json::array(), "0a000003", 4})}, {"error", nullptr}});
    dialer_.Deliver(json{{"id", kInternalRequestIdBase + 1}, {"result", true}, {"error", nullptr}});

    // Only the extranonce change reaches the miner; internal responses are consumed
    auto to_miner = miner->Sent();
    ASSERT_EQ(to_miner.size(), 1u);
    EXPECT_EQ(to_miner[0]["method"], "mining.set_extranonce");
    EXPECT_EQ(to_miner[0]["params"], json::array({"0a000003", 4}));

    snap = manager_->GetSession(id);
    EXPECT_TRUE(snap->upstream_connected);
    EXPECT_TRUE(snap->subscribed);
    EXPECT_TRUE(snap->authorized);
    EXPECT_EQ(snap->extranonce1, "0a000003");
    EXPECT_EQ(observer_->upstream_restored.size(), 1u);
    EXPECT_TRUE(observer_->disconnected.empty());
    EXPECT_EQ(manager_->GetTotals().total_reconnects, 1u);

    // Shares flow again on the new leg
    MinerSends(id, Submit(12));
    EXPECT_EQ(dialer_.Last().channel->Sent().back()["id"], 12);
}

TEST_F(SessionManagerTest, Recovery_SameExtranonceSendsNothing) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id, "08000002");
    miner->Clear();

    dialer_.Drop();
    clock_.Advance(config_.reconnect_delay);
    ASSERT_EQ(manager_->RunPendingReconnects(), 1u);

    // Not authorized before the drop, so only subscribe is replayed
    ASSERT_EQ(dialer_.Last().channel->Sent().size(), 1u);
    dialer_.Deliver(json{{"id", kInternalRequestIdBase},
                         {"result", json::array({json::array(), "08000002", 4})}, {"error", nullptr}});
    EXPECT_TRUE(miner->Sent().empty());
}

TEST_F(SessionManagerTest, Recovery_FailedRedialIsRescheduled) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);

    dialer_.Drop();
    dialer_.FailNext(1);

    clock_.Advance(std::chrono::seconds(5));
    EXPECT_EQ(manager_->RunPendingReconnects(), 0u);
    EXPECT_EQ(observer_->dial_failures.size(), 1u);

    EXPECT_EQ(manager_->RunPendingReconnects(), 0u);

    clock_.Advance(std::chrono::seconds(5));
    EXPECT_EQ(manager_->RunPendingReconnects(), 1u);
    EXPECT_TRUE(manager_->GetSession(id)->upstream_connected);
}

TEST_F(SessionManagerTest, Recovery_StaleLegCallbacksAreIgnored) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    auto old_leg = dialer_.GetLeg(0);

    dialer_.Drop();
    clock_.Advance(std::chrono::seconds(5));
    ASSERT_EQ(manager_->RunPendingReconnects(), 1u);
    miner->Clear();

    old_leg.handlers.on_data(Line(json{{"id", nullptr}, {"method", "mining.notify"}, {"params", json::array({"stale"})}}));
    old_leg.handlers.on_closed("Connection reset");

    EXPECT_TRUE(miner->Sent().empty());
    EXPECT_TRUE(manager_->GetSession(id)->upstream_connected);
    EXPECT_EQ(observer_->upstream_lost.size(), 1u);
}

TEST_F(SessionManagerTest, Recovery_UpstreamWriteFailureSchedulesReconnect) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id);
    Authorize(id);

    dialer_.Last().channel->SetFailSends(true);
    MinerSends(id, Submit(20));

    auto snap = manager_->GetSession(id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_FALSE(snap->upstream_connected);
    ASSERT_EQ(observer_->upstream_lost.size(), 1u);
    EXPECT_NE(observer_->upstream_lost[0].second.find("Upstream write failed"), std::string::npos);
}

TEST_F(SessionManagerTest, Recovery_MinerIdMatchingReplayIdIsKeptApart) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id, "08000002");
    Authorize(id);

    dialer_.Drop();
    clock_.Advance(config_.reconnect_delay);
    ASSERT_EQ(manager_->RunPendingReconnects(), 1u);
    miner->Clear();

    // The miner happens to reuse the id of the replayed subscribe
    MinerSends(id, Submit(static_cast<int>(kInternalRequestIdBase)));
    auto upstream_sent = dialer_.Last().channel->Sent();
    ASSERT_EQ(upstream_sent.size(), 3u);
    EXPECT_EQ(upstream_sent[2]["method"], "mining.submit");
    EXPECT_EQ(upstream_sent[2]["id"], kInternalRequestIdBase);

    dialer_.Deliver(json{{"id", kInternalRequestIdBase},
                         {"result", json::array({json::array(), "0a000003", 4})}, {"error", nullptr}});
    dialer_.Deliver(json{{"id", kInternalRequestIdBase + 1}, {"result", true}, {"error", nullptr}});
    dialer_.Deliver(json{{"id", kInternalRequestIdBase}, {"result", true}, {"error", nullptr}});

    auto to_miner = miner->Sent();
    ASSERT_EQ(to_miner.size(), 2u);
    EXPECT_EQ(to_miner[0]["method"], "mining.set_extranonce");
    EXPECT_EQ(to_miner[1], json({{"id", kInternalRequestIdBase}, {"result", true}, {"error", nullptr}}));

    auto snap = manager_->GetSession(id);
    EXPECT_EQ(snap->extranonce1, "0a000003");
    EXPECT_TRUE(snap->authorized);
    EXPECT_EQ(snap->accepted, 1u);
}

TEST_F(SessionManagerTest, Recovery_RejectedReauthorizeRevokesShares) {
    std::shared_ptr<FakeChannel> miner;
    uint64_t id = Connect(miner);
    Subscribe(id, "08000002");
    Authorize(id);

    dialer_.Drop();
    clock_.Advance(config_.reconnect_delay);
    ASSERT_EQ(manager_->RunPendingReconnects(), 1u);
    miner->Clear();

    dialer_.Deliver(json{{"id", kInternalRequestIdBase},
                         {"result", json::array({json::array(), "08000002", 4})}, {"error", nullptr}});
    dialer_.Deliver(json{{"id", kInternalRequestIdBase + 1}, {"result", false},
                         {"error", json::array({24, "Unauthorized worker", nullptr})}});

    // Replay answers never reach the miner
    EXPECT_TRUE(miner->Sent().empty());

    auto snap = manager_->GetSession(id);
    EXPECT_FALSE(snap->authorized);
    EXPECT_EQ(snap->state, SessionState::SUBSCRIBED);

    size_t upstream_lines = dialer_.Last().channel->Lines().size();
    MinerSends(id, Submit(30));
    EXPECT_EQ(LastTo(miner)["error"][0], stratum::error_code::NOT_AUTHORIZED);
    EXPECT_EQ(dialer_.Last().channel->Lines().size(), upstream_lines);
}

TEST_F(SessionManagerTest, Recovery_DueReconnectsAreClaimedOnce) {
    std::shared_ptr<FakeChannel> a, b;
    uint64_t first = Connect(a);
    Subscribe(first);
    uint64_t second = Connect(b);
    Subscribe(second);

    dialer_.GetLeg(0).handlers.on_closed("Connection closed by peer");
    dialer_.GetLeg(1).handlers.on_closed("Connection closed by peer");

    EXPECT_TRUE(manager_->TakeDueReconnects().empty());

    clock_.Advance(config_.reconnect_delay);
    std::vector<uint64_t> due = manager_->TakeDueReconnects();
    EXPECT_EQ(due, (std::vector<uint64_t>{first, second}));
    EXPECT_TRUE(manager_->TakeDueReconnects().empty());

    EXPECT_TRUE(manager_->ReconnectSession(second));
    EXPECT_FALSE(manager_->ReconnectSession(second));
    EXPECT_TRUE(manager_->GetSession(second)->upstream_connected);
    EXPECT_FALSE(manager_->GetSession(first)->upstream_connected);
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
