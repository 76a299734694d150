/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Upstream Pool Registry and Weighted Selection
 */

#include "minerproxy/pool.h"
#include "minerproxy/util.h"
#include <regex>

namespace minerproxy {

// ============================================================================
// Descriptor Helpers
// ============================================================================

std::string ToString(ProtocolVariant protocol) {
    switch (protocol) {
        case ProtocolVariant::STRATUM: return "stratum";
        case ProtocolVariant::ALEO: return "aleo";
    }
    return "stratum";
}

std::string ToString(CoinType coin) {
    switch (coin) {
        case CoinType::UNKNOWN: return "unknown";
        case CoinType::BTC: return "btc";
        case CoinType::ETH: return "eth";
        case CoinType::ETC: return "etc";
        case CoinType::LTC: return "ltc";
        case CoinType::ALEO: return "aleo";
        case CoinType::OTHER: return "other";
    }
    return "unknown";
}

Result<ProtocolVariant> ParseProtocolVariant(const std::string& name) {
    std::string value = ToLower(Trim(name));
    if (value == "stratum") return Result<ProtocolVariant>::Ok(ProtocolVariant::STRATUM);
    if (value == "aleo") return Result<ProtocolVariant>::Ok(ProtocolVariant::ALEO);
    return Result<ProtocolVariant>::Error("Unknown protocol: " + name);
}

Result<CoinType> ParseCoinType(const std::string& name) {
    std::string value = ToLower(Trim(name));
    if (value == "btc") return Result<CoinType>::Ok(CoinType::BTC);
    if (value == "eth") return Result<CoinType>::Ok(CoinType::ETH);
    if (value == "etc") return Result<CoinType>::Ok(CoinType::ETC);
    if (value == "ltc") return Result<CoinType>::Ok(CoinType::LTC);
    if (value == "aleo") return Result<CoinType>::Ok(CoinType::ALEO);
    if (value == "other") return Result<CoinType>::Ok(CoinType::OTHER);
    return Result<CoinType>::Error("Unknown coin: " + name);
}

bool IsAleoAddress(const std::string& address) {
    static const std::regex kAleoAddress("^aleo1[a-z0-9]{58}$");
    return std::regex_match(address, kAleoAddress);
}

CoinType ClassifyAddress(const std::string& address) {
    return IsAleoAddress(address) ? CoinType::ALEO : CoinType::OTHER;
}

// ============================================================================
// Pool Registry
// ============================================================================

PoolRegistry::PoolRegistry(PoolList pools)
    : pools_(std::make_shared<const PoolList>(std::move(pools)))
    , rng_(std::random_device{}())
{}

PoolRegistry::PoolRegistry(PoolList pools, uint64_t seed)
    : pools_(std::make_shared<const PoolList>(std::move(pools)))
    , rng_(seed)
{}

void PoolRegistry::Reload(PoolList pools) {
    auto snapshot = std::make_shared<const PoolList>(std::move(pools));
    size_t count = snapshot->size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pools_ = std::move(snapshot);
    }
    LogInfo("Config", "Pool registry reloaded (" + std::to_string(count) + " pools)");
}

PoolRegistry::Snapshot PoolRegistry::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_;
}

bool PoolRegistry::MatchesCoin(const PoolDescriptor& pool, CoinType coin) {
    switch (coin) {
        case CoinType::UNKNOWN:
            return true;
        case CoinType::ALEO:
            return pool.protocol == ProtocolVariant::ALEO || pool.coin == CoinType::ALEO;
        default:
            return pool.protocol == ProtocolVariant::STRATUM && pool.coin != CoinType::ALEO;
    }
}

PoolRegistry::PoolList PoolRegistry::GetEnabledPools(CoinType coin) const {
    Snapshot snapshot = GetSnapshot();
    PoolList result;
    for (const auto& pool : *snapshot) {
        if (pool.enabled && MatchesCoin(pool, coin)) {
            result.push_back(pool);
        }
    }
    return result;
}

std::optional<PoolDescriptor> PoolRegistry::SelectWeighted(const PoolList& pools, double draw) {
    if (pools.empty()) {
        return std::nullopt;
    }

    double total_weight = 0.0;
    for (const auto& pool : pools) {
        total_weight += pool.weight;
    }

    if (total_weight <= 0.0) {
        return pools.front();
    }

    double remaining = draw * total_weight;
    for (const auto& pool : pools) {
        remaining -= pool.weight;
        if (remaining <= 0.0) {
            return pool;
        }
    }

    // Floating point leftovers
    return pools.back();
}

std::optional<PoolDescriptor> PoolRegistry::SelectPool(CoinType coin) {
    PoolList candidates = GetEnabledPools(coin);
    if (candidates.empty() && coin != CoinType::UNKNOWN) {
        LogDebug("Upstream", "No pools for coin " + ToString(coin) + ", using all enabled pools");
        candidates = GetEnabledPools(CoinType::UNKNOWN);
    }
    if (candidates.empty()) {
        return std::nullopt;
    }

    double draw;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        draw = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
    }
    return SelectWeighted(candidates, draw);
}

} // namespace minerproxy
