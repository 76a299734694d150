/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Sliding-Window Hashrate Aggregation
 */

#include "minerproxy/pool.h"
#include <algorithm>
#include <cmath>

namespace minerproxy {

namespace {

double RoundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

constexpr std::chrono::seconds HashrateAggregator::kRealtimeWindow;
constexpr std::chrono::seconds HashrateAggregator::kShortWindow;
constexpr std::chrono::seconds HashrateAggregator::kHorizon;
constexpr double HashrateAggregator::kDisplayDivisor;

HashrateAggregator::HashrateAggregator(Clock clock)
    : clock_(std::move(clock))
{}

void HashrateAggregator::AddShare(double difficulty, bool accepted) {
    AddShare(difficulty, accepted, clock_());
}

void HashrateAggregator::AddShare(double difficulty, bool accepted, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);

    shares_.push_back({now, difficulty, accepted});

    // Prune anything older than the horizon
    TimePoint cutoff = now - kHorizon;
    while (!shares_.empty() && shares_.front().timestamp <= cutoff) {
        shares_.pop_front();
    }
}

double HashrateAggregator::CalculateHashrate(std::chrono::seconds window) const {
    return CalculateHashrate(window, clock_());
}

double HashrateAggregator::CalculateHashrate(std::chrono::seconds window, TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);

    TimePoint cutoff = now - window;
    double total_difficulty = 0.0;
    std::optional<TimePoint> earliest;

    for (const auto& share : shares_) {
        if (!share.accepted || share.timestamp <= cutoff) {
            continue;
        }
        total_difficulty += share.difficulty;
        if (!earliest || share.timestamp < *earliest) {
            earliest = share.timestamp;
        }
    }

    if (!earliest) {
        return 0.0;
    }

    double elapsed = std::chrono::duration<double>(now - *earliest).count();
    return total_difficulty / std::max(elapsed, 1.0);
}

HashrateSnapshot HashrateAggregator::GetHashrate() const {
    return GetHashrate(clock_());
}

HashrateSnapshot HashrateAggregator::GetHashrate(TimePoint now) const {
    HashrateSnapshot snapshot;
    snapshot.realtime = RoundTo2(CalculateHashrate(kRealtimeWindow, now) / kDisplayDivisor);
    snapshot.avg_15min = RoundTo2(CalculateHashrate(kShortWindow, now) / kDisplayDivisor);
    snapshot.avg_24h = RoundTo2(CalculateHashrate(kHorizon, now) / kDisplayDivisor);
    return snapshot;
}

ShareStatistics HashrateAggregator::GetShareStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    ShareStatistics stats;
    stats.total = shares_.size();
    for (const auto& share : shares_) {
        if (share.accepted) {
            stats.accepted++;
        } else {
            stats.rejected++;
        }
    }
    if (stats.total > 0) {
        stats.accept_rate = RoundTo2(100.0 * static_cast<double>(stats.accepted) /
                                     static_cast<double>(stats.total));
    }
    return stats;
}

size_t HashrateAggregator::GetRecordCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shares_.size();
}

void HashrateAggregator::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    shares_.clear();
}

} // namespace minerproxy
