/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Proxy Configuration
 */

#ifndef MINERPROXY_CONFIG_H
#define MINERPROXY_CONFIG_H

#include "minerproxy/pool.h"
#include "minerproxy/proxy.h"
#include "minerproxy/stats.h"
#include "minerproxy/types.h"
#include "minerproxy/util.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace minerproxy {

struct ProxyConfig {
    // Listener
    std::string host = "0.0.0.0";
    uint16_t port = 3333;
    size_t max_connections = 1000;      // 0 = unlimited

    // Upstream pools, in configured order
    std::vector<PoolDescriptor> pools;

    // Default payout (informational)
    std::string wallet;
    std::string worker_prefix;

    // Fee injection
    bool fee_enabled = false;
    double fee_percent = 0.0;
    std::string fee_wallet;

    // Logging
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;

    // Stats API
    bool stats_enabled = true;
    std::string stats_host = "0.0.0.0";
    uint16_t stats_port = 8080;
    uint32_t stats_interval = 10;       // seconds

    // Timers (seconds)
    uint32_t health_interval = 30;
    uint32_t health_timeout = 10;
    uint32_t reconnect_delay = 5;
    uint32_t idle_timeout = 600;

    std::string user_agent = "minerproxy/1.0";

    FeeConfig GetFeeConfig() const;
    SessionManagerConfig GetSessionConfig() const;
    ListenerConfig GetListenerConfig() const;
    StatsConfig GetStatsConfig() const;
    HealthMonitorConfig GetHealthConfig() const;
};

/// NAME,HOST,PORT[,WEIGHT[,PROTOCOL[,COIN[,FLAG...]]]]  (FLAG: tls | disabled)
Result<PoolDescriptor> ParsePoolDescriptor(const std::string& value);

/// Apply one key=value setting ("pool" appends)
Result<void> ApplyConfigValue(const std::string& key, const std::string& value, ProxyConfig& config);

/// Read a key=value file ('#' comments and blank lines ignored)
Result<void> LoadConfigFile(const std::string& path, ProxyConfig& config);

/// --key=value pairs from the command line, in order
using ConfigOverrides = std::vector<std::pair<std::string, std::string>>;

/// Config file (when given) followed by command-line overrides
Result<ProxyConfig> LoadProxyConfig(const std::string& config_file, const ConfigOverrides& overrides);

/// Check cross-field constraints before startup
Result<void> ValidateConfig(const ProxyConfig& config);

} // namespace minerproxy

#endif // MINERPROXY_CONFIG_H
