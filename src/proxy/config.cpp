/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Proxy Configuration
 */

#include "minerproxy/config.h"
#include <cmath>
#include <fstream>
#include <limits>

namespace minerproxy {

namespace {

Result<uint64_t> ParseUnsigned(const std::string& key, const std::string& value, uint64_t max) {
    std::string v = Trim(value);
    if (v.empty() || v[0] == '-') {
        return Result<uint64_t>::Error("Invalid value for " + key + ": " + value);
    }
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(v, &used);
        if (used != v.size() || parsed > max) {
            return Result<uint64_t>::Error("Invalid value for " + key + ": " + value);
        }
        return Result<uint64_t>::Ok(parsed);
    } catch (const std::exception&) {
        return Result<uint64_t>::Error("Invalid value for " + key + ": " + value);
    }
}

Result<double> ParseNumber(const std::string& key, const std::string& value) {
    std::string v = Trim(value);
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != v.size() || !std::isfinite(parsed)) {
            return Result<double>::Error("Invalid value for " + key + ": " + value);
        }
        return Result<double>::Ok(parsed);
    } catch (const std::exception&) {
        return Result<double>::Error("Invalid value for " + key + ": " + value);
    }
}

Result<uint16_t> ParsePort(const std::string& key, const std::string& value) {
    auto parsed = ParseUnsigned(key, value, std::numeric_limits<uint16_t>::max());
    if (parsed.IsError()) {
        return Result<uint16_t>::Error(parsed.GetError());
    }
    return Result<uint16_t>::Ok(static_cast<uint16_t>(parsed.GetValue()));
}

template <typename T>
Result<void> AssignUnsigned(const std::string& key, const std::string& value, T& target) {
    auto parsed = ParseUnsigned(key, value, std::numeric_limits<T>::max());
    if (parsed.IsError()) {
        return Result<void>::Error(parsed.GetError());
    }
    target = static_cast<T>(parsed.GetValue());
    return Result<void>::Ok();
}

Result<void> AssignBool(const std::string& key, const std::string& value, bool& target) {
    auto parsed = ParseBool(value);
    if (parsed.IsError()) {
        return Result<void>::Error("Invalid value for " + key + ": " + value);
    }
    target = parsed.GetValue();
    return Result<void>::Ok();
}

} // namespace

// ============================================================================
// Derived Component Settings
// ============================================================================

FeeConfig ProxyConfig::GetFeeConfig() const {
    FeeConfig fee;
    fee.enabled = fee_enabled;
    fee.percent = fee_percent;
    fee.wallet = fee_wallet;
    fee.worker_prefix = worker_prefix;
    return fee;
}

SessionManagerConfig ProxyConfig::GetSessionConfig() const {
    SessionManagerConfig session;
    session.reconnect_delay = std::chrono::seconds(reconnect_delay);
    session.idle_timeout = std::chrono::seconds(idle_timeout);
    session.user_agent = user_agent;
    session.max_sessions = max_connections;
    return session;
}

ListenerConfig ProxyConfig::GetListenerConfig() const {
    ListenerConfig listener;
    listener.host = host;
    listener.port = port;
    return listener;
}

StatsConfig ProxyConfig::GetStatsConfig() const {
    StatsConfig stats;
    stats.host = stats_host;
    stats.port = stats_port;
    stats.interval = std::chrono::seconds(stats_interval);
    return stats;
}

HealthMonitorConfig ProxyConfig::GetHealthConfig() const {
    HealthMonitorConfig health;
    health.interval = std::chrono::seconds(health_interval);
    health.timeout = std::chrono::seconds(health_timeout);
    return health;
}

// ============================================================================
// Parsing
// ============================================================================

Result<PoolDescriptor> ParsePoolDescriptor(const std::string& value) {
    std::vector<std::string> fields = Split(value, ',');
    if (fields.size() < 3) {
        return Result<PoolDescriptor>::Error("Pool needs at least NAME,HOST,PORT: " + value);
    }

    PoolDescriptor pool;
    pool.name = fields[0];
    pool.host = fields[1];
    if (pool.name.empty() || pool.host.empty()) {
        return Result<PoolDescriptor>::Error("Pool name and host must not be empty: " + value);
    }

    auto port = ParsePort("pool port", fields[2]);
    if (port.IsError()) {
        return Result<PoolDescriptor>::Error(port.GetError());
    }
    pool.port = port.GetValue();

    if (fields.size() > 3 && !fields[3].empty()) {
        auto weight = ParseNumber("pool weight", fields[3]);
        if (weight.IsError()) {
            return Result<PoolDescriptor>::Error(weight.GetError());
        }
        if (weight.GetValue() < 0.0) {
            return Result<PoolDescriptor>::Error("Pool weight must be >= 0: " + value);
        }
        pool.weight = weight.GetValue();
    }

    if (fields.size() > 4 && !fields[4].empty()) {
        auto protocol = ParseProtocolVariant(fields[4]);
        if (protocol.IsError()) {
            return Result<PoolDescriptor>::Error(protocol.GetError());
        }
        pool.protocol = protocol.GetValue();
    }

    if (fields.size() > 5 && !fields[5].empty()) {
        auto coin = ParseCoinType(fields[5]);
        if (coin.IsError()) {
            return Result<PoolDescriptor>::Error(coin.GetError());
        }
        pool.coin = coin.GetValue();
    }

    for (size_t i = 6; i < fields.size(); i++) {
        std::string flag = ToLower(fields[i]);
        if (flag == "tls" || flag == "ssl") {
            pool.tls = true;
        } else if (flag == "disabled") {
            pool.enabled = false;
        } else if (!flag.empty()) {
            return Result<PoolDescriptor>::Error("Unknown pool flag: " + fields[i]);
        }
    }

    return Result<PoolDescriptor>::Ok(pool);
}

Result<void> ApplyConfigValue(const std::string& raw_key, const std::string& raw_value, ProxyConfig& config) {
    std::string key = Trim(raw_key);
    std::string value = Trim(raw_value);

    if (key == "host") {
        config.host = value;
    } else if (key == "port") {
        auto port = ParsePort(key, value);
        if (port.IsError()) return Result<void>::Error(port.GetError());
        config.port = port.GetValue();
    } else if (key == "max-connections") {
        return AssignUnsigned(key, value, config.max_connections);
    } else if (key == "pool") {
        auto pool = ParsePoolDescriptor(value);
        if (pool.IsError()) return Result<void>::Error(pool.GetError());
        config.pools.push_back(pool.GetValue());
    } else if (key == "wallet") {
        config.wallet = value;
    } else if (key == "worker-prefix") {
        config.worker_prefix = value;
    } else if (key == "fee-enabled") {
        return AssignBool(key, value, config.fee_enabled);
    } else if (key == "fee-percent") {
        auto percent = ParseNumber(key, value);
        if (percent.IsError()) return Result<void>::Error(percent.GetError());
        config.fee_percent = percent.GetValue();
    } else if (key == "fee-wallet") {
        config.fee_wallet = value;
    } else if (key == "log-level") {
        auto level = ParseLogLevel(value);
        if (level.IsError()) return Result<void>::Error(level.GetError());
        config.log_level = level.GetValue();
    } else if (key == "log-file") {
        config.log_file = value;
    } else if (key == "stats-enabled") {
        return AssignBool(key, value, config.stats_enabled);
    } else if (key == "stats-host") {
        config.stats_host = value;
    } else if (key == "stats-port") {
        auto port = ParsePort(key, value);
        if (port.IsError()) return Result<void>::Error(port.GetError());
        config.stats_port = port.GetValue();
    } else if (key == "stats-interval") {
        return AssignUnsigned(key, value, config.stats_interval);
    } else if (key == "health-interval") {
        return AssignUnsigned(key, value, config.health_interval);
    } else if (key == "health-timeout") {
        return AssignUnsigned(key, value, config.health_timeout);
    } else if (key == "reconnect-delay") {
        return AssignUnsigned(key, value, config.reconnect_delay);
    } else if (key == "idle-timeout") {
        return AssignUnsigned(key, value, config.idle_timeout);
    } else if (key == "user-agent") {
        config.user_agent = value;
    } else {
        return Result<void>::Error("Unknown option: " + key);
    }

    return Result<void>::Ok();
}

Result<void> LoadConfigFile(const std::string& path, ProxyConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<void>::Error("Could not open config file: " + path);
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        std::string trimmed = Trim(line);

        // Skip comments and empty lines
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // Parse key=value
        size_t eq_pos = trimmed.find('=');
        if (eq_pos == std::string::npos) {
            return Result<void>::Error(path + ":" + std::to_string(line_number) +
                                       ": expected key=value");
        }

        auto result = ApplyConfigValue(trimmed.substr(0, eq_pos), trimmed.substr(eq_pos + 1), config);
        if (result.IsError()) {
            return Result<void>::Error(path + ":" + std::to_string(line_number) + ": " +
                                       result.GetError());
        }
    }

    return Result<void>::Ok();
}

Result<ProxyConfig> LoadProxyConfig(const std::string& config_file, const ConfigOverrides& overrides) {
    ProxyConfig config;
    if (!config_file.empty()) {
        auto result = LoadConfigFile(config_file, config);
        if (result.IsError()) {
            return Result<ProxyConfig>::Error(result.GetError());
        }
    }
    for (const auto& [key, value] : overrides) {
        auto result = ApplyConfigValue(key, value, config);
        if (result.IsError()) {
            return Result<ProxyConfig>::Error(result.GetError());
        }
    }
    return Result<ProxyConfig>::Ok(std::move(config));
}

Result<void> ValidateConfig(const ProxyConfig& config) {
    size_t enabled = 0;
    for (const auto& pool : config.pools) {
        if (pool.port == 0) {
            return Result<void>::Error("Pool " + pool.name + " has port 0");
        }
        if (pool.enabled) enabled++;
    }
    if (enabled == 0) {
        return Result<void>::Error("At least one enabled pool is required (pool=NAME,HOST,PORT)");
    }

    if (config.port == 0) {
        return Result<void>::Error("Proxy port must be non-zero");
    }
    if (config.stats_enabled && config.stats_port == 0) {
        return Result<void>::Error("Stats port must be non-zero");
    }

    if (config.fee_enabled) {
        if (!std::isfinite(config.fee_percent) || config.fee_percent <= 0.0 || config.fee_percent > 100.0) {
            return Result<void>::Error("Fee percent must be in (0, 100]");
        }
        if (config.fee_wallet.empty()) {
            return Result<void>::Error("Fee wallet is required when fees are enabled");
        }
    }

    if (config.stats_interval == 0 || config.health_interval == 0 || config.health_timeout == 0) {
        return Result<void>::Error("Intervals and timeouts must be non-zero");
    }

    return Result<void>::Ok();
}

} // namespace minerproxy
