/*
 * Copyright (c) 2025 INTcoin Team (Neil Adamson)
 * MIT License
 * Stratum Mining Proxy Server
 */

#include "minerproxy/config.h"
#include "minerproxy/pool.h"
#include "minerproxy/proxy.h"
#include "minerproxy/stats.h"
#include "minerproxy/util.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace minerproxy;

static std::atomic<bool> g_shutdown_requested{false};
static std::atomic<bool> g_reload_requested{false};

// Signal handler
void signal_handler(int signum) {
    if (signum == SIGHUP) {
        g_reload_requested = true;
    } else {
        g_shutdown_requested = true;
    }
}

void print_banner() {
    std::cout << "========================================\n";
    std::cout << "minerproxy Stratum Mining Proxy v" << MINERPROXY_VERSION_MAJOR << "."
              << MINERPROXY_VERSION_MINOR << "." << MINERPROXY_VERSION_PATCH << "\n";
    std::cout << "Stratum V1 / Aleo Stratum with TLS upstreams\n";
    std::cout << "========================================\n\n";
}

void print_usage() {
    std::cout << "Usage: minerproxy-server [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                     Show this help message\n";
    std::cout << "  -v, --version                  Show version information\n";
    std::cout << "  -c, --config=<file>            Configuration file path\n";
    std::cout << "\n";
    std::cout << "Proxy:\n";
    std::cout << "  --host=<host>                  Bind address (default: 0.0.0.0)\n";
    std::cout << "  --port=<port>                  Stratum port (default: 3333)\n";
    std::cout << "  --max-connections=<n>          Session cap, 0 = unlimited (default: 1000)\n";
    std::cout << "  --user-agent=<agent>           Subscribe agent used on reconnect (default: minerproxy/1.0)\n";
    std::cout << "\n";
    std::cout << "Pools:\n";
    std::cout << "  --pool=NAME,HOST,PORT[,WEIGHT[,PROTOCOL[,COIN[,tls][,disabled]]]]\n";
    std::cout << "                                 Upstream pool (repeatable)\n";
    std::cout << "  --reconnect-delay=<sec>        Upstream reconnect delay (default: 5)\n";
    std::cout << "  --idle-timeout=<sec>           Miner idle timeout (default: 600)\n";
    std::cout << "  --health-interval=<sec>        Pool probe period (default: 30)\n";
    std::cout << "  --health-timeout=<sec>         Pool probe timeout (default: 10)\n";
    std::cout << "\n";
    std::cout << "Fee:\n";
    std::cout << "  --fee-enabled=<bool>           Redirect a share fraction (default: false)\n";
    std::cout << "  --fee-percent=<percent>        Redirected percentage, 0 < p <= 100\n";
    std::cout << "  --fee-wallet=<addr>            Fee payout address\n";
    std::cout << "  --worker-prefix=<name>         Worker name appended to the fee wallet\n";
    std::cout << "  --wallet=<addr>                Default payout address\n";
    std::cout << "\n";
    std::cout << "Stats API:\n";
    std::cout << "  --stats-enabled=<bool>         Serve the HTTP stats API (default: true)\n";
    std::cout << "  --stats-host=<host>            Stats bind address (default: 0.0.0.0)\n";
    std::cout << "  --stats-port=<port>            Stats port (default: 8080)\n";
    std::cout << "  --stats-interval=<sec>         History sample period (default: 10)\n";
    std::cout << "\n";
    std::cout << "Logging:\n";
    std::cout << "  --log-level=<level>            debug, info, warn, error (default: info)\n";
    std::cout << "  --log-file=<path>              Also append log lines to a file\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  minerproxy-server --pool=main,pool.example.com,3333 --pool=backup,backup.example.com,443,1,stratum,btc,tls\n";
    std::cout << "  minerproxy-server --config=minerproxy.conf\n";
    std::cout << "\n";
}

void reload_pools(const std::string& config_file, const ConfigOverrides& overrides,
                  PoolRegistry& registry) {
    if (config_file.empty()) {
        LogWarning("Config", "Reload requested but no config file was given");
        return;
    }

    // Command-line pools and settings still apply on top of the file
    auto fresh = LoadProxyConfig(config_file, overrides);
    Result<void> result = fresh.IsOk() ? ValidateConfig(fresh.GetValue())
                                       : Result<void>::Error(fresh.GetError());
    if (result.IsError()) {
        LogError("Config", "Reload failed, keeping current pools: " + result.GetError());
        return;
    }

    registry.Reload(fresh.GetValue().pools);
}

int main(int argc, char* argv[]) {
    std::string config_file;
    ConfigOverrides overrides;

    // Parse command-line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_banner();
            print_usage();
            return 0;
        }
        else if (arg == "-v" || arg == "--version") {
            std::cout << "minerproxy v" << MINERPROXY_VERSION << "\n";
            return 0;
        }
        else if (arg.find("-c=") == 0 || arg.find("--config=") == 0) {
            config_file = arg.substr(arg.find('=') + 1);
        }
        else if (arg.find("--") == 0 && arg.find('=') != std::string::npos) {
            size_t eq_pos = arg.find('=');
            overrides.emplace_back(arg.substr(2, eq_pos - 2), arg.substr(eq_pos + 1));
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use -h or --help for usage information.\n";
            return 1;
        }
    }

    // Config file first, then command-line overrides
    auto loaded = LoadProxyConfig(config_file, overrides);
    if (loaded.IsError()) {
        std::cerr << "Error: " << loaded.GetError() << "\n";
        std::cerr << "Use -h or --help for usage information.\n";
        return 1;
    }
    ProxyConfig config = loaded.GetValue();

    // Validate configuration
    auto valid = ValidateConfig(config);
    if (valid.IsError()) {
        std::cerr << "Error: " << valid.GetError() << "\n";
        std::cerr << "Use -h or --help for usage information.\n";
        return 1;
    }

    SetLogLevel(config.log_level);
    if (!config.log_file.empty()) {
        auto log_result = SetLogFile(config.log_file);
        if (log_result.IsError()) {
            std::cerr << "Error: " << log_result.GetError() << "\n";
            return 1;
        }
    }

    // Print banner
    print_banner();

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    PoolRegistry registry(config.pools);
    HashrateAggregator hashrate;
    TcpUpstreamDialer dialer;
    auto sessions = std::make_unique<SessionManager>(registry, dialer, hashrate,
                                                     config.GetFeeConfig(),
                                                     config.GetSessionConfig());
    sessions->AddObserver(std::make_shared<LoggingObserver>());

    LogInfo("Config", "Upstream pools:");
    for (const auto& pool : config.pools) {
        LogInfo("Config", "  " + pool.name + " " + pool.Endpoint() +
                " weight=" + std::to_string(pool.weight) +
                " protocol=" + ToString(pool.protocol) +
                " coin=" + ToString(pool.coin) +
                (pool.tls ? " tls" : "") +
                (pool.enabled ? "" : " (disabled)"));
    }
    if (config.fee_enabled) {
        LogInfo("Config", "Fee injection: " + std::to_string(config.fee_percent) + "% to " +
                sessions->GetFeeInjector().GetFeeWorker() + " (every " +
                std::to_string(sessions->GetFeeInjector().GetInterval()) + " submits)");
    }

    PoolHealthMonitor health(config.pools, config.GetHealthConfig());
    auto health_result = health.Start();
    if (health_result.IsError()) {
        LogError("Health", health_result.GetError());
        return 1;
    }

    ProxyServer proxy(config.GetListenerConfig(), *sessions);
    auto proxy_result = proxy.Start();
    if (proxy_result.IsError()) {
        LogError("Proxy", "Error starting proxy: " + proxy_result.GetError());
        health.Stop();
        return 1;
    }

    std::unique_ptr<HttpApiServer> stats;
    if (config.stats_enabled) {
        stats = std::make_unique<HttpApiServer>(config.GetStatsConfig(), *sessions, hashrate,
                                                registry, &health);
        auto stats_result = stats->Start();
        if (stats_result.IsError()) {
            LogError("Stats", "Error starting stats API: " + stats_result.GetError());
            proxy.Stop();
            health.Stop();
            dialer.Shutdown();
            return 1;
        }
    }

    LogInfo("Proxy", "Proxy started. Press Ctrl+C to stop.");

    // Keep running until signal received
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::seconds(1));

        if (g_reload_requested.exchange(false)) {
            LogInfo("Config", "Reloading pools from " + config_file);
            reload_pools(config_file, overrides, registry);
        }
    }

    LogInfo("Proxy", "Shutting down...");
    if (stats) {
        stats->Stop();
    }
    health.Stop();
    proxy.Stop();
    dialer.Shutdown();
    sessions.reset();

    LogInfo("Proxy", "Shutdown complete");
    return 0;
}
