/**
 * @file router_daemon.cpp
 * @brief tokenrouterd - TokenRouter daemon entry point
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Configuration comes entirely from the environment (see router_config.hpp).
 * Runs until SIGINT/SIGTERM, or a single cycle with --once.
 */

#include "tokenrouter/router_node.hpp"
#include "tokenrouter/route_crypto.hpp"
#include "tokenrouter/utilities.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace tokenrouter;
using namespace tokenrouter::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int) {
    g_shutdown = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--once]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --once      Run a single reconciliation cycle and exit\n";
    std::cout << "  --help      Show this message\n\n";
    std::cout << "Environment:\n";
    std::cout << "  TARGET_CONTAINER, GATEWAY_CONTAINER, ROUTER_CONTAINER_RUNTIME\n";
    std::cout << "  ROUTER_STATE_FILE, ROUTER_MAP_FILE\n";
    std::cout << "  ROUTER_SCAN_INTERVAL, ROUTER_COMMAND_TIMEOUT, ROUTER_TOKEN_LENGTH\n";
    std::cout << "  ROUTER_PORT_RANGE, ROUTER_EXCLUDE_PORTS, ROUTER_DISCOVERY_FAILURE\n";
    std::cout << "  PUBLIC_BASE_URL, ROUTER_USERNAME, ROUTER_PASSWORD\n";
    std::cout << "  ROUTER_LISTEN_ADDRESS, ROUTER_LISTEN_PORT\n";
    std::cout << "  ROUTER_LOG_LEVEL, ROUTER_LOG_FILE\n";
}

int main(int argc, char* argv[]) {
    bool once = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--once") {
            once = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    RouterConfig config = RouterConfig::from_environment();
    initialize_logging(config.log_file, parse_log_level(config.log_level).value_or(LogLevel::INFO));

    try {
        if (once) {
            if (!RouteCrypto::initialize()) {
                log_critical("Failed to initialize libsodium");
                return 1;
            }
            RouterNode node(config);
            CycleReport report = node.run_cycle_now();
            return report.outcome == CycleOutcome::FAILED ? 1 : 0;
        }

        RouterNode node(config);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (!node.start()) {
            log_critical("Failed to start tokenrouterd");
            return 1;
        }

        while (!g_shutdown && node.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        node.stop();

    } catch (const std::exception& e) {
        log_critical(std::string("Fatal error: ") + e.what());
        return 1;
    }

    return 0;
}
