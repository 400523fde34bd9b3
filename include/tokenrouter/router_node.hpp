/**
 * @file router_node.hpp
 * @brief Main TokenRouter orchestrator - wires all components together
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * RouterNode coordinates:
 * - Periodic reconciliation on a dedicated ASIO context and thread
 * - The read API on a separate ASIO context and worker pool, so a hung
 *   discovery command never blocks readers
 * - Graceful start/stop
 */

#pragma once

#include "tokenrouter/command_runner.hpp"
#include "tokenrouter/gateway_publisher.hpp"
#include "tokenrouter/port_discovery.hpp"
#include "tokenrouter/reconciliation_engine.hpp"
#include "tokenrouter/route_api_server.hpp"
#include "tokenrouter/route_store.hpp"
#include "tokenrouter/router_config.hpp"
#include "tokenrouter/token_allocator.hpp"

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace tokenrouter {

/// Threads serving the read API
constexpr size_t API_WORKER_THREADS = 2;

/**
 * @brief RouterNode - the TokenRouter daemon
 */
class RouterNode {
public:
    /**
     * @brief Construct router node
     * @param config Immutable configuration (copied and owned)
     * @param runner Command runner (default: ProcessCommandRunner)
     */
    explicit RouterNode(
        RouterConfig config,
        std::unique_ptr<CommandRunner> runner = nullptr
    );

    /**
     * @brief Destructor - graceful shutdown
     */
    ~RouterNode();

    // Disable copy and move
    RouterNode(const RouterNode&) = delete;
    RouterNode& operator=(const RouterNode&) = delete;
    RouterNode(RouterNode&&) = delete;
    RouterNode& operator=(RouterNode&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Start the read API and the reconciliation timer
     *
     * The first cycle runs immediately and republishes the map so the
     * gateway matches persisted state after a restart.
     *
     * @return true if started successfully, false otherwise
     */
    bool start();

    /**
     * @brief Stop timer and API, join all threads
     */
    void stop();

    /**
     * @brief Check if node is running
     */
    bool is_running() const;

    // ========================================================================
    // Operations
    // ========================================================================

    /**
     * @brief Run one reconciliation cycle synchronously
     *
     * Safe to call whether or not the timer is running; overlapping with a
     * timer-driven cycle yields a SKIPPED report.
     */
    CycleReport run_cycle_now();

    /**
     * @brief Port the read API is bound to (0 if not started)
     */
    uint16_t get_api_port() const;

    /**
     * @brief Configuration in effect
     */
    const RouterConfig& get_config() const { return config_; }

    /**
     * @brief Number of completed reconciliation cycles
     */
    uint64_t get_cycle_count() const;

private:
    /**
     * @brief Arm the timer to fire at the given time point
     */
    void schedule_cycle(std::chrono::steady_clock::time_point when);

    /**
     * @brief Timer handler: run a cycle then re-arm
     */
    void on_tick(const asio::error_code& error);

    /**
     * @brief Log effective configuration at startup
     */
    void log_configuration() const;

    const RouterConfig config_;

    std::unique_ptr<CommandRunner> runner_;
    RouteStore store_;
    TokenAllocator allocator_;
    PortDiscovery discovery_;
    GatewayPublisher publisher_;
    ReconciliationEngine engine_;

    /// Reconciliation runs alone on this context (one thread)
    asio::io_context reconcile_context_;
    asio::steady_timer timer_;
    std::chrono::steady_clock::time_point cycle_started_;

    /// Read API runs on this context (worker pool); recreated per start()
    std::unique_ptr<asio::io_context> api_context_;
    std::unique_ptr<RouteApiServer> api_server_;

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> reconcile_guard_;
    std::unique_ptr<WorkGuard> api_guard_;

    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

} // namespace tokenrouter
