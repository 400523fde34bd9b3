/**
 * @file reconciliation_engine.hpp
 * @brief One discover -> diff -> mutate -> publish pass over the route table
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The engine is the only writer of the route table and the map artifact.
 * Each cycle:
 * 1. Loads the table from the route store
 * 2. Discovers the active port set P
 * 3. Allocates a token for every port in P without a route
 * 4. Removes every route whose port is not in P
 * 5. If anything changed: persists, renders the map, reloads the gateway
 *
 * A cycle never throws; its outcome is returned as a CycleReport and
 * logged at the engine boundary.
 */

#pragma once

#include "tokenrouter/gateway_publisher.hpp"
#include "tokenrouter/port_discovery.hpp"
#include "tokenrouter/route_store.hpp"
#include "tokenrouter/router_config.hpp"
#include "tokenrouter/token_allocator.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace tokenrouter {

/**
 * @brief Overall result of a cycle
 */
enum class CycleOutcome {
    UNCHANGED,          ///< Table already matched discovery; no writes
    UPDATED,            ///< Table changed and was persisted and published
    DISCOVERY_FAILED,   ///< Discovery failed under the PRESERVE policy; nothing touched
    SKIPPED,            ///< Another cycle was already running
    FAILED              ///< A stage failed; see failed_stage
};

/**
 * @brief Stage at which a cycle failed (or NONE)
 */
enum class CycleStage {
    NONE,
    LOAD,
    DISCOVER,
    ALLOCATE,
    PERSIST,
    PUBLISH
};

/**
 * @brief Structured record of one reconciliation cycle
 */
struct CycleReport {
    CycleOutcome outcome = CycleOutcome::UNCHANGED;
    CycleStage failed_stage = CycleStage::NONE;
    std::string error;

    DiscoveryStatus discovery_status = DiscoveryStatus::OK;
    std::vector<uint16_t> added_ports;          ///< Ports that received a new route
    std::vector<std::string> removed_tokens;    ///< Tokens of stale routes
    size_t route_count = 0;                     ///< Table size at end of cycle

    bool persisted = false;
    bool map_written = false;
    bool reload_ok = false;

    bool changed() const { return !added_ports.empty() || !removed_tokens.empty(); }
};

/**
 * @brief Wall-clock source in Unix seconds
 */
using UnixClock = std::function<uint64_t()>;

/**
 * @brief ReconciliationEngine - keeps route table and gateway in sync
 *
 * Not re-entrant: a reconcile() call that overlaps another returns SKIPPED
 * immediately instead of running concurrently.
 */
class ReconciliationEngine {
public:
    /**
     * @brief Construct ReconciliationEngine
     * @param config Router configuration
     * @param discovery Port discovery (read-only source)
     * @param store Durable route store
     * @param allocator Token allocator
     * @param publisher Gateway publisher
     * @param clock Time source for createdAt (default: system clock)
     */
    ReconciliationEngine(
        const RouterConfig& config,
        PortDiscovery& discovery,
        RouteStore& store,
        TokenAllocator& allocator,
        GatewayPublisher& publisher,
        UnixClock clock = UnixClock()
    );

    // Disable copy and move
    ReconciliationEngine(const ReconciliationEngine&) = delete;
    ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;

    /**
     * @brief Run one reconciliation cycle
     * @return Report describing what happened
     */
    CycleReport reconcile();

    /**
     * @brief Force the next cycle to publish even if the table is unchanged
     *
     * Used at startup so the gateway map matches persisted state after a
     * restart, and internally after a map write failure.
     */
    void request_publish();

    /**
     * @brief Whether a publish is owed to the gateway
     */
    bool is_publish_pending() const;

    /**
     * @brief Get number of completed (non-skipped) cycles
     */
    uint64_t get_cycle_count() const;

private:
    /**
     * @brief Cycle body; may throw, reconcile() catches
     */
    void run_cycle(CycleReport& report, CycleStage& stage);

    /**
     * @brief Log a finished report at the level its outcome deserves
     */
    void log_report(const CycleReport& report) const;

    const RouterConfig& config_;
    PortDiscovery& discovery_;
    RouteStore& store_;
    TokenAllocator& allocator_;
    GatewayPublisher& publisher_;
    UnixClock clock_;

    /// Guards against overlapping cycles
    std::atomic<bool> in_progress_{false};

    /// Map artifact owes the gateway a rewrite
    std::atomic<bool> publish_pending_{false};

    std::atomic<uint64_t> cycle_count_{0};
};

/**
 * @brief Outcome name for logging
 */
const char* cycle_outcome_name(CycleOutcome outcome);

/**
 * @brief Stage name for logging
 */
const char* cycle_stage_name(CycleStage stage);

} // namespace tokenrouter
