/**
 * @file reconciliation_engine.cpp
 * @brief Implementation of the reconciliation cycle
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/reconciliation_engine.hpp"
#include "tokenrouter/utilities.hpp"
#include <set>
#include <sstream>
#include <utility>

namespace tokenrouter {

using namespace tokenrouter::utilities;

namespace {

// Clears the in-progress flag however the cycle exits
class CycleGuard {
public:
    explicit CycleGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~CycleGuard() { flag_ = false; }

    CycleGuard(const CycleGuard&) = delete;
    CycleGuard& operator=(const CycleGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

template <typename T>
std::string join(const std::vector<T>& items) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << ",";
        oss << items[i];
    }
    return oss.str();
}

} // namespace

const char* cycle_outcome_name(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::UNCHANGED: return "unchanged";
        case CycleOutcome::UPDATED: return "updated";
        case CycleOutcome::DISCOVERY_FAILED: return "discovery_failed";
        case CycleOutcome::SKIPPED: return "skipped";
        case CycleOutcome::FAILED: return "failed";
    }
    return "unknown";
}

const char* cycle_stage_name(CycleStage stage) {
    switch (stage) {
        case CycleStage::NONE: return "none";
        case CycleStage::LOAD: return "load";
        case CycleStage::DISCOVER: return "discover";
        case CycleStage::ALLOCATE: return "allocate";
        case CycleStage::PERSIST: return "persist";
        case CycleStage::PUBLISH: return "publish";
    }
    return "unknown";
}

// ============================================================================
// Constructor
// ============================================================================

ReconciliationEngine::ReconciliationEngine(
    const RouterConfig& config,
    PortDiscovery& discovery,
    RouteStore& store,
    TokenAllocator& allocator,
    GatewayPublisher& publisher,
    UnixClock clock
)
    : config_(config)
    , discovery_(discovery)
    , store_(store)
    , allocator_(allocator)
    , publisher_(publisher)
    , clock_(clock ? std::move(clock) : UnixClock(&current_unix_time))
{
}

// ============================================================================
// Reconciliation
// ============================================================================

CycleReport ReconciliationEngine::reconcile() {
    CycleReport report;

    if (in_progress_.exchange(true)) {
        report.outcome = CycleOutcome::SKIPPED;
        log_warn("ReconciliationEngine: Previous cycle still running, skipping");
        return report;
    }
    CycleGuard guard(in_progress_);

    CycleStage stage = CycleStage::LOAD;
    try {
        run_cycle(report, stage);
    } catch (const std::exception& e) {
        report.outcome = CycleOutcome::FAILED;
        report.failed_stage = stage;
        report.error = e.what();
    }

    cycle_count_++;
    log_report(report);
    return report;
}

void ReconciliationEngine::run_cycle(CycleReport& report, CycleStage& stage) {
    stage = CycleStage::LOAD;
    RouteTable table = store_.load();

    stage = CycleStage::DISCOVER;
    DiscoveryResult discovery = discovery_.discover_ports();
    report.discovery_status = discovery.status;

    if (!discovery.ok()) {
        report.failed_stage = CycleStage::DISCOVER;
        report.error = discovery.error;

        if (config_.discovery_failure_policy == DiscoveryFailurePolicy::PRESERVE) {
            report.outcome = CycleOutcome::DISCOVERY_FAILED;
            report.route_count = table.size();
            return;
        }
        // PRUNE: a failed query counts as "nothing is listening"
        discovery.ports.clear();
    }

    const std::set<uint16_t> active_ports(discovery.ports.begin(), discovery.ports.end());
    const std::set<uint16_t> existing_ports = RouteTableHelpers::ports_of(table);

    stage = CycleStage::ALLOCATE;
    std::set<std::string> tokens = RouteTableHelpers::tokens_of(table);
    const uint64_t now = clock_();

    for (uint16_t port : active_ports) {
        if (existing_ports.count(port) > 0) {
            continue;
        }

        Route route;
        route.token = allocator_.allocate(config_.token_length, tokens);
        route.port = port;
        route.created_at = now;

        tokens.insert(route.token);
        table.emplace(route.token, route);
        report.added_ports.push_back(port);
    }

    // One route per port: on duplicates (hand-edited state) the first token wins
    std::set<uint16_t> routed_ports;
    for (auto it = table.begin(); it != table.end();) {
        if (active_ports.count(it->second.port) == 0 ||
            !routed_ports.insert(it->second.port).second) {
            report.removed_tokens.push_back(it->first);
            it = table.erase(it);
        } else {
            ++it;
        }
    }

    report.route_count = table.size();

    if (!report.changed() && !publish_pending_) {
        report.outcome = CycleOutcome::UNCHANGED;
        return;
    }

    if (report.changed()) {
        stage = CycleStage::PERSIST;
        if (!store_.save(table)) {
            report.outcome = CycleOutcome::FAILED;
            report.failed_stage = CycleStage::PERSIST;
            report.error = "failed to persist route table to " + store_.get_state_file();
            // Nothing published: the next cycle re-derives the same diff
            return;
        }
        report.persisted = true;
    }

    stage = CycleStage::PUBLISH;
    PublishResult published = publisher_.publish(table);
    report.map_written = published.map_written;
    report.reload_ok = published.reload_ok;

    if (!published.map_written) {
        // State moved on without the gateway; owe it a rewrite next cycle
        publish_pending_ = true;
        report.outcome = CycleOutcome::FAILED;
        report.failed_stage = CycleStage::PUBLISH;
        report.error = published.error;
        return;
    }

    publish_pending_ = false;
    report.outcome = CycleOutcome::UPDATED;
    if (!published.reload_ok && report.failed_stage == CycleStage::NONE) {
        // Best-effort reload: recorded, not fatal
        report.error = published.error;
    }
}

void ReconciliationEngine::request_publish() {
    publish_pending_ = true;
}

bool ReconciliationEngine::is_publish_pending() const {
    return publish_pending_.load();
}

uint64_t ReconciliationEngine::get_cycle_count() const {
    return cycle_count_.load();
}

// ============================================================================
// Logging
// ============================================================================

void ReconciliationEngine::log_report(const CycleReport& report) const {
    std::string summary = "Reconcile " + std::string(cycle_outcome_name(report.outcome)) +
        ": " + std::to_string(report.route_count) + " route(s)";

    if (!report.added_ports.empty()) {
        summary += ", added ports [" + join(report.added_ports) + "]";
    }
    if (!report.removed_tokens.empty()) {
        summary += ", removed " + std::to_string(report.removed_tokens.size()) + " stale route(s)";
    }

    switch (report.outcome) {
        case CycleOutcome::UNCHANGED:
            if (report.failed_stage == CycleStage::DISCOVER) {
                log_warn(summary + " (discovery " + discovery_status_name(report.discovery_status) +
                         ": " + report.error + ")");
            } else {
                log_debug(summary);
            }
            break;
        case CycleOutcome::UPDATED:
            if (report.failed_stage == CycleStage::DISCOVER) {
                log_warn(summary + " (discovery " + discovery_status_name(report.discovery_status) +
                         ", policy prune: " + report.error + ")");
            } else if (!report.reload_ok) {
                log_warn(summary + " (gateway reload failed: " + report.error + ")");
            } else {
                log_info(summary);
            }
            break;
        case CycleOutcome::DISCOVERY_FAILED:
            log_warn(summary + " preserved (discovery " +
                     discovery_status_name(report.discovery_status) + ": " + report.error + ")");
            break;
        case CycleOutcome::SKIPPED:
            break;
        case CycleOutcome::FAILED:
            log_error("Reconcile failed at stage " + std::string(cycle_stage_name(report.failed_stage)) +
                      ": " + report.error);
            break;
    }
}

} // namespace tokenrouter
