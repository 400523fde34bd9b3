/**
 * @file router_node.cpp
 * @brief Implementation of the TokenRouter orchestrator
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Integrates discovery, persistence, publishing and the read API
 */

#include "tokenrouter/router_node.hpp"
#include "tokenrouter/route_crypto.hpp"
#include "tokenrouter/utilities.hpp"

#include <sstream>

namespace tokenrouter {

using namespace tokenrouter::utilities;

// ============================================================================
// Constructor and Destructor
// ============================================================================

RouterNode::RouterNode(RouterConfig config, std::unique_ptr<CommandRunner> runner)
    : config_(std::move(config))
    , runner_(runner ? std::move(runner) : std::make_unique<ProcessCommandRunner>())
    , store_(config_.state_file)
    , discovery_(config_, *runner_)
    , publisher_(config_, *runner_)
    , engine_(config_, discovery_, store_, allocator_, publisher_)
    , timer_(reconcile_context_)
{
}

RouterNode::~RouterNode() {
    if (running_) {
        log_warn("RouterNode: Destructor called while still running, forcing stop");
        stop();
    }
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool RouterNode::start() {
    if (running_) {
        log_warn("RouterNode: Already running");
        return false;
    }

    log_info("RouterNode: Starting...");
    log_configuration();

    if (!RouteCrypto::initialize()) {
        log_critical("RouterNode: Failed to initialize libsodium");
        return false;
    }

    try {
        api_context_ = std::make_unique<asio::io_context>();
        api_server_ = std::make_unique<RouteApiServer>(config_, store_, *api_context_);
        if (!api_server_->start()) {
            log_error("RouterNode: Failed to start read API");
            api_server_.reset();
            api_context_.reset();
            return false;
        }

        reconcile_context_.restart();
        reconcile_guard_ = std::make_unique<WorkGuard>(reconcile_context_.get_executor());
        api_guard_ = std::make_unique<WorkGuard>(api_context_->get_executor());

        running_ = true;

        // Bring the gateway in line with persisted state on the first cycle
        engine_.request_publish();
        schedule_cycle(std::chrono::steady_clock::now());

        // Exactly one reconcile thread: cycles are serialized by construction
        threads_.emplace_back([this]() {
            try {
                reconcile_context_.run();
            } catch (const std::exception& e) {
                log_error("RouterNode: Reconcile thread exception: " + std::string(e.what()));
            }
        });

        for (size_t i = 0; i < API_WORKER_THREADS; ++i) {
            threads_.emplace_back([this]() {
                try {
                    api_context_->run();
                } catch (const std::exception& e) {
                    log_error("RouterNode: API worker thread exception: " + std::string(e.what()));
                }
            });
        }

        log_info("RouterNode: Started (scan interval " +
                 std::to_string(config_.scan_interval.count()) + "s)");
        return true;

    } catch (const std::exception& e) {
        log_error("RouterNode: Exception during start: " + std::string(e.what()));
        running_ = false;
        stop();
        return false;
    }
}

void RouterNode::stop() {
    bool was_running = running_.exchange(false);

    if (was_running) {
        log_info("RouterNode: Stopping...");
    }

    // A cycle in progress finishes before the reconcile thread exits
    reconcile_guard_.reset();
    api_guard_.reset();
    reconcile_context_.stop();
    if (api_context_) {
        api_context_->stop();
    }

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    asio::error_code ignored;
    timer_.cancel(ignored);

    if (api_server_) {
        api_server_->stop();
        api_server_.reset();
    }
    // Drops handlers still queued for the old server without running them
    api_context_.reset();

    if (was_running) {
        log_info("RouterNode: Stopped after " + std::to_string(engine_.get_cycle_count()) + " cycle(s)");
    }
}

bool RouterNode::is_running() const {
    return running_;
}

// ============================================================================
// Operations
// ============================================================================

CycleReport RouterNode::run_cycle_now() {
    return engine_.reconcile();
}

uint16_t RouterNode::get_api_port() const {
    return api_server_ ? api_server_->get_port() : 0;
}

uint64_t RouterNode::get_cycle_count() const {
    return engine_.get_cycle_count();
}

// ============================================================================
// Scheduling
// ============================================================================

void RouterNode::schedule_cycle(std::chrono::steady_clock::time_point when) {
    timer_.expires_at(when);
    timer_.async_wait([this](const asio::error_code& error) {
        on_tick(error);
    });
}

void RouterNode::on_tick(const asio::error_code& error) {
    if (error == asio::error::operation_aborted || !running_) {
        return;
    }

    cycle_started_ = std::chrono::steady_clock::now();
    engine_.reconcile();

    if (!running_) {
        return;
    }

    // Anchored at cycle start; an overrun fires once immediately, missed
    // ticks are dropped rather than queued
    schedule_cycle(cycle_started_ + config_.scan_interval);
}

void RouterNode::log_configuration() const {
    std::ostringstream excluded;
    for (uint16_t port : config_.exclude_ports) {
        if (excluded.tellp() > 0) excluded << ",";
        excluded << port;
    }

    log_info("RouterNode: target=" + config_.target_container +
             " gateway=" + config_.gateway_container +
             " runtime=" + config_.container_runtime);
    log_info("RouterNode: state=" + config_.state_file + " map=" + config_.map_file);
    log_info("RouterNode: ports=" + std::to_string(config_.port_range_start) + "-" +
             std::to_string(config_.port_range_end) +
             " exclude=[" + excluded.str() + "]" +
             " token_length=" + std::to_string(config_.token_length) +
             " on_discovery_failure=" + discovery_failure_policy_name(config_.discovery_failure_policy));
}

} // namespace tokenrouter
