/**
 * @file gateway_publisher.hpp
 * @brief Renders the gateway map artifact and triggers gateway reloads
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include "tokenrouter/command_runner.hpp"
#include "tokenrouter/route_types.hpp"
#include "tokenrouter/router_config.hpp"
#include <string>
#include <vector>

namespace tokenrouter {

/// First line of every map artifact
constexpr const char* MAP_HEADER_LINE = "# token -> port mapping (auto generated)";

/**
 * @brief Outcome of one publish
 */
struct PublishResult {
    bool map_written = false;   ///< Map artifact replaced on disk
    bool reload_ok = false;     ///< Gateway acknowledged the reload
    std::string error;          ///< Detail for whichever step failed
};

/**
 * @brief GatewayPublisher - map artifact writer and reload trigger
 *
 * Reload is best-effort: a failed reload leaves the gateway serving the
 * previous map until the next successful publish, and the freshly written
 * artifact is not rolled back.
 */
class GatewayPublisher {
public:
    /**
     * @brief Construct GatewayPublisher
     * @param config Router configuration (map path, gateway, runtime)
     * @param runner Command execution capability
     */
    GatewayPublisher(const RouterConfig& config, CommandRunner& runner);

    GatewayPublisher(const GatewayPublisher&) = delete;
    GatewayPublisher& operator=(const GatewayPublisher&) = delete;

    /**
     * @brief Write the map artifact and signal the gateway
     *
     * The reload is skipped when the artifact could not be written.
     */
    PublishResult publish(const RouteTable& table);

    /**
     * @brief Render the map artifact
     *
     * Header line, then "<token> <port>;" per route in token order; routes
     * without an assigned port are skipped. Always newline-terminated.
     */
    static std::string render_map(const RouteTable& table);

    /**
     * @brief Command used to reload the gateway
     */
    std::vector<std::string> reload_command() const;

private:
    const RouterConfig& config_;
    CommandRunner& runner_;
};

} // namespace tokenrouter
