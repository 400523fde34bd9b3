/**
 * @file port_discovery.hpp
 * @brief Listening TCP port discovery inside the monitored container
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Reads the kernel TCP listener tables (/proc/net/tcp and /proc/net/tcp6)
 * through the container runtime:
 * - Parse LISTEN rows from the tabular output
 * - De-duplicate IPv4/IPv6 listeners on the same port
 * - Filter by configured range and exclusion set
 */

#pragma once

#include "tokenrouter/command_runner.hpp"
#include "tokenrouter/router_config.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tokenrouter {

/// Connection-state code of a listening socket in /proc/net/tcp
constexpr const char* TCP_STATE_LISTEN = "0A";

/// Leading column label of the listener table header row
constexpr const char* TCP_TABLE_HEADER_LABEL = "sl";

/**
 * @brief How a discovery attempt ended
 */
enum class DiscoveryStatus {
    OK,
    COMMAND_FAILED,     ///< Runtime unreachable, non-zero exit, or spawn failure
    TIMED_OUT           ///< Command exceeded the configured timeout
};

/**
 * @brief Result of one discovery attempt
 */
struct DiscoveryResult {
    DiscoveryStatus status = DiscoveryStatus::OK;
    std::vector<uint16_t> ports;    ///< Ascending; empty on failure
    std::string error;              ///< Human-readable failure detail

    bool ok() const { return status == DiscoveryStatus::OK; }
};

/**
 * @brief PortDiscovery - queries the monitored target for listening ports
 *
 * Read-only with respect to routing state. Never throws: failures are
 * reported through DiscoveryResult::status.
 */
class PortDiscovery {
public:
    /**
     * @brief Construct PortDiscovery
     * @param config Router configuration (target, runtime, range, exclusions)
     * @param runner Command execution capability
     */
    PortDiscovery(const RouterConfig& config, CommandRunner& runner);

    PortDiscovery(const PortDiscovery&) = delete;
    PortDiscovery& operator=(const PortDiscovery&) = delete;

    /**
     * @brief Discover currently listening, routable ports
     * @return Sorted port list, or a failure status with empty ports
     */
    DiscoveryResult discover_ports();

    /**
     * @brief Command used to dump the listener tables
     */
    std::vector<std::string> discovery_command() const;

    /**
     * @brief Parse listener table text into the set of LISTEN ports
     *
     * Header rows, blank lines, rows with fewer than 4 fields, non-LISTEN
     * rows and non-hex ports are skipped.
     *
     * @param output Concatenated /proc/net/tcp and /proc/net/tcp6 text
     * @return All listening ports (unfiltered)
     */
    static std::set<uint16_t> parse_listener_table(const std::string& output);

    /**
     * @brief Apply range and exclusion filters
     * @return Routable ports in ascending order
     */
    static std::vector<uint16_t> filter_ports(
        const std::set<uint16_t>& ports,
        const RouterConfig& config
    );

private:
    const RouterConfig& config_;
    CommandRunner& runner_;
};

/**
 * @brief Status name for logging
 */
const char* discovery_status_name(DiscoveryStatus status);

} // namespace tokenrouter
