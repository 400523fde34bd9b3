/**
 * @file router_config.hpp
 * @brief Immutable runtime configuration for TokenRouter
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace tokenrouter {

// ============================================================================
// Defaults
// ============================================================================

/// Container whose listener table is scanned
constexpr const char* DEFAULT_TARGET_CONTAINER = "opencode-backend";

/// Container running the gateway that consumes the map artifact
constexpr const char* DEFAULT_GATEWAY_CONTAINER = "opencode-gateway";

/// Gateway map artifact location
constexpr const char* DEFAULT_MAP_FILE = "/token_map/token_map.conf";

/// Durable route table location
constexpr const char* DEFAULT_STATE_FILE = "/data/routes.json";

/// Container runtime binary used for exec calls
constexpr const char* DEFAULT_CONTAINER_RUNTIME = "docker";

/// Seconds between reconciliation cycles
constexpr int DEFAULT_SCAN_INTERVAL_SECONDS = 5;

/// Public token length
constexpr int DEFAULT_TOKEN_LENGTH = 12;

/// Inclusive discovery port range
constexpr uint16_t DEFAULT_PORT_RANGE_START = 3000;
constexpr uint16_t DEFAULT_PORT_RANGE_END = 9999;

/// Ports never routed (the backend's own control port)
constexpr const char* DEFAULT_EXCLUDE_PORTS = "4096";

/// Read API listener
constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr uint16_t DEFAULT_LISTEN_PORT = 7070;

/// Upper bound for a single external command
constexpr int DEFAULT_COMMAND_TIMEOUT_SECONDS = 10;

/// Path template segment prepended to the token in public URLs
constexpr const char* PUBLIC_PATH_PREFIX = "/p/";

/**
 * @brief What a reconciliation cycle does when discovery itself fails
 */
enum class DiscoveryFailurePolicy {
    PRUNE,      ///< Treat as "no ports listening" and drop every route
    PRESERVE    ///< Leave table and artifacts untouched until discovery recovers
};

/**
 * @brief Lookup function for configuration values (environment by default)
 */
using ConfigLookup = std::function<std::optional<std::string>(const std::string& name)>;

/**
 * @brief RouterConfig - immutable configuration value
 *
 * Built once at startup and handed by const reference to every component.
 * Malformed values never fail startup: each falls back to its default.
 */
struct RouterConfig {
    std::string target_container = DEFAULT_TARGET_CONTAINER;
    std::string gateway_container = DEFAULT_GATEWAY_CONTAINER;
    std::string container_runtime = DEFAULT_CONTAINER_RUNTIME;
    std::string map_file = DEFAULT_MAP_FILE;
    std::string state_file = DEFAULT_STATE_FILE;
    std::chrono::seconds scan_interval{DEFAULT_SCAN_INTERVAL_SECONDS};
    std::chrono::seconds command_timeout{DEFAULT_COMMAND_TIMEOUT_SECONDS};
    size_t token_length = DEFAULT_TOKEN_LENGTH;
    uint16_t port_range_start = DEFAULT_PORT_RANGE_START;
    uint16_t port_range_end = DEFAULT_PORT_RANGE_END;
    std::set<uint16_t> exclude_ports{4096};
    std::string public_base_url;
    std::string username;
    std::string password;
    std::string listen_address = DEFAULT_LISTEN_ADDRESS;
    uint16_t listen_port = DEFAULT_LISTEN_PORT;
    DiscoveryFailurePolicy discovery_failure_policy = DiscoveryFailurePolicy::PRUNE;
    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief Build configuration from the process environment
     */
    static RouterConfig from_environment();

    /**
     * @brief Build configuration from an arbitrary lookup function
     * @param lookup Returns the raw value for a variable name, or nullopt
     */
    static RouterConfig from_lookup(const ConfigLookup& lookup);

    /**
     * @brief Whether the read API requires Basic credentials
     */
    bool auth_enabled() const { return !password.empty(); }

    /**
     * @brief Check whether a port is eligible for routing
     * @return true if in the inclusive range and not excluded
     */
    bool is_routable_port(uint16_t port) const;

    /**
     * @brief Public URL for a token ("" when no base URL is configured)
     */
    std::string public_url_for(const std::string& token) const;
};

// ============================================================================
// Parsers (exposed for testing)
// ============================================================================

/**
 * @brief Parse an integer value, falling back on junk
 * @param value Raw value (may be unset)
 * @param default_value Fallback
 * @return Parsed integer or default_value
 */
int parse_int_or(const std::optional<std::string>& value, int default_value);

/**
 * @brief Parse "START-END" into an inclusive range
 *
 * Reversed bounds are swapped. Anything not matching ^\d+-\d+$, or a bound
 * above 65535, yields the default 3000-9999.
 */
std::pair<uint16_t, uint16_t> parse_port_range(const std::string& value);

/**
 * @brief Parse a comma-separated port list, skipping junk items
 */
std::set<uint16_t> parse_exclude_ports(const std::string& value);

/**
 * @brief Parse "prune" / "preserve" (case-insensitive), default PRUNE
 */
DiscoveryFailurePolicy parse_discovery_failure_policy(const std::string& value);

/**
 * @brief Policy name as used in configuration
 */
const char* discovery_failure_policy_name(DiscoveryFailurePolicy policy);

} // namespace tokenrouter
