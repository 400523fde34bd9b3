/**
 * @file router_config.cpp
 * @brief Implementation of configuration parsing with documented fallbacks
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/router_config.hpp"
#include "tokenrouter/utilities.hpp"
#include <algorithm>
#include <limits>
#include <regex>

namespace tokenrouter {

using namespace tokenrouter::utilities;

namespace {

constexpr unsigned long MAX_PORT = 65535;

std::string value_or(const ConfigLookup& lookup, const std::string& name, const std::string& fallback) {
    auto value = lookup(name);
    return value ? *value : fallback;
}

} // namespace

// ============================================================================
// Parsers
// ============================================================================

int parse_int_or(const std::optional<std::string>& value, int default_value) {
    if (!value) {
        return default_value;
    }

    std::string trimmed = trim_string(*value);
    if (trimmed.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        long parsed = std::stol(trimmed, &consumed, 10);
        if (consumed != trimmed.size()) {
            return default_value;
        }
        if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
            return default_value;
        }
        return static_cast<int>(parsed);
    } catch (const std::exception&) {
        return default_value;
    }
}

std::pair<uint16_t, uint16_t> parse_port_range(const std::string& value) {
    static const std::regex range_pattern(R"(^(\d+)-(\d+)$)");
    const std::pair<uint16_t, uint16_t> fallback{DEFAULT_PORT_RANGE_START, DEFAULT_PORT_RANGE_END};

    std::smatch match;
    if (!std::regex_match(value, match, range_pattern)) {
        return fallback;
    }

    try {
        unsigned long start = std::stoul(match[1].str());
        unsigned long end = std::stoul(match[2].str());
        if (start > MAX_PORT || end > MAX_PORT) {
            return fallback;
        }
        if (start > end) {
            std::swap(start, end);
        }
        return {static_cast<uint16_t>(start), static_cast<uint16_t>(end)};
    } catch (const std::exception&) {
        // Digit runs too long for unsigned long
        return fallback;
    }
}

std::set<uint16_t> parse_exclude_ports(const std::string& value) {
    std::set<uint16_t> ports;

    for (const auto& item : split_string(value, ',')) {
        int port = parse_int_or(item, -1);
        if (port < 0 || port > static_cast<int>(MAX_PORT)) {
            continue;
        }
        ports.insert(static_cast<uint16_t>(port));
    }

    return ports;
}

DiscoveryFailurePolicy parse_discovery_failure_policy(const std::string& value) {
    if (to_lowercase(trim_string(value)) == "preserve") {
        return DiscoveryFailurePolicy::PRESERVE;
    }
    return DiscoveryFailurePolicy::PRUNE;
}

const char* discovery_failure_policy_name(DiscoveryFailurePolicy policy) {
    switch (policy) {
        case DiscoveryFailurePolicy::PRESERVE: return "preserve";
        case DiscoveryFailurePolicy::PRUNE: return "prune";
    }
    return "prune";
}

// ============================================================================
// RouterConfig
// ============================================================================

RouterConfig RouterConfig::from_environment() {
    return from_lookup([](const std::string& name) { return get_env(name); });
}

RouterConfig RouterConfig::from_lookup(const ConfigLookup& lookup) {
    RouterConfig config;

    config.target_container = value_or(lookup, "TARGET_CONTAINER", DEFAULT_TARGET_CONTAINER);
    config.gateway_container = value_or(lookup, "GATEWAY_CONTAINER", DEFAULT_GATEWAY_CONTAINER);
    config.container_runtime = value_or(lookup, "ROUTER_CONTAINER_RUNTIME", DEFAULT_CONTAINER_RUNTIME);
    config.map_file = value_or(lookup, "ROUTER_MAP_FILE", DEFAULT_MAP_FILE);
    config.state_file = value_or(lookup, "ROUTER_STATE_FILE", DEFAULT_STATE_FILE);

    int interval = parse_int_or(lookup("ROUTER_SCAN_INTERVAL"), DEFAULT_SCAN_INTERVAL_SECONDS);
    config.scan_interval = std::chrono::seconds(interval >= 1 ? interval : DEFAULT_SCAN_INTERVAL_SECONDS);

    int timeout = parse_int_or(lookup("ROUTER_COMMAND_TIMEOUT"), DEFAULT_COMMAND_TIMEOUT_SECONDS);
    config.command_timeout = std::chrono::seconds(timeout >= 1 ? timeout : DEFAULT_COMMAND_TIMEOUT_SECONDS);

    int token_length = parse_int_or(lookup("ROUTER_TOKEN_LENGTH"), DEFAULT_TOKEN_LENGTH);
    config.token_length = static_cast<size_t>(token_length >= 1 ? token_length : DEFAULT_TOKEN_LENGTH);

    auto range = parse_port_range(value_or(lookup, "ROUTER_PORT_RANGE", "3000-9999"));
    config.port_range_start = range.first;
    config.port_range_end = range.second;

    config.exclude_ports = parse_exclude_ports(value_or(lookup, "ROUTER_EXCLUDE_PORTS", DEFAULT_EXCLUDE_PORTS));

    std::string base_url = value_or(lookup, "PUBLIC_BASE_URL", "");
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.pop_back();
    }
    config.public_base_url = base_url;

    config.username = value_or(lookup, "ROUTER_USERNAME", "");
    config.password = value_or(lookup, "ROUTER_PASSWORD", "");

    config.listen_address = value_or(lookup, "ROUTER_LISTEN_ADDRESS", DEFAULT_LISTEN_ADDRESS);
    int listen_port = parse_int_or(lookup("ROUTER_LISTEN_PORT"), DEFAULT_LISTEN_PORT);
    config.listen_port = (listen_port >= 0 && listen_port <= static_cast<int>(MAX_PORT))
        ? static_cast<uint16_t>(listen_port)
        : DEFAULT_LISTEN_PORT;

    config.discovery_failure_policy =
        parse_discovery_failure_policy(value_or(lookup, "ROUTER_DISCOVERY_FAILURE", "prune"));

    std::string level = value_or(lookup, "ROUTER_LOG_LEVEL", "info");
    config.log_level = parse_log_level(level) ? to_lowercase(trim_string(level)) : "info";
    config.log_file = value_or(lookup, "ROUTER_LOG_FILE", "");

    return config;
}

bool RouterConfig::is_routable_port(uint16_t port) const {
    if (exclude_ports.count(port) > 0) {
        return false;
    }
    return port >= port_range_start && port <= port_range_end;
}

std::string RouterConfig::public_url_for(const std::string& token) const {
    if (public_base_url.empty()) {
        return "";
    }
    return public_base_url + PUBLIC_PATH_PREFIX + token + "/";
}

} // namespace tokenrouter
