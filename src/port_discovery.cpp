/**
 * @file port_discovery.cpp
 * @brief Implementation of listener-table based port discovery
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/port_discovery.hpp"
#include "tokenrouter/utilities.hpp"
#include <cctype>

namespace tokenrouter {

using namespace tokenrouter::utilities;

namespace {

// Parse a hex port; rejects empty strings, non-hex digits and values > 65535
bool parse_hex_port(const std::string& text, uint16_t& port) {
    if (text.empty() || text.size() > 8) {
        return false;
    }

    unsigned long value = 0;
    for (char c : text) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 16 + static_cast<unsigned long>(
            std::isdigit(static_cast<unsigned char>(c))
                ? c - '0'
                : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
    }

    if (value > 65535) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

} // namespace

const char* discovery_status_name(DiscoveryStatus status) {
    switch (status) {
        case DiscoveryStatus::OK: return "ok";
        case DiscoveryStatus::COMMAND_FAILED: return "command_failed";
        case DiscoveryStatus::TIMED_OUT: return "timed_out";
    }
    return "unknown";
}

// ============================================================================
// Constructor
// ============================================================================

PortDiscovery::PortDiscovery(const RouterConfig& config, CommandRunner& runner)
    : config_(config)
    , runner_(runner)
{
}

// ============================================================================
// Discovery
// ============================================================================

std::vector<std::string> PortDiscovery::discovery_command() const {
    return {
        config_.container_runtime,
        "exec",
        config_.target_container,
        "sh",
        "-c",
        "cat /proc/net/tcp /proc/net/tcp6"
    };
}

DiscoveryResult PortDiscovery::discover_ports() {
    DiscoveryResult result;
    auto command = discovery_command();

    try {
        CommandResult command_result = runner_.run(
            command,
            std::chrono::duration_cast<std::chrono::milliseconds>(config_.command_timeout)
        );

        if (command_result.timed_out) {
            result.status = DiscoveryStatus::TIMED_OUT;
            result.error = "discovery timed out after " +
                std::to_string(config_.command_timeout.count()) + "s";
            return result;
        }

        if (!command_result.succeeded()) {
            result.status = DiscoveryStatus::COMMAND_FAILED;
            result.error = "'" + format_command(command) + "' exited with " +
                std::to_string(command_result.exit_code);
            std::string detail = trim_string(command_result.error_output);
            if (!detail.empty()) {
                result.error += ": " + detail;
            }
            return result;
        }

        result.ports = filter_ports(parse_listener_table(command_result.output), config_);
        log_debug("PortDiscovery: " + std::to_string(result.ports.size()) +
                  " routable listening port(s) in " + config_.target_container);
        return result;

    } catch (const std::exception& e) {
        result.status = DiscoveryStatus::COMMAND_FAILED;
        result.ports.clear();
        result.error = std::string("discovery error: ") + e.what();
        return result;
    }
}

// ============================================================================
// Parsing
// ============================================================================

std::set<uint16_t> PortDiscovery::parse_listener_table(const std::string& output) {
    std::set<uint16_t> ports;

    for (const auto& raw_line : split_string(output, '\n')) {
        std::string line = trim_string(raw_line);
        if (line.empty() || starts_with(line, TCP_TABLE_HEADER_LABEL)) {
            continue;
        }

        auto fields = split_whitespace(line);
        if (fields.size() < 4) {
            continue;
        }

        const std::string& local = fields[1];
        const std::string& state = fields[3];
        if (state != TCP_STATE_LISTEN) {
            continue;
        }

        auto colon = local.rfind(':');
        if (colon == std::string::npos) {
            continue;
        }

        uint16_t port = 0;
        if (!parse_hex_port(local.substr(colon + 1), port)) {
            continue;
        }
        ports.insert(port);
    }

    return ports;
}

std::vector<uint16_t> PortDiscovery::filter_ports(
    const std::set<uint16_t>& ports,
    const RouterConfig& config
) {
    std::vector<uint16_t> filtered;
    for (uint16_t port : ports) {
        if (config.is_routable_port(port)) {
            filtered.push_back(port);
        }
    }
    // std::set iteration already yields ascending order
    return filtered;
}

} // namespace tokenrouter
