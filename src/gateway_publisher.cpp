/**
 * @file gateway_publisher.cpp
 * @brief Implementation of map rendering and gateway reload
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/gateway_publisher.hpp"
#include "tokenrouter/utilities.hpp"
#include <sstream>

namespace tokenrouter {

using namespace tokenrouter::utilities;

GatewayPublisher::GatewayPublisher(const RouterConfig& config, CommandRunner& runner)
    : config_(config)
    , runner_(runner)
{
}

std::string GatewayPublisher::render_map(const RouteTable& table) {
    std::ostringstream oss;
    oss << MAP_HEADER_LINE << "\n";

    for (const auto& [token, route] : table) {
        if (route.port == 0) {
            continue;
        }
        oss << token << " " << route.port << ";\n";
    }

    return oss.str();
}

std::vector<std::string> GatewayPublisher::reload_command() const {
    return {
        config_.container_runtime,
        "exec",
        config_.gateway_container,
        "nginx",
        "-s",
        "reload"
    };
}

PublishResult GatewayPublisher::publish(const RouteTable& table) {
    PublishResult result;

    if (!write_file_atomic(config_.map_file, render_map(table))) {
        result.error = "failed to write map artifact " + config_.map_file;
        log_error("GatewayPublisher: " + result.error);
        return result;
    }
    result.map_written = true;

    auto command = reload_command();
    try {
        CommandResult reload = runner_.run(
            command,
            std::chrono::duration_cast<std::chrono::milliseconds>(config_.command_timeout)
        );

        if (reload.succeeded()) {
            result.reload_ok = true;
            log_debug("GatewayPublisher: Reloaded " + config_.gateway_container);
        } else if (reload.timed_out) {
            result.error = "gateway reload timed out";
        } else {
            result.error = "'" + format_command(command) + "' exited with " +
                std::to_string(reload.exit_code);
            std::string detail = trim_string(reload.error_output);
            if (!detail.empty()) {
                result.error += ": " + detail;
            }
        }
    } catch (const std::exception& e) {
        result.error = std::string("gateway reload error: ") + e.what();
    }

    if (!result.reload_ok) {
        log_warn("GatewayPublisher: Reload failed (gateway keeps previous map): " + result.error);
    }

    return result;
}

} // namespace tokenrouter
