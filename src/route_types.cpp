/**
 * @file route_types.cpp
 * @brief Implementation of route table serialization
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/route_types.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tokenrouter {

// ============================================================================
// Serialization
// ============================================================================

std::string RouteTableHelpers::to_json(const RouteTable& table) {
    // nlohmann::json objects are std::map backed, so keys come out sorted
    json j = json::object();

    for (const auto& [token, route] : table) {
        json entry = json::object();
        entry["created_at"] = route.created_at;
        entry["port"] = route.port;
        j[token] = entry;
    }

    return j.dump(2, ' ', true) + "\n";
}

std::optional<RouteTable> RouteTableHelpers::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        RouteTable table;
        for (auto it = j.begin(); it != j.end(); ++it) {
            const json& info = it.value();
            if (!info.is_object()) {
                continue;
            }

            Route route;
            route.token = it.key();

            auto port_it = info.find("port");
            if (port_it != info.end() && port_it->is_number_integer()) {
                auto port = port_it->get<int64_t>();
                if (port > 0 && port <= 65535) {
                    route.port = static_cast<uint16_t>(port);
                }
            }

            auto created_it = info.find("created_at");
            if (created_it != info.end()) {
                if (created_it->is_number_unsigned()) {
                    route.created_at = created_it->get<uint64_t>();
                } else if (created_it->is_number_float()) {
                    auto created = created_it->get<double>();
                    // Out-of-range values cannot be cast; treat them as unknown
                    route.created_at = (created > 0 && created < 18446744073709551616.0)
                        ? static_cast<uint64_t>(created) : 0;
                }
            }

            table.emplace(route.token, route);
        }

        return table;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Queries
// ============================================================================

std::set<uint16_t> RouteTableHelpers::ports_of(const RouteTable& table) {
    std::set<uint16_t> ports;
    for (const auto& [token, route] : table) {
        if (route.port != 0) {
            ports.insert(route.port);
        }
    }
    return ports;
}

std::set<std::string> RouteTableHelpers::tokens_of(const RouteTable& table) {
    std::set<std::string> tokens;
    for (const auto& entry : table) {
        tokens.insert(entry.first);
    }
    return tokens;
}

} // namespace tokenrouter
