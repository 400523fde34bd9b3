/**
 * @file route_types.hpp
 * @brief Route and route table definitions with JSON serialization
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace tokenrouter {

/**
 * @brief A single token -> port association
 */
struct Route {
    std::string token;          ///< Public identifier (unique, immutable)
    uint16_t port = 0;          ///< Backend TCP port (0 = no assigned port)
    uint64_t created_at = 0;    ///< Unix timestamp of creation

    bool operator==(const Route& other) const {
        return token == other.token && port == other.port && created_at == other.created_at;
    }
    bool operator!=(const Route& other) const { return !(*this == other); }
};

/**
 * @brief Token -> Route mapping
 *
 * std::map keeps iteration in stable key order, which every serialized
 * view (state file, map artifact, API listing) relies on.
 */
using RouteTable = std::map<std::string, Route>;

/**
 * @brief Helpers for route tables
 */
class RouteTableHelpers {
public:
    /**
     * @brief Serialize table as the durable state document
     *
     * Shape: {"<token>": {"created_at": N, "port": N}, ...} with sorted
     * keys, 2-space indent, ASCII-only, trailing newline.
     */
    static std::string to_json(const RouteTable& table);

    /**
     * @brief Parse the durable state document
     *
     * Entries whose port is missing or out of range load with port 0.
     * Entries that are not objects are dropped.
     *
     * @return Parsed table, or std::nullopt if the document is not a JSON object
     */
    static std::optional<RouteTable> from_json(const std::string& json_str);

    /**
     * @brief Set of ports currently present in the table (port 0 excluded)
     */
    static std::set<uint16_t> ports_of(const RouteTable& table);

    /**
     * @brief Set of tokens currently present in the table
     */
    static std::set<std::string> tokens_of(const RouteTable& table);
};

} // namespace tokenrouter
