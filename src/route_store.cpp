/**
 * @file route_store.cpp
 * @brief Implementation of route table persistence
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/route_store.hpp"
#include "tokenrouter/utilities.hpp"
#include <filesystem>
#include <utility>

namespace tokenrouter {

using namespace tokenrouter::utilities;

RouteStore::RouteStore(std::string state_file)
    : state_file_(std::move(state_file))
{
}

RouteTable RouteStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(state_file_, ec)) {
        return {};
    }

    auto content = read_file(state_file_);
    if (!content) {
        log_warn("RouteStore: Unable to read " + state_file_ + ", starting from empty table");
        return {};
    }

    auto table = RouteTableHelpers::from_json(*content);
    if (!table) {
        log_warn("RouteStore: Invalid state in " + state_file_ + ", starting from empty table");
        return {};
    }

    return *table;
}

bool RouteStore::save(const RouteTable& table) const {
    if (!write_file_atomic(state_file_, RouteTableHelpers::to_json(table))) {
        log_error("RouteStore: Failed to persist " + std::to_string(table.size()) +
                  " route(s) to " + state_file_);
        return false;
    }
    return true;
}

} // namespace tokenrouter
