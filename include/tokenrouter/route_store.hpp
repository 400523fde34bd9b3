/**
 * @file route_store.hpp
 * @brief Durable, crash-consistent route table persistence
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The state file is the synchronization boundary between the single
 * writer (reconciliation) and any number of readers (read API):
 * - Deterministic JSON output (stable key order)
 * - Atomic replace (temp file + fsync + rename)
 * - Corrupt or missing state loads as an empty table
 */

#pragma once

#include "tokenrouter/route_types.hpp"
#include <string>

namespace tokenrouter {

/**
 * @brief RouteStore - load/save of the route table
 *
 * Holds no in-memory table: every load() reads the file afresh, so readers
 * never share mutable state with the writer.
 */
class RouteStore {
public:
    /**
     * @brief Construct RouteStore
     * @param state_file Path to the JSON state file
     */
    explicit RouteStore(std::string state_file);

    /**
     * @brief Load the persisted table
     *
     * Missing, unreadable or invalid files yield an empty table; parse
     * errors are logged, never propagated.
     */
    RouteTable load() const;

    /**
     * @brief Persist the full table
     *
     * Creates the parent directory if needed. Identical tables produce
     * byte-identical files.
     *
     * @return true if the new contents are durably in place
     */
    bool save(const RouteTable& table) const;

    /**
     * @brief Path of the state file
     */
    const std::string& get_state_file() const { return state_file_; }

private:
    std::string state_file_;
};

} // namespace tokenrouter
