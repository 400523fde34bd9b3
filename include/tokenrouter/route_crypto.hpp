/**
 * @file route_crypto.hpp
 * @brief Cryptographic primitives used by TokenRouter
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Thin libsodium wrappers: CSPRNG, constant-time comparison, base64.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <sodium.h>

namespace tokenrouter {

/**
 * @brief RouteCrypto - stateless libsodium helpers
 *
 * All methods are thread-safe once initialize() has succeeded.
 */
class RouteCrypto {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Uniform random integer in [0, upper_bound)
     * @param upper_bound Exclusive bound (must be > 0)
     */
    static uint32_t random_uniform(uint32_t upper_bound);

    /**
     * @brief Random string drawn uniformly from an alphabet
     * @param alphabet Characters to draw from (must be non-empty)
     * @param length Number of characters
     */
    static std::string random_string(const std::string& alphabet, size_t length);

    /**
     * @brief Constant-time string comparison (prevents timing attacks)
     * @return true if equal
     */
    static bool constant_time_equals(const std::string& a, const std::string& b);

    /**
     * @brief Convert bytes to base64 string (standard alphabet, padded)
     */
    static std::string bytes_to_base64(const std::string& bytes);

    /**
     * @brief Convert base64 string to bytes
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::string> base64_to_bytes(const std::string& base64);
};

} // namespace tokenrouter
