/**
 * @file token_allocator.hpp
 * @brief Collision-free public token allocation
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Allocates opaque route tokens:
 * - Alphanumeric alphabet, uniform draws from libsodium's CSPRNG
 * - Regenerates on collision with existing tokens
 * - Rejects degenerate lengths instead of spinning forever
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <set>
#include <string>

namespace tokenrouter {

/// Token alphabet: ASCII letters followed by digits
constexpr const char* TOKEN_ALPHABET =
    "abcdefghijklmnopqrstuvwxyz"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "0123456789";

/// Number of symbols in TOKEN_ALPHABET
constexpr size_t TOKEN_ALPHABET_SIZE = 62;

/**
 * @brief TokenAllocator - produces unique random tokens
 *
 * Stateless apart from statistics; safe to share between threads.
 */
class TokenAllocator {
public:
    TokenAllocator() = default;

    // Disable copy and move
    TokenAllocator(const TokenAllocator&) = delete;
    TokenAllocator& operator=(const TokenAllocator&) = delete;
    TokenAllocator(TokenAllocator&&) = delete;
    TokenAllocator& operator=(TokenAllocator&&) = delete;

    /**
     * @brief Allocate a token not present in existing_tokens
     * @param length Number of characters (must be > 0)
     * @param existing_tokens Tokens already in use
     * @return New unique token
     * @throws std::invalid_argument if length is 0 or the token space is exhausted
     */
    std::string allocate(size_t length, const std::set<std::string>& existing_tokens);

    /**
     * @brief Number of distinct tokens of the given length (saturating)
     */
    static uint64_t token_space(size_t length);

    /**
     * @brief Check that a string could have been produced by allocate()
     */
    static bool is_valid_token(const std::string& token);

    /**
     * @brief Get number of tokens allocated so far
     */
    uint64_t get_allocated_count() const;

    /**
     * @brief Get number of regenerations caused by collisions
     */
    uint64_t get_collision_count() const;

private:
    std::atomic<uint64_t> allocated_count_{0};
    std::atomic<uint64_t> collision_count_{0};
};

} // namespace tokenrouter
