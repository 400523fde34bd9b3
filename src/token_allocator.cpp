/**
 * @file token_allocator.cpp
 * @brief Implementation of collision-free token allocation
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "tokenrouter/token_allocator.hpp"
#include "tokenrouter/route_crypto.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace tokenrouter {

// ============================================================================
// Token Allocation
// ============================================================================

std::string TokenAllocator::allocate(size_t length, const std::set<std::string>& existing_tokens) {
    if (length == 0) {
        throw std::invalid_argument("token length must be positive");
    }

    // Only tokens of the requested length can collide
    uint64_t same_length = 0;
    for (const auto& token : existing_tokens) {
        if (token.size() == length) {
            ++same_length;
        }
    }
    if (same_length >= token_space(length)) {
        throw std::invalid_argument(
            "token space of length " + std::to_string(length) + " is exhausted");
    }

    const std::string alphabet(TOKEN_ALPHABET);
    std::string token = RouteCrypto::random_string(alphabet, length);
    while (existing_tokens.count(token) > 0) {
        collision_count_++;
        token = RouteCrypto::random_string(alphabet, length);
    }

    allocated_count_++;
    return token;
}

// ============================================================================
// Query Functions
// ============================================================================

uint64_t TokenAllocator::token_space(size_t length) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    uint64_t space = 1;
    for (size_t i = 0; i < length; ++i) {
        if (space > max / TOKEN_ALPHABET_SIZE) {
            return max;
        }
        space *= TOKEN_ALPHABET_SIZE;
    }
    return space;
}

bool TokenAllocator::is_valid_token(const std::string& token) {
    if (token.empty()) {
        return false;
    }
    for (char c : token) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

uint64_t TokenAllocator::get_allocated_count() const {
    return allocated_count_.load();
}

uint64_t TokenAllocator::get_collision_count() const {
    return collision_count_.load();
}

} // namespace tokenrouter
