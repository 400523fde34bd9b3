/**
 * @file route_crypto.cpp
 * @brief Implementation of libsodium helpers
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "tokenrouter/route_crypto.hpp"
#include <stdexcept>

namespace tokenrouter {

// ============================================================================
// Initialization
// ============================================================================

bool RouteCrypto::initialize() {
    // Safe to call multiple times
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Randomness
// ============================================================================

uint32_t RouteCrypto::random_uniform(uint32_t upper_bound) {
    if (upper_bound == 0) {
        throw std::invalid_argument("random_uniform upper bound must be positive");
    }
    // randombytes_uniform avoids modulo bias
    return randombytes_uniform(upper_bound);
}

std::string RouteCrypto::random_string(const std::string& alphabet, size_t length) {
    if (alphabet.empty()) {
        throw std::invalid_argument("alphabet must not be empty");
    }

    std::string result;
    result.reserve(length);

    const auto bound = static_cast<uint32_t>(alphabet.size());
    for (size_t i = 0; i < length; ++i) {
        result += alphabet[random_uniform(bound)];
    }

    return result;
}

// ============================================================================
// Comparison
// ============================================================================

bool RouteCrypto::constant_time_equals(const std::string& a, const std::string& b) {
    // Length is not secret; contents are
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Base64
// ============================================================================

std::string RouteCrypto::bytes_to_base64(const std::string& bytes) {
    size_t base64_len = sodium_base64_encoded_len(
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    std::vector<char> base64(base64_len);

    sodium_bin2base64(
        base64.data(),
        base64.size(),
        reinterpret_cast<const unsigned char*>(bytes.data()),
        bytes.size(),
        sodium_base64_VARIANT_ORIGINAL
    );

    return std::string(base64.data());
}

std::optional<std::string> RouteCrypto::base64_to_bytes(const std::string& base64) {
    // Decoded output is never longer than the input
    std::vector<unsigned char> bytes(base64.length() + 1);

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        base64.c_str(),
        base64.length(),
        nullptr,
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    if (result != 0) {
        return std::nullopt;
    }

    // Trailing garbage after the padded payload
    if (end_ptr != base64.c_str() + base64.length()) {
        return std::nullopt;
    }

    return std::string(reinterpret_cast<const char*>(bytes.data()), decoded_len);
}

} // namespace tokenrouter
