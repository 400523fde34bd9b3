/**
 * @file utilities.hpp
 * @brief Common utility functions for TokenRouter
 *
 * TokenRouter - Token-addressed port routing for container gateways
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout TokenRouter:
 * - Logging and error reporting
 * - Time formatting
 * - String manipulation
 * - Crash-safe file I/O helpers
 * - Environment helpers
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace tokenrouter {
namespace utilities {

/**
 * @brief Log levels for TokenRouter logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name (case-insensitive)
 * @return Parsed level, or std::nullopt if unknown
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

/**
 * @brief Current wall-clock time as Unix seconds
 */
uint64_t current_unix_time();

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if missing/unreadable
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Atomically replace a file's contents
 *
 * Writes to a temporary sibling file, fsyncs it, then renames it over
 * file_path. Readers observe either the old or the new contents, never a
 * partial write. Parent directories are created as needed.
 *
 * @param file_path Destination path
 * @param content Content to write
 * @return true if successful, false otherwise
 */
bool write_file_atomic(const std::string& file_path, const std::string& content);

/**
 * @brief Split string by delimiter
 * @param str String to split
 * @param delimiter Delimiter character
 * @return Vector of split strings
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Split string on runs of whitespace, dropping empty fields
 */
std::vector<std::string> split_whitespace(const std::string& str);

/**
 * @brief Trim whitespace from string
 * @param str String to trim
 * @return Trimmed string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Convert string to lowercase
 */
std::string to_lowercase(const std::string& str);

/**
 * @brief Check if string starts with prefix
 */
bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @return Value if set, std::nullopt otherwise
 */
std::optional<std::string> get_env(const std::string& name);

} // namespace utilities
} // namespace tokenrouter
