/**
 * @file utilities.hpp
 * @brief Common utility functions for sshkeep
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout sshkeep:
 * - Logging and error reporting
 * - String manipulation
 * - File I/O helpers
 * - Environment helpers
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace sshkeep {
namespace utilities {

/**
 * @brief Log levels for sshkeep logging
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
 *
 * Log output always goes to stderr: stdout carries the shell statements
 * evaluated by the calling shell.
 *
 * @param level Minimum log level to output
 */
void initialize_logging(LogLevel level = LogLevel::WARN);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

/**
 * @brief Log debug message
 * @param message Message to log
 */
void log_debug(const std::string& message);

/**
 * @brief Log info message
 * @param message Message to log
 */
void log_info(const std::string& message);

/**
 * @brief Log warning message
 * @param message Message to log
 */
void log_warn(const std::string& message);

/**
 * @brief Log error message
 * @param message Message to log
 */
void log_error(const std::string& message);

/**
 * @brief Log critical message
 * @param message Message to log
 */
void log_critical(const std::string& message);

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Split string by delimiter
 * @param str String to split
 * @param delimiter Delimiter character
 * @return Vector of split strings
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Split string on runs of whitespace
 * @param str String to split
 * @return Non-empty fields in order
 */
std::vector<std::string> split_fields(const std::string& str);

/**
 * @brief Trim whitespace from string
 * @param str String to trim
 * @return Trimmed string
 */
std::string trim_string(const std::string& str);

/**
 * @brief Check if string starts with prefix
 * @param str String to check
 * @param prefix Prefix to check for
 * @return true if starts with prefix, false otherwise
 */
bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set or empty
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace sshkeep
