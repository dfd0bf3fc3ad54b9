/**
 * @file security_config.hpp
 * @brief Agent record locations, environment contract and input validation
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <cstddef>
#include <string>
#include <filesystem>

namespace sshkeep {
namespace security {

// ============================================================================
// Agent Identity
// ============================================================================

/// Agent name used when none is given on the command line
constexpr const char* DEFAULT_AGENT_NAME = "global";

/// Maximum agent name length
constexpr size_t MAX_IDENTIFIER_LENGTH = 64;

/// File name of the persisted agent record
constexpr const char* STATE_FILE_NAME = "agent";

/// Directory (relative to home) holding keys and agent records
constexpr const char* SSH_DIRECTORY_NAME = ".ssh";

// ============================================================================
// Environment Contract
// ============================================================================

/// Name of the agent instance the session is attached to
constexpr const char* ENV_AGENT_NAME = "SSH_AGENT_NAME";

/// Process id of the running agent
constexpr const char* ENV_AGENT_PID = "SSH_AGENT_PID";

/// Unix socket the agent listens on
constexpr const char* ENV_AUTH_SOCK = "SSH_AUTH_SOCK";

// ============================================================================
// Key Files
// ============================================================================

/// Substring present in every PEM/OpenSSH private key file
constexpr const char* PRIVATE_KEY_MARKER = "PRIVATE KEY";

/// Suffix of the public half stored next to a private key
constexpr const char* PUBLIC_KEY_SUFFIX = ".pub";

/// Prefix of OpenSSH SHA-256 fingerprints
constexpr const char* FINGERPRINT_PREFIX = "SHA256:";

// ============================================================================
// ============================================================================

/**
 * @brief Directory holding agent records for a home directory
 * @param home_directory User home directory
 * @return home_directory/.ssh
 */
std::filesystem::path get_ssh_directory(const std::filesystem::path& home_directory);

/**
 * @brief Agent record path for an agent name
 *
 * The default name maps to ssh_directory/agent, any other name to
 * ssh_directory/<name>/agent.
 *
 * @param agent_name Validated agent name
 * @param ssh_directory Directory returned by get_ssh_directory()
 * @return Path of the record file
 */
std::filesystem::path get_state_file_path(
    const std::string& agent_name,
    const std::filesystem::path& ssh_directory
);

// ============================================================================
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric + underscore/hyphen only)
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Check whether files can be created in a directory
 *
 * A directory that does not exist yet is judged by its nearest existing
 * ancestor, since saving creates the missing levels.
 *
 * @param directory Directory to probe
 * @return true if writable, false otherwise
 */
bool is_directory_writable(const std::filesystem::path& directory);

} // namespace security
} // namespace sshkeep
