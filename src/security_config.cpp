/**
 * @file security_config.cpp
 * @brief Implementation of path derivation and validation functions
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/security_config.hpp"
#include <cctype>
#include <system_error>
#include <unistd.h>

namespace sshkeep {
namespace security {

// ============================================================================
// PATH DERIVATION
// ============================================================================

std::filesystem::path get_ssh_directory(const std::filesystem::path& home_directory) {
    return home_directory / SSH_DIRECTORY_NAME;
}

std::filesystem::path get_state_file_path(
    const std::string& agent_name,
    const std::filesystem::path& ssh_directory
) {
    if (agent_name == DEFAULT_AGENT_NAME) {
        return ssh_directory / STATE_FILE_NAME;
    }

    return ssh_directory / agent_name / STATE_FILE_NAME;
}

// ============================================================================
// VALIDATION
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    // Check length
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    // Validate characters: alphanumeric + underscore + hyphen only
    // The name becomes a path component under ~/.ssh
    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return false;
        }
    }

    return true;
}

bool is_directory_writable(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::path probe = directory.empty() ? std::filesystem::path(".") : directory;

    // Walk up to the first level that exists
    while (!std::filesystem::exists(probe, ec)) {
        if (ec || !probe.has_parent_path() || probe.parent_path() == probe) {
            return false;
        }
        probe = probe.parent_path();
    }

    if (!std::filesystem::is_directory(probe, ec)) {
        return false;
    }

    return ::access(probe.c_str(), W_OK | X_OK) == 0;
}

} // namespace security
} // namespace sshkeep
