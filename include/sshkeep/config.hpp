/**
 * @file config.hpp
 * @brief Runtime configuration
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Environment overrides:
 * - SSHKEEP_KEY_DIR     directory scanned by --all (default ~/.ssh)
 * - SSHKEEP_SSH_AGENT   ssh-agent program
 * - SSHKEEP_SSH_ADD     ssh-add program
 * - SSHKEEP_SSH_KEYGEN  ssh-keygen program
 */

#pragma once

#include "sshkeep/shell_export.hpp"

#include <filesystem>
#include <string>

namespace sshkeep {

/**
 * @brief Settings resolved once at startup
 */
struct Config {
    std::filesystem::path home_directory;
    std::filesystem::path ssh_directory;
    std::filesystem::path key_directory;
    std::string ssh_agent_program = "ssh-agent";
    std::string ssh_add_program = "ssh-add";
    std::string ssh_keygen_program = "ssh-keygen";
    ShellDialect dialect = ShellDialect::Posix;
};

/**
 * @brief Home directory from $HOME, else the password database
 * @return Home directory, empty if neither is available
 */
std::filesystem::path get_home_directory();

/**
 * @brief Build configuration from the process environment
 * @return Populated configuration
 */
Config load_config_from_environment();

} // namespace sshkeep
