/**
 * @file config.cpp
 * @brief Implementation of runtime configuration loading
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/config.hpp"
#include "sshkeep/security_config.hpp"
#include "sshkeep/utilities.hpp"

#include <pwd.h>
#include <unistd.h>

namespace sshkeep {

std::filesystem::path get_home_directory() {
    std::string home = utilities::get_env("HOME");
    if (!home.empty()) {
        return home;
    }

    struct passwd* entry = ::getpwuid(::getuid());
    if (entry != nullptr && entry->pw_dir != nullptr) {
        return entry->pw_dir;
    }

    return {};
}

Config load_config_from_environment() {
    Config config;

    config.home_directory = get_home_directory();
    config.ssh_directory = security::get_ssh_directory(config.home_directory);

    // Key directory: SSHKEEP_KEY_DIR or ~/.ssh
    config.key_directory = utilities::get_env("SSHKEEP_KEY_DIR", config.ssh_directory.string());

    config.ssh_agent_program = utilities::get_env("SSHKEEP_SSH_AGENT", config.ssh_agent_program);
    config.ssh_add_program = utilities::get_env("SSHKEEP_SSH_ADD", config.ssh_add_program);
    config.ssh_keygen_program = utilities::get_env("SSHKEEP_SSH_KEYGEN", config.ssh_keygen_program);

    config.dialect = detect_dialect(utilities::get_env("SHELL"));

    return config;
}

} // namespace sshkeep
