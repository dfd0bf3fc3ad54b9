/**
 * @file cli.hpp
 * @brief Command line parsing for the sshkeep executable
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "sshkeep/security_config.hpp"
#include "sshkeep/shell_export.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sshkeep {

/**
 * @brief Bad flags, missing values, or invalid option values
 */
class CliError : public std::runtime_error {
public:
    explicit CliError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief What the executable should do
 */
enum class CliAction {
    Run,
    Help,
    Version
};

/**
 * @brief Parsed command line
 */
struct CliOptions {
    CliAction action = CliAction::Run;
    bool debug = false;
    bool session_initializer = false;
    bool confirm = false;
    bool add_all = false;
    std::string agent_name = security::DEFAULT_AGENT_NAME;
    std::vector<std::string> add_paths;
    /// Set when --shell overrides $SHELL detection
    std::optional<ShellDialect> dialect;
};

/**
 * @brief Parse argv
 * @param argc Argument count
 * @param argv Arguments, argv[0] is the program
 * @return Parsed options
 * @throws CliError on any unsupported or invalid argument
 */
CliOptions parse_command_line(int argc, const char* const argv[]);

/**
 * @brief Usage text listing every option
 * @param program Program name for the usage line
 * @return Multi-line help
 */
std::string usage_text(const std::string& program);

/**
 * @brief Release version, taken from the build's project version
 */
const char* version_string();

} // namespace sshkeep
