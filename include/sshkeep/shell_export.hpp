/**
 * @file shell_export.hpp
 * @brief Environment assignments for the calling shell
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include "sshkeep/agent_types.hpp"

#include <optional>
#include <string>

namespace sshkeep {

/**
 * @brief Syntax family of the shell evaluating our output
 */
enum class ShellDialect {
    Posix,  ///< sh, bash, zsh, ksh: NAME=value; export NAME;
    Csh,    ///< csh, tcsh: setenv NAME value;
    Fish    ///< fish: set -gx NAME value;
};

/**
 * @brief Pick the dialect from a shell path such as $SHELL
 * @param shell_path Path or name of the shell (may be empty)
 * @return Csh for csh/tcsh, Fish for fish, Posix otherwise
 */
ShellDialect detect_dialect(const std::string& shell_path);

/**
 * @brief Parse a dialect name given on the command line
 * @param name "posix", "sh", "csh" or "fish"
 * @return Dialect, or std::nullopt if unknown
 */
std::optional<ShellDialect> parse_dialect(const std::string& name);

/**
 * @brief Quote a value for the given dialect when needed
 * @param value Raw value
 * @param dialect Target shell
 * @return Value safe to paste after the assignment keyword
 */
std::string quote_value(const std::string& value, ShellDialect dialect);

/**
 * @brief One assignment statement (no trailing newline)
 * @param name Variable name
 * @param value Variable value
 * @param dialect Target shell
 * @return Statement exporting the variable
 */
std::string format_assignment(const std::string& name, const std::string& value, ShellDialect dialect);

/**
 * @brief Assignments for agent name, socket and pid, one per line
 *
 * Variables with an empty value are omitted.
 *
 * @param state Agent coordinates
 * @param dialect Target shell
 * @return Text for the shell to evaluate
 */
std::string format_exports(const AgentState& state, ShellDialect dialect);

} // namespace sshkeep
