/**
 * @file agent_connection.cpp
 * @brief Implementation of ssh-agent access through the OpenSSH tools
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/agent_connection.hpp"
#include "sshkeep/security_config.hpp"
#include "sshkeep/utilities.hpp"

#include <filesystem>
#include <system_error>

namespace sshkeep {

namespace {
    constexpr int SSH_ADD_OK = 0;
    constexpr int SSH_ADD_NO_IDENTITIES = 1;
    constexpr int EXIT_EXEC_FAILED = 127;
}

SshAgentConnection::SshAgentConnection(CommandRunner& runner, SshTools tools)
    : runner_(runner)
    , tools_(std::move(tools))
{
}

// ============================================================================
// Probing
// ============================================================================

AgentStatus SshAgentConnection::status(const AgentState& state) const {
    if (!state.is_complete()) {
        return AgentStatus::Unreachable;
    }

    std::error_code ec;
    if (!std::filesystem::exists(*state.socket_path, ec)) {
        utilities::log_debug("Agent socket " + *state.socket_path + " is gone");
        return AgentStatus::Unreachable;
    }

    auto result = list_keys(state);
    if (!result) {
        return AgentStatus::Unreachable;
    }

    switch (result->exit_code) {
        case SSH_ADD_OK:            return AgentStatus::HasKeys;
        case SSH_ADD_NO_IDENTITIES: return AgentStatus::ReachableEmpty;
        default:                    return AgentStatus::Unreachable;
    }
}

std::set<KeyFingerprint> SshAgentConnection::list_fingerprints(const AgentState& state) const {
    if (!state.is_complete()) {
        return {};
    }

    auto result = list_keys(state);
    if (!result || result->exit_code != SSH_ADD_OK) {
        return {};
    }

    return parse_fingerprint_listing(result->output);
}

std::optional<CommandResult> SshAgentConnection::list_keys(const AgentState& state) const {
    Command command;
    command.program = tools_.ssh_add;
    command.arguments = {"-l", "-E", "sha256"};
    command.environment = agent_environment(state);

    try {
        return runner_.run(command);
    } catch (const std::system_error& e) {
        utilities::log_debug("Cannot run " + tools_.ssh_add + ": " + e.what());
        return std::nullopt;
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

AgentState SshAgentConnection::start(const AgentIdentity& identity) {
    Command command;
    command.program = tools_.ssh_agent;
    command.arguments = {"-s"};

    CommandResult result;
    try {
        result = runner_.run(command);
    } catch (const std::system_error& e) {
        throw StartError("Cannot spawn " + tools_.ssh_agent + ": " + e.what());
    }

    if (result.exit_code == EXIT_EXEC_FAILED) {
        throw StartError("Cannot execute " + tools_.ssh_agent);
    }
    if (result.exit_code != 0) {
        throw StartError(tools_.ssh_agent + " exited with code " + std::to_string(result.exit_code));
    }

    auto state = parse_agent_output(result.output, identity);
    if (!state) {
        throw StartError("Unrecognized output from " + tools_.ssh_agent);
    }

    utilities::log_info("Started agent '" + identity.name + "' (pid " +
                        std::to_string(*state->process_id) + ")");
    return *state;
}

AddKeyResult SshAgentConnection::add_key(
    const AgentState& state,
    const KeyCandidate& candidate,
    bool confirm
) {
    AddKeyResult outcome;

    if (!state.is_complete()) {
        outcome.message = "agent coordinates are incomplete";
        return outcome;
    }

    Command command;
    command.program = tools_.ssh_add;
    if (confirm) {
        command.arguments.push_back("-c");
    }
    command.arguments.push_back(candidate.path.string());
    command.environment = agent_environment(state);
    command.output = OutputMode::ForwardToStderr;

    try {
        auto result = runner_.run(command);
        outcome.success = result.exit_code == 0;
        if (!outcome.success) {
            outcome.message = tools_.ssh_add + " exited with code " + std::to_string(result.exit_code);
        }
    } catch (const std::system_error& e) {
        outcome.message = std::string("cannot run ") + tools_.ssh_add + ": " + e.what();
    }

    return outcome;
}

// ============================================================================
// Output parsing
// ============================================================================

std::optional<AgentState> SshAgentConnection::parse_agent_output(
    const std::string& output,
    const AgentIdentity& identity
) {
    const std::string sock_prefix = std::string(security::ENV_AUTH_SOCK) + "=";
    const std::string pid_prefix = std::string(security::ENV_AGENT_PID) + "=";

    AgentState state;
    state.name = identity.name;

    // Statements look like "SSH_AUTH_SOCK=/tmp/ssh-x/agent.1; export SSH_AUTH_SOCK;"
    for (const auto& line : utilities::split_string(output, '\n')) {
        for (const auto& raw : utilities::split_string(line, ';')) {
            std::string statement = utilities::trim_string(raw);

            if (utilities::starts_with(statement, sock_prefix)) {
                std::string value = statement.substr(sock_prefix.length());
                if (!value.empty()) {
                    state.socket_path = value;
                }
            } else if (utilities::starts_with(statement, pid_prefix)) {
                state.process_id = parse_process_id(statement.substr(pid_prefix.length()));
            }
        }
    }

    if (!state.is_complete()) {
        return std::nullopt;
    }

    return state;
}

std::set<KeyFingerprint> SshAgentConnection::parse_fingerprint_listing(const std::string& output) {
    std::set<KeyFingerprint> fingerprints;

    // "256 SHA256:AbC... user@host (ED25519)"
    for (const auto& line : utilities::split_string(output, '\n')) {
        auto fields = utilities::split_fields(line);
        if (fields.size() < 2) {
            continue;
        }
        if (fields[0].find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        fingerprints.insert(fields[1]);
    }

    return fingerprints;
}

std::map<std::string, std::string> SshAgentConnection::agent_environment(const AgentState& state) {
    std::map<std::string, std::string> env;

    if (state.socket_path) {
        env[security::ENV_AUTH_SOCK] = *state.socket_path;
    }
    if (state.process_id) {
        env[security::ENV_AGENT_PID] = std::to_string(*state.process_id);
    }

    return env;
}

} // namespace sshkeep
