/**
 * @file agent_connection.hpp
 * @brief Access to a running ssh-agent
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The agent is a black box offering four capabilities:
 * - report liveness (and whether it holds keys)
 * - list fingerprints of loaded keys
 * - add a key (possibly prompting for a passphrase)
 * - be started
 *
 * SshAgentConnection implements them with the OpenSSH ssh-agent/ssh-add tools.
 */

#pragma once

#include "sshkeep/agent_types.hpp"
#include "sshkeep/process_runner.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace sshkeep {

/**
 * @brief Outcome of a single add attempt
 */
struct AddKeyResult {
    bool success = false;
    /// Diagnostic for failed attempts
    std::string message;
};

/**
 * @brief AgentConnection - abstract agent access
 *
 * Every call names the agent through an AgentState value; the connection
 * itself holds no agent coordinates.
 */
class AgentConnection {
public:
    virtual ~AgentConnection() = default;

    /**
     * @brief Probe the agent described by state
     *
     * Absence of an agent is an expected outcome, so this never throws.
     *
     * @param state Agent coordinates (may be incomplete or stale)
     * @return HasKeys, ReachableEmpty or Unreachable
     */
    virtual AgentStatus status(const AgentState& state) const = 0;

    /**
     * @brief Spawn a fresh agent
     * @param identity Name recorded in the returned state
     * @return Coordinates of the new agent
     * @throws StartError if the agent cannot be spawned
     */
    virtual AgentState start(const AgentIdentity& identity) = 0;

    /**
     * @brief Submit a key for loading
     *
     * Blocks while the operator answers a passphrase prompt.
     *
     * @param state Agent coordinates
     * @param candidate Key file
     * @param confirm Require interactive approval for every use of the key
     * @return Success flag and diagnostic
     */
    virtual AddKeyResult add_key(
        const AgentState& state,
        const KeyCandidate& candidate,
        bool confirm
    ) = 0;

    /**
     * @brief Fingerprints of the keys the agent currently holds
     * @param state Agent coordinates
     * @return Fingerprints; empty if unreachable or empty
     */
    virtual std::set<KeyFingerprint> list_fingerprints(const AgentState& state) const = 0;
};

/**
 * @brief Programs used to reach the agent
 */
struct SshTools {
    std::string ssh_agent = "ssh-agent";
    std::string ssh_add = "ssh-add";
};

/**
 * @brief SshAgentConnection - AgentConnection backed by ssh-agent and ssh-add
 *
 * ssh-add -l exit codes: 0 keys listed, 1 agent has no identities,
 * 2 agent not reachable.
 */
class SshAgentConnection : public AgentConnection {
public:
    /**
     * @brief Construct connection
     * @param runner Executes the OpenSSH tools (must outlive the connection)
     * @param tools Program names or paths
     */
    explicit SshAgentConnection(CommandRunner& runner, SshTools tools = SshTools());

    AgentStatus status(const AgentState& state) const override;

    AgentState start(const AgentIdentity& identity) override;

    AddKeyResult add_key(
        const AgentState& state,
        const KeyCandidate& candidate,
        bool confirm
    ) override;

    std::set<KeyFingerprint> list_fingerprints(const AgentState& state) const override;

    // ========================================================================
    // Output parsing
    // ========================================================================

    /**
     * @brief Extract coordinates from `ssh-agent -s` output
     * @param output Bourne shell statements printed by ssh-agent
     * @param identity Name recorded in the state
     * @return Complete state, or std::nullopt if pid or socket is missing
     */
    static std::optional<AgentState> parse_agent_output(
        const std::string& output,
        const AgentIdentity& identity
    );

    /**
     * @brief Extract fingerprints from `ssh-add -l` output
     * @param output One "bits fingerprint comment (type)" line per key
     * @return Second field of every well-formed line
     */
    static std::set<KeyFingerprint> parse_fingerprint_listing(const std::string& output);

private:
    /// Command runner
    CommandRunner& runner_;

    /// Tool names
    SshTools tools_;

    /// ssh-add -l against the state's socket; std::nullopt if it cannot run
    std::optional<CommandResult> list_keys(const AgentState& state) const;

    /// Environment pointing the OpenSSH tools at the agent
    static std::map<std::string, std::string> agent_environment(const AgentState& state);
};

} // namespace sshkeep
