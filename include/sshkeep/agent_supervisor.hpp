/**
 * @file agent_supervisor.hpp
 * @brief Restore-or-start orchestration and idempotent key loading
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * One run, in order:
 * 1. restore the agent record for the requested name
 * 2. probe the agent; start and persist a new one if unreachable
 * 3. session initializer with keys already loaded: stop here
 * 4. otherwise add every private key from the requested sources whose
 *    fingerprint the agent does not already hold
 */

#pragma once

#include "sshkeep/agent_connection.hpp"
#include "sshkeep/agent_state_store.hpp"
#include "sshkeep/agent_types.hpp"
#include "sshkeep/fingerprint_index.hpp"
#include "sshkeep/key_classifier.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace sshkeep {

/**
 * @brief What a run was asked to do
 */
struct SupervisorOptions {
    /// Invoked from a shell startup file
    bool session_initializer = false;
    /// Add keys in confirm mode
    bool confirm = false;
    /// Directory scanned when every default key is requested
    std::optional<std::filesystem::path> default_key_directory;
    /// Files or directories given explicitly, in order
    std::vector<std::filesystem::path> explicit_sources;
};

/**
 * @brief How a run ended
 */
enum class RunOutcome {
    /// Record directory not writable; nothing was touched
    Skipped,
    /// Session initializer found keys loaded; no key scan
    FastPath,
    /// Agent ensured and requested sources processed
    Completed
};

/**
 * @brief Summary of a run
 */
struct RunReport {
    RunOutcome outcome = RunOutcome::Skipped;
    /// Coordinates to export (meaningless when Skipped)
    AgentState state;
    bool started_agent = false;
    size_t keys_added = 0;
    size_t keys_skipped = 0;
    size_t keys_failed = 0;
};

/**
 * @brief AgentSupervisor - agent lifecycle and key loading state machine
 *
 * Single-threaded. Key adds are independent: one failure never stops the
 * remaining keys. Only a failed agent start aborts the run.
 */
class AgentSupervisor {
public:
    /// Decides whether the record directory accepts writes
    using WritableProbe = std::function<bool(const std::filesystem::path&)>;

    /**
     * @brief Construct supervisor (all collaborators must outlive it)
     * @param connection Agent access
     * @param store Record persistence
     * @param index Fingerprint lookups
     * @param classifier Key discovery
     * @param writable Directory probe (default: security::is_directory_writable)
     */
    AgentSupervisor(
        AgentConnection& connection,
        AgentStateStore& store,
        const FingerprintIndex& index,
        const KeyClassifier& classifier,
        WritableProbe writable = WritableProbe()
    );

    /**
     * @brief Perform one run
     * @param identity Agent name
     * @param options Requested work
     * @return Outcome, exported state and key counters
     * @throws StartError if a needed agent cannot be started
     */
    RunReport run(const AgentIdentity& identity, const SupervisorOptions& options);

private:
    AgentConnection& connection_;
    AgentStateStore& store_;
    const FingerprintIndex& index_;
    const KeyClassifier& classifier_;
    WritableProbe writable_;

    AgentStatus ensure_agent(const AgentIdentity& identity, RunReport& report);

    void load_keys(
        const std::vector<std::filesystem::path>& sources,
        bool confirm,
        RunReport& report
    );
};

} // namespace sshkeep
