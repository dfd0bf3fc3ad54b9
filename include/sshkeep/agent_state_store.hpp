/**
 * @file agent_state_store.hpp
 * @brief Persistent agent coordinates, one record per agent name
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Manages the on-disk agent record:
 * - ~/.ssh/agent for the default agent, ~/.ssh/<name>/agent otherwise
 * - sh-evaluable assignments of SSH_AGENT_NAME, SSH_AUTH_SOCK, SSH_AGENT_PID
 * - owner-only permissions, atomic replacement
 */

#pragma once

#include "sshkeep/agent_types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace sshkeep {

/**
 * @brief AgentStateStore - reads and writes agent records
 *
 * Records are never deleted; a stale record is tolerated until the next
 * successful agent start overwrites it. Concurrent shells may read and
 * write the same record without locking: writers replace the file by
 * rename, so readers see either the old or the new record.
 */
class AgentStateStore {
public:
    /**
     * @brief Construct store rooted at an ssh directory
     * @param ssh_directory Usually ~/.ssh
     */
    explicit AgentStateStore(std::filesystem::path ssh_directory);

    virtual ~AgentStateStore() = default;

    /**
     * @brief Record path for an agent
     * @param identity Agent name
     * @return Path of the record file
     */
    std::filesystem::path state_file_path(const AgentIdentity& identity) const;

    /**
     * @brief Load a persisted record
     * @param identity Agent name
     * @return State if present and well-formed, std::nullopt otherwise
     */
    virtual std::optional<AgentState> load(const AgentIdentity& identity) const;

    /**
     * @brief Atomically replace the record
     * @param identity Agent name
     * @param state Coordinates to persist
     * @return true if successful, false otherwise
     */
    virtual bool save(const AgentIdentity& identity, const AgentState& state);

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Render a record
     * @param state Coordinates
     * @return sh-evaluable assignments
     */
    static std::string serialize(const AgentState& state);

    /**
     * @brief Parse a record
     * @param record File contents
     * @param identity Agent the record must belong to
     * @return Complete state, or std::nullopt if malformed
     */
    static std::optional<AgentState> parse(const std::string& record, const AgentIdentity& identity);

private:
    /// Directory holding the records
    std::filesystem::path ssh_directory_;
};

} // namespace sshkeep
