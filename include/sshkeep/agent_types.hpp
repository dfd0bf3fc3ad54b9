/**
 * @file agent_types.hpp
 * @brief Value types shared by the agent components
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Defines:
 * - AgentIdentity: which named agent instance a run works with
 * - AgentState: (possibly stale) coordinates of a started agent
 * - AgentStatus: liveness probe result
 * - KeyCandidate / KeyFingerprint: key files and their identities
 * - StartError / ComputeError
 */

#pragma once

#include "sshkeep/security_config.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/types.h>

namespace sshkeep {

/**
 * @brief Named agent instance; fixed for the lifetime of the process
 */
struct AgentIdentity {
    std::string name = security::DEFAULT_AGENT_NAME;
};

/**
 * @brief Coordinates of a previously started agent
 *
 * process_id and socket_path are either both set (agent presumed started)
 * or the state is treated as unreachable.
 */
struct AgentState {
    std::string name;
    std::optional<pid_t> process_id;
    std::optional<std::string> socket_path;

    /**
     * @brief Check that both coordinates are present and plausible
     * @return true if the state can be probed
     */
    bool is_complete() const {
        return process_id.has_value() && *process_id > 0 &&
               socket_path.has_value() && !socket_path->empty();
    }

    bool operator==(const AgentState& other) const {
        return name == other.name &&
               process_id == other.process_id &&
               socket_path == other.socket_path;
    }

    bool operator!=(const AgentState& other) const { return !(*this == other); }
};

/**
 * @brief Result of probing an agent; never persisted
 */
enum class AgentStatus {
    HasKeys,
    ReachableEmpty,
    Unreachable
};

/**
 * @brief Human-readable status name
 */
const char* to_string(AgentStatus status);

/**
 * @brief Parse a decimal process id
 * @param text Digits only, no sign or whitespace
 * @return Positive pid, or std::nullopt if invalid
 */
std::optional<pid_t> parse_process_id(const std::string& text);

/**
 * @brief File that may hold a private key
 */
struct KeyCandidate {
    std::filesystem::path path;
};

/// Opaque key identity as listed by the agent ("SHA256:...")
using KeyFingerprint = std::string;

/**
 * @brief Spawning a new agent failed; fatal for the run
 */
class StartError : public std::runtime_error {
public:
    explicit StartError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A key file's fingerprint could not be computed
 */
class ComputeError : public std::runtime_error {
public:
    explicit ComputeError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace sshkeep
