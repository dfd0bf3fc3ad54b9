/**
 * @file agent_types.cpp
 * @brief Implementation of shared agent value helpers
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/agent_types.hpp"

#include <cctype>
#include <limits>

namespace sshkeep {

const char* to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::HasKeys:        return "has-keys";
        case AgentStatus::ReachableEmpty: return "reachable-empty";
        case AgentStatus::Unreachable:    return "unreachable";
        default:                          return "unknown";
    }
}

std::optional<pid_t> parse_process_id(const std::string& text) {
    if (text.empty() || text.length() > 10) {
        return std::nullopt;
    }

    long long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }

    if (value <= 0 || value > std::numeric_limits<pid_t>::max()) {
        return std::nullopt;
    }

    return static_cast<pid_t>(value);
}

} // namespace sshkeep
