/**
 * @file agent_supervisor.cpp
 * @brief Implementation of agent orchestration
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/agent_supervisor.hpp"
#include "sshkeep/security_config.hpp"
#include "sshkeep/utilities.hpp"

namespace sshkeep {

AgentSupervisor::AgentSupervisor(
    AgentConnection& connection,
    AgentStateStore& store,
    const FingerprintIndex& index,
    const KeyClassifier& classifier,
    WritableProbe writable
)
    : connection_(connection)
    , store_(store)
    , index_(index)
    , classifier_(classifier)
    , writable_(writable ? std::move(writable) : WritableProbe(&security::is_directory_writable))
{
}

RunReport AgentSupervisor::run(const AgentIdentity& identity, const SupervisorOptions& options) {
    RunReport report;
    report.state.name = identity.name;

    // Restricted environments: stay silent and touch nothing
    auto record_directory = store_.state_file_path(identity).parent_path();
    if (!writable_(record_directory)) {
        utilities::log_debug(record_directory.string() + " is not writable, nothing to do");
        report.outcome = RunOutcome::Skipped;
        return report;
    }

    AgentStatus status = ensure_agent(identity, report);

    // Repeated shell startups: agent already has keys
    if (options.session_initializer && status == AgentStatus::HasKeys) {
        utilities::log_debug("Agent '" + identity.name + "' already has keys");
        report.outcome = RunOutcome::FastPath;
        return report;
    }

    std::vector<std::filesystem::path> sources;
    if (options.default_key_directory) {
        sources.push_back(*options.default_key_directory);
    }
    sources.insert(sources.end(), options.explicit_sources.begin(), options.explicit_sources.end());

    load_keys(sources, options.confirm, report);

    report.outcome = RunOutcome::Completed;
    return report;
}

AgentStatus AgentSupervisor::ensure_agent(const AgentIdentity& identity, RunReport& report) {
    if (auto restored = store_.load(identity)) {
        report.state = *restored;
    }

    AgentStatus status = connection_.status(report.state);
    utilities::log_debug("Agent '" + identity.name + "' is " + to_string(status));

    if (status != AgentStatus::Unreachable) {
        return status;
    }

    report.state = connection_.start(identity);
    report.started_agent = true;

    if (!store_.save(identity, report.state)) {
        utilities::log_warn("Agent '" + identity.name + "' started but its record was not saved");
    }

    // A fresh agent holds nothing
    return AgentStatus::ReachableEmpty;
}

void AgentSupervisor::load_keys(
    const std::vector<std::filesystem::path>& sources,
    bool confirm,
    RunReport& report
) {
    if (sources.empty()) {
        return;
    }

    std::set<KeyFingerprint> loaded = index_.loaded_fingerprints(report.state);

    for (const auto& source : sources) {
        for (const auto& candidate : classifier_.discover(source)) {
            const std::string key_name = candidate.path.string();

            KeyFingerprint fingerprint;
            try {
                fingerprint = index_.fingerprint_of(candidate.path);
            } catch (const ComputeError& e) {
                utilities::log_debug(std::string("Skipping key: ") + e.what());
                ++report.keys_failed;
                continue;
            }

            if (loaded.count(fingerprint) != 0) {
                utilities::log_debug(key_name + " already loaded (" + fingerprint + ")");
                ++report.keys_skipped;
                continue;
            }

            auto result = connection_.add_key(report.state, candidate, confirm);
            if (!result.success) {
                utilities::log_debug("Adding " + key_name + " failed: " + result.message);
                ++report.keys_failed;
                continue;
            }

            utilities::log_debug("Added " + key_name);
            loaded.insert(fingerprint);
            ++report.keys_added;
        }
    }
}

} // namespace sshkeep
