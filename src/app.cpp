/**
 * @file app.cpp
 * @brief Implementation of the executable's top-level flow
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/app.hpp"
#include "sshkeep/agent_connection.hpp"
#include "sshkeep/agent_state_store.hpp"
#include "sshkeep/agent_supervisor.hpp"
#include "sshkeep/cli.hpp"
#include "sshkeep/config.hpp"
#include "sshkeep/fingerprint_index.hpp"
#include "sshkeep/key_classifier.hpp"
#include "sshkeep/key_codec.hpp"
#include "sshkeep/process_runner.hpp"
#include "sshkeep/shell_export.hpp"
#include "sshkeep/utilities.hpp"

#include <filesystem>
#include <string>

namespace sshkeep {

int run_main(int argc, const char* const argv[], std::ostream& out, std::ostream& err) {
    CliOptions cli;
    try {
        cli = parse_command_line(argc, argv);
    } catch (const CliError& e) {
        err << "sshkeep: " << e.what() << "\n";
        err << "Try 'sshkeep --help' for more information.\n";
        return 1;
    }

    if (cli.action == CliAction::Help) {
        out << usage_text("sshkeep");
        return 0;
    }
    if (cli.action == CliAction::Version) {
        out << "sshkeep " << version_string() << "\n";
        return 0;
    }

    utilities::initialize_logging(cli.debug ? utilities::LogLevel::DEBUG : utilities::LogLevel::WARN);

    if (!KeyCodec::initialize()) {
        utilities::log_critical("Failed to initialize libsodium");
        return 1;
    }

    try {
        Config config = load_config_from_environment();
        if (config.home_directory.empty()) {
            utilities::log_error("Cannot determine home directory");
            return 1;
        }

        ProcessRunner runner;
        SshTools tools;
        tools.ssh_agent = config.ssh_agent_program;
        tools.ssh_add = config.ssh_add_program;

        SshAgentConnection connection(runner, tools);
        AgentStateStore store(config.ssh_directory);
        FingerprintIndex index(connection, runner, config.ssh_keygen_program);
        KeyClassifier classifier;
        AgentSupervisor supervisor(connection, store, index, classifier);

        AgentIdentity identity;
        identity.name = cli.agent_name;

        SupervisorOptions options;
        options.session_initializer = cli.session_initializer;
        options.confirm = cli.confirm;
        if (cli.add_all) {
            options.default_key_directory = config.key_directory;
        }
        for (const auto& path : cli.add_paths) {
            options.explicit_sources.emplace_back(path);
        }

        RunReport report = supervisor.run(identity, options);
        if (report.outcome == RunOutcome::Skipped) {
            return 0;
        }

        utilities::log_debug("Keys added: " + std::to_string(report.keys_added) +
                             ", already loaded: " + std::to_string(report.keys_skipped) +
                             ", failed: " + std::to_string(report.keys_failed));

        ShellDialect dialect = cli.dialect.value_or(config.dialect);
        out << format_exports(report.state, dialect);
        out.flush();

        return 0;

    } catch (const StartError& e) {
        utilities::log_error(std::string("Cannot start agent: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        utilities::log_error(std::string("Error: ") + e.what());
        return 1;
    }
}

} // namespace sshkeep
