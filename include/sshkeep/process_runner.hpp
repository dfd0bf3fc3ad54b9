/**
 * @file process_runner.hpp
 * @brief Child process execution for the OpenSSH helper tools
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * ssh-agent, ssh-add and ssh-keygen are driven as child processes.
 * CommandRunner is the seam; ProcessRunner is the fork/exec implementation.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace sshkeep {

/**
 * @brief Where the child's standard output goes
 */
enum class OutputMode {
    /// Collected into CommandResult::output
    Capture,
    /// Redirected to our stderr (stdout belongs to the calling shell)
    ForwardToStderr
};

/**
 * @brief Program invocation description
 */
struct Command {
    std::string program;
    std::vector<std::string> arguments;
    /// Variables set in the child on top of the inherited environment
    std::map<std::string, std::string> environment;
    OutputMode output = OutputMode::Capture;
};

/**
 * @brief Outcome of a finished child
 */
struct CommandResult {
    /// Exit status; 127 if the program could not be executed, 128+N if killed by signal N
    int exit_code = 0;
    /// Captured stdout (empty in ForwardToStderr mode)
    std::string output;
};

/**
 * @brief Abstract command execution
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command to completion
     *
     * stdin is inherited, so interactive prompts reach the terminal.
     *
     * @param command Command to run
     * @return Exit code and captured output
     * @throws std::system_error if the child cannot be created
     */
    virtual CommandResult run(const Command& command) = 0;
};

/**
 * @brief CommandRunner backed by pipe/fork/execvpe/waitpid
 */
class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const Command& command) override;
};

} // namespace sshkeep
