/**
 * @file process_runner.cpp
 * @brief Implementation of fork/exec based command execution
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/process_runner.hpp"
#include "sshkeep/utilities.hpp"

#include <cerrno>
#include <system_error>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sshkeep {

namespace {

    constexpr int EXIT_EXEC_FAILED = 127;

    [[noreturn]] void throw_errno(const std::string& what) {
        throw std::system_error(errno, std::generic_category(), what);
    }

    void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    int wait_for_child(pid_t pid) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno == EINTR) continue;
            throw_errno("waitpid() failed");
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return EXIT_EXEC_FAILED;
    }

    // Inherited environment with the command's variables replacing any
    // existing entries of the same name
    std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
        std::vector<std::string> entries;

        for (char** entry = environ; entry && *entry; ++entry) {
            std::string current(*entry);
            auto equals = current.find('=');
            std::string name = current.substr(0, equals);
            if (overrides.count(name) == 0) {
                entries.push_back(std::move(current));
            }
        }

        for (const auto& [name, value] : overrides) {
            entries.push_back(name + "=" + value);
        }

        return entries;
    }

}

CommandResult ProcessRunner::run(const Command& command) {
    // argv must be built before fork: only async-signal-safe calls after it
    std::vector<char*> argv;
    argv.reserve(command.arguments.size() + 2);
    argv.push_back(const_cast<char*>(command.program.c_str()));
    for (const auto& arg : command.arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_entries = build_environment(command.environment);
    std::vector<char*> envp;
    envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const bool capture = command.output == OutputMode::Capture;

    int stdout_pipe[2] = {-1, -1};
    if (capture && ::pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        throw_errno("Failed to create pipe for " + command.program);
    }

    utilities::log_debug("Running " + command.program);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        errno = saved;
        throw_errno("Failed to fork " + command.program);
    }

    if (pid == 0) {
        // Child process
        if (capture) {
            ::dup2(stdout_pipe[1], STDOUT_FILENO);
        } else {
            ::dup2(STDERR_FILENO, STDOUT_FILENO);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        // If exec fails
        ::_exit(EXIT_EXEC_FAILED);
    }

    // Parent process
    CommandResult result;

    if (capture) {
        close_fd(stdout_pipe[1]);

        char buffer[4096];
        while (true) {
            ssize_t n = ::read(stdout_pipe[0], buffer, sizeof(buffer));
            if (n > 0) {
                result.output.append(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                utilities::log_debug("Read from " + command.program + " failed");
                break;
            }
        }

        close_fd(stdout_pipe[0]);
    }

    result.exit_code = wait_for_child(pid);
    return result;
}

} // namespace sshkeep
