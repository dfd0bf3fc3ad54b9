/**
 * @file app.hpp
 * @brief Top-level flow of the sshkeep executable
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <ostream>

namespace sshkeep {

/**
 * @brief Parse argv, supervise the agent and print its exports
 *
 * Exit codes: 0 on success, on help or version, and when the run was
 * skipped because the ssh directory is not writable (nothing is printed).
 * 1 on bad arguments, an unknown home directory, or an agent that cannot
 * be started.
 *
 * @param argc Argument count
 * @param argv Arguments, argv[0] is the program
 * @param out Receives help, version and the shell statements
 * @param err Receives argument errors
 * @return Process exit code
 */
int run_main(int argc, const char* const argv[], std::ostream& out, std::ostream& err);

} // namespace sshkeep
