/**
 * @file main.cpp
 * @brief sshkeep executable
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Typical use from a shell startup file:
 *   eval "$(sshkeep --init --all)"
 */

#include "sshkeep/app.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return sshkeep::run_main(argc, argv, std::cout, std::cerr);
}
