/**
 * @file shell_export.cpp
 * @brief Implementation of shell assignment formatting
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/shell_export.hpp"
#include "sshkeep/security_config.hpp"

#include <cctype>
#include <filesystem>

namespace sshkeep {

namespace {

    bool needs_quoting(const std::string& value) {
        if (value.empty()) {
            return true;
        }

        const std::string safe_punctuation = "_./:@%+=,-";
        for (char c : value) {
            if (!std::isalnum(static_cast<unsigned char>(c)) &&
                safe_punctuation.find(c) == std::string::npos) {
                return true;
            }
        }
        return false;
    }

}

ShellDialect detect_dialect(const std::string& shell_path) {
    std::string shell = std::filesystem::path(shell_path).filename().string();

    if (shell == "csh" || shell == "tcsh") {
        return ShellDialect::Csh;
    }
    if (shell == "fish") {
        return ShellDialect::Fish;
    }
    return ShellDialect::Posix;
}

std::optional<ShellDialect> parse_dialect(const std::string& name) {
    if (name == "posix" || name == "sh") return ShellDialect::Posix;
    if (name == "csh") return ShellDialect::Csh;
    if (name == "fish") return ShellDialect::Fish;
    return std::nullopt;
}

std::string quote_value(const std::string& value, ShellDialect dialect) {
    if (!needs_quoting(value)) {
        return value;
    }

    std::string quoted = "'";
    for (char c : value) {
        // fish also treats backslash as an escape inside single quotes
        if (c == '\\' && dialect == ShellDialect::Fish) {
            quoted += "\\\\";
            continue;
        }
        if (c != '\'') {
            quoted += c;
            continue;
        }

        switch (dialect) {
            case ShellDialect::Fish:
                quoted += "\\'";
                break;
            case ShellDialect::Posix:
            case ShellDialect::Csh:
                // close, escaped quote, reopen
                quoted += "'\\''";
                break;
        }
    }
    quoted += "'";

    return quoted;
}

std::string format_assignment(const std::string& name, const std::string& value, ShellDialect dialect) {
    std::string quoted = quote_value(value, dialect);

    switch (dialect) {
        case ShellDialect::Csh:
            return "setenv " + name + " " + quoted + ";";
        case ShellDialect::Fish:
            return "set -gx " + name + " " + quoted + ";";
        case ShellDialect::Posix:
        default:
            return name + "=" + quoted + "; export " + name + ";";
    }
}

std::string format_exports(const AgentState& state, ShellDialect dialect) {
    std::string out;

    auto emit = [&](const char* name, const std::string& value) {
        if (!value.empty()) {
            out += format_assignment(name, value, dialect);
            out += "\n";
        }
    };

    emit(security::ENV_AGENT_NAME, state.name);
    emit(security::ENV_AUTH_SOCK, state.socket_path.value_or(""));
    emit(security::ENV_AGENT_PID, state.process_id ? std::to_string(*state.process_id) : "");

    return out;
}

} // namespace sshkeep
