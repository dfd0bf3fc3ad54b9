/**
 * @file agent_state_store.cpp
 * @brief Implementation of agent record persistence
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/agent_state_store.hpp"
#include "sshkeep/security_config.hpp"
#include "sshkeep/shell_export.hpp"
#include "sshkeep/utilities.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sshkeep {

namespace {

    bool is_name_start(char c) {
        return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    bool is_name_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    // Collect NAME=value statements; values may be bare or single-quoted
    // (with '\'' standing for an embedded quote)
    std::map<std::string, std::string> parse_assignments(const std::string& text) {
        std::map<std::string, std::string> values;
        size_t pos = 0;
        const size_t len = text.size();

        auto skip_statement = [&]() {
            while (pos < len && text[pos] != ';' && text[pos] != '\n') ++pos;
            if (pos < len) ++pos;
        };

        while (pos < len) {
            while (pos < len && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
            if (pos >= len) break;

            if (!is_name_start(text[pos])) {
                skip_statement();
                continue;
            }

            size_t name_start = pos;
            while (pos < len && is_name_char(text[pos])) ++pos;
            std::string name = text.substr(name_start, pos - name_start);

            if (pos >= len || text[pos] != '=') {
                skip_statement();
                continue;
            }
            ++pos;

            std::string value;
            bool well_formed = true;
            while (pos < len && text[pos] != ';' && text[pos] != '\n' &&
                   !std::isspace(static_cast<unsigned char>(text[pos]))) {
                if (text[pos] == '\'') {
                    auto close = text.find('\'', pos + 1);
                    if (close == std::string::npos) {
                        well_formed = false;
                        pos = len;
                        break;
                    }
                    value += text.substr(pos + 1, close - pos - 1);
                    pos = close + 1;
                } else if (text[pos] == '\\' && pos + 1 < len) {
                    value += text[pos + 1];
                    pos += 2;
                } else {
                    value += text[pos++];
                }
            }

            if (well_formed) {
                values[name] = value;
            }
            skip_statement();
        }

        return values;
    }

    bool write_all(int fd, const std::string& data) {
        size_t written = 0;
        while (written < data.size()) {
            ssize_t n = ::write(fd, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    // Create missing levels owner-only
    bool ensure_directory(const std::filesystem::path& directory) {
        std::error_code ec;
        if (std::filesystem::is_directory(directory, ec)) {
            return true;
        }

        if (directory.has_parent_path() && directory.parent_path() != directory) {
            if (!ensure_directory(directory.parent_path())) {
                return false;
            }
        }

        if (::mkdir(directory.c_str(), S_IRWXU) != 0 && errno != EEXIST) {
            utilities::log_warn("Cannot create " + directory.string() + ": " + std::strerror(errno));
            return false;
        }
        return true;
    }

}

AgentStateStore::AgentStateStore(std::filesystem::path ssh_directory)
    : ssh_directory_(std::move(ssh_directory))
{
}

std::filesystem::path AgentStateStore::state_file_path(const AgentIdentity& identity) const {
    return security::get_state_file_path(identity.name, ssh_directory_);
}

// ============================================================================
// Persistent Storage
// ============================================================================

std::optional<AgentState> AgentStateStore::load(const AgentIdentity& identity) const {
    try {
        auto path = state_file_path(identity);

        // Check if file exists
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return std::nullopt;
        }

        auto record = utilities::read_file(path.string());
        if (!record) {
            return std::nullopt;
        }

        auto state = parse(*record, identity);
        if (!state) {
            utilities::log_debug("Ignoring malformed agent record " + path.string());
        }
        return state;

    } catch (const std::exception& e) {
        utilities::log_debug(std::string("Cannot load agent record: ") + e.what());
        return std::nullopt;
    }
}

bool AgentStateStore::save(const AgentIdentity& identity, const AgentState& state) {
    auto path = state_file_path(identity);

    if (!ensure_directory(path.parent_path())) {
        return false;
    }

    // mkstemp creates the file with mode 0600
    std::string tmp_name = path.string() + ".XXXXXX";
    std::vector<char> tmp_path(tmp_name.begin(), tmp_name.end());
    tmp_path.push_back('\0');

    int fd = ::mkstemp(tmp_path.data());
    if (fd < 0) {
        utilities::log_warn("Cannot create temporary record next to " + path.string() +
                            ": " + std::strerror(errno));
        return false;
    }

    AgentState record_state = state;
    record_state.name = identity.name;
    const std::string record = serialize(record_state);

    bool ok = write_all(fd, record) && ::fchmod(fd, S_IRUSR | S_IWUSR) == 0 && ::fsync(fd) == 0;
    if (::close(fd) != 0) {
        ok = false;
    }

    if (ok && ::rename(tmp_path.data(), path.c_str()) != 0) {
        ok = false;
    }

    if (!ok) {
        utilities::log_warn("Cannot write agent record " + path.string() + ": " + std::strerror(errno));
        ::unlink(tmp_path.data());
        return false;
    }

    return true;
}

// ============================================================================
// Serialization
// ============================================================================

std::string AgentStateStore::serialize(const AgentState& state) {
    return format_exports(state, ShellDialect::Posix);
}

std::optional<AgentState> AgentStateStore::parse(const std::string& record, const AgentIdentity& identity) {
    auto values = parse_assignments(record);

    auto name_it = values.find(security::ENV_AGENT_NAME);
    if (name_it != values.end() && name_it->second != identity.name) {
        return std::nullopt;
    }

    AgentState state;
    state.name = identity.name;

    auto sock_it = values.find(security::ENV_AUTH_SOCK);
    if (sock_it != values.end() && !sock_it->second.empty()) {
        state.socket_path = sock_it->second;
    }

    auto pid_it = values.find(security::ENV_AGENT_PID);
    if (pid_it != values.end()) {
        state.process_id = parse_process_id(pid_it->second);
    }

    if (!state.is_complete()) {
        return std::nullopt;
    }

    return state;
}

} // namespace sshkeep
