/**
 * @file cli.cpp
 * @brief Implementation of command line parsing
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/cli.hpp"

#include <boost/program_options.hpp>

#include <sstream>

#ifndef SSHKEEP_PROJECT_VERSION
#error "SSHKEEP_PROJECT_VERSION must be defined by the build"
#endif

namespace sshkeep {

namespace {

    boost::program_options::options_description make_options() {
        using namespace boost::program_options;

        options_description options("Allowed options");
        options.add_options()
            ("help,h", "display this help and exit")
            ("version,V", "display version and exit")
            ("debug,d", "log diagnostics to stderr")
            ("init,i", "session initializer: skip key loading if the agent already has keys")
            ("name,n", value<std::string>(), "agent name (default: global)")
            ("confirm,c", "require confirmation for every use of added keys")
            ("all,a", "add every private key in the key directory")
            ("add,k", value<std::vector<std::string>>()->composing(),
                "add a key file, or every key in a directory (repeatable)")
            ("shell", value<std::string>(), "output syntax: posix, csh or fish (default: from $SHELL)");

        return options;
    }

}

CliOptions parse_command_line(int argc, const char* const argv[]) {
    namespace po = boost::program_options;

    auto options = make_options();
    po::variables_map vm;

    try {
        auto parsed = po::command_line_parser(argc, argv).options(options).run();

        auto extra = po::collect_unrecognized(parsed.options, po::include_positional);
        if (!extra.empty()) {
            throw CliError("unexpected argument '" + extra.front() + "'");
        }

        po::store(parsed, vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw CliError(e.what());
    }

    CliOptions cli;

    if (vm.count("help")) {
        cli.action = CliAction::Help;
        return cli;
    }
    if (vm.count("version")) {
        cli.action = CliAction::Version;
        return cli;
    }

    cli.debug = vm.count("debug") != 0;
    cli.session_initializer = vm.count("init") != 0;
    cli.confirm = vm.count("confirm") != 0;
    cli.add_all = vm.count("all") != 0;

    if (vm.count("name")) {
        cli.agent_name = vm["name"].as<std::string>();
        if (!security::validate_identifier(cli.agent_name)) {
            throw CliError("invalid agent name '" + cli.agent_name + "'");
        }
    }

    if (vm.count("add")) {
        cli.add_paths = vm["add"].as<std::vector<std::string>>();
        for (const auto& path : cli.add_paths) {
            if (path.empty()) {
                throw CliError("empty key path");
            }
        }
    }

    if (vm.count("shell")) {
        const auto& name = vm["shell"].as<std::string>();
        cli.dialect = parse_dialect(name);
        if (!cli.dialect) {
            throw CliError("unknown shell dialect '" + name + "'");
        }
    }

    return cli;
}

std::string usage_text(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "\n"
        << "Start or reuse a named ssh-agent and print shell statements\n"
        << "exporting its coordinates, e.g. eval \"$(" << program << " --init --all)\".\n"
        << "\n"
        << make_options();
    return out.str();
}

const char* version_string() {
    return SSHKEEP_PROJECT_VERSION;
}

} // namespace sshkeep
