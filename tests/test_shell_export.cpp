/**
 * @file test_shell_export.cpp
 * @brief Unit tests for shell assignment formatting
 */

#include <gtest/gtest.h>
#include "sshkeep/shell_export.hpp"

using namespace sshkeep;

namespace {

AgentState sample_state() {
    AgentState state;
    state.name = "work";
    state.process_id = 812;
    state.socket_path = "/tmp/ssh-Qx1/agent.811";
    return state;
}

}

TEST(ShellExportTest, DetectsDialectFromShellPath) {
    EXPECT_EQ(detect_dialect("/bin/bash"), ShellDialect::Posix);
    EXPECT_EQ(detect_dialect("/usr/bin/zsh"), ShellDialect::Posix);
    EXPECT_EQ(detect_dialect("/bin/tcsh"), ShellDialect::Csh);
    EXPECT_EQ(detect_dialect("csh"), ShellDialect::Csh);
    EXPECT_EQ(detect_dialect("/usr/local/bin/fish"), ShellDialect::Fish);
    EXPECT_EQ(detect_dialect(""), ShellDialect::Posix);
}

TEST(ShellExportTest, ParsesDialectNames) {
    EXPECT_EQ(parse_dialect("posix"), std::optional<ShellDialect>(ShellDialect::Posix));
    EXPECT_EQ(parse_dialect("sh"), std::optional<ShellDialect>(ShellDialect::Posix));
    EXPECT_EQ(parse_dialect("csh"), std::optional<ShellDialect>(ShellDialect::Csh));
    EXPECT_EQ(parse_dialect("fish"), std::optional<ShellDialect>(ShellDialect::Fish));
    EXPECT_FALSE(parse_dialect("powershell").has_value());
}

TEST(ShellExportTest, PlainValuesAreNotQuoted) {
    EXPECT_EQ(quote_value("/tmp/ssh-Qx1/agent.811", ShellDialect::Posix), "/tmp/ssh-Qx1/agent.811");
    EXPECT_EQ(quote_value("812", ShellDialect::Fish), "812");
}

TEST(ShellExportTest, SpecialValuesAreQuoted) {
    EXPECT_EQ(quote_value("/tmp/a b", ShellDialect::Posix), "'/tmp/a b'");
    EXPECT_EQ(quote_value("$(id)", ShellDialect::Csh), "'$(id)'");
    EXPECT_EQ(quote_value("it's", ShellDialect::Posix), "'it'\\''s'");
    EXPECT_EQ(quote_value("it's", ShellDialect::Fish), "'it\\'s'");
}

TEST(ShellExportTest, FishEscapesBackslashes) {
    // 'a\' would leave the fish string unterminated
    EXPECT_EQ(quote_value("/tmp/a\\", ShellDialect::Fish), "'/tmp/a\\\\'");
    EXPECT_EQ(quote_value("a\\'b", ShellDialect::Fish), "'a\\\\\\'b'");
    EXPECT_EQ(format_assignment("SSH_AUTH_SOCK", "/tmp/x\\y", ShellDialect::Fish),
              "set -gx SSH_AUTH_SOCK '/tmp/x\\\\y';");
}

TEST(ShellExportTest, PosixAndCshKeepBackslashesLiteral) {
    EXPECT_EQ(quote_value("/tmp/a\\", ShellDialect::Posix), "'/tmp/a\\'");
    EXPECT_EQ(quote_value("/tmp/a\\", ShellDialect::Csh), "'/tmp/a\\'");
}

TEST(ShellExportTest, PosixExports) {
    EXPECT_EQ(format_exports(sample_state(), ShellDialect::Posix),
              "SSH_AGENT_NAME=work; export SSH_AGENT_NAME;\n"
              "SSH_AUTH_SOCK=/tmp/ssh-Qx1/agent.811; export SSH_AUTH_SOCK;\n"
              "SSH_AGENT_PID=812; export SSH_AGENT_PID;\n");
}

TEST(ShellExportTest, CshExports) {
    EXPECT_EQ(format_exports(sample_state(), ShellDialect::Csh),
              "setenv SSH_AGENT_NAME work;\n"
              "setenv SSH_AUTH_SOCK /tmp/ssh-Qx1/agent.811;\n"
              "setenv SSH_AGENT_PID 812;\n");
}

TEST(ShellExportTest, FishExports) {
    EXPECT_EQ(format_exports(sample_state(), ShellDialect::Fish),
              "set -gx SSH_AGENT_NAME work;\n"
              "set -gx SSH_AUTH_SOCK /tmp/ssh-Qx1/agent.811;\n"
              "set -gx SSH_AGENT_PID 812;\n");
}

TEST(ShellExportTest, MissingCoordinatesAreOmitted) {
    AgentState state;
    state.name = "global";

    EXPECT_EQ(format_exports(state, ShellDialect::Posix),
              "SSH_AGENT_NAME=global; export SSH_AGENT_NAME;\n");
}
