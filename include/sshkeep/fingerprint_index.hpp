/**
 * @file fingerprint_index.hpp
 * @brief Key fingerprints, for skipping keys the agent already holds
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Adding an already loaded key either fails or re-prompts for a passphrase.
 * Comparing fingerprints first makes repeated runs (one per new shell)
 * idempotent.
 */

#pragma once

#include "sshkeep/agent_connection.hpp"
#include "sshkeep/agent_types.hpp"
#include "sshkeep/process_runner.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sshkeep {

/**
 * @brief FingerprintIndex - fingerprints of candidate and loaded keys
 *
 * Candidate fingerprints are derived from the public key blob, found in
 * this order:
 * 1. sibling "<key>.pub" file
 * 2. public section of an "openssh-key-v1" private key (never encrypted)
 * 3. `ssh-keygen -l -E sha256 -f <key>`
 */
class FingerprintIndex {
public:
    /**
     * @brief Construct index
     * @param connection Agent access for listing loaded keys
     * @param runner Executes ssh-keygen for the last-resort lookup
     * @param ssh_keygen Program name or path of ssh-keygen
     */
    FingerprintIndex(
        const AgentConnection& connection,
        CommandRunner& runner,
        std::string ssh_keygen = "ssh-keygen"
    );

    /**
     * @brief Fingerprint of a private key file
     * @param path Key file
     * @return "SHA256:..." fingerprint
     * @throws ComputeError if the key is unreadable or its format unsupported
     */
    KeyFingerprint fingerprint_of(const std::filesystem::path& path) const;

    /**
     * @brief Fingerprints the agent currently holds
     * @param state Agent coordinates
     * @return Empty set if the agent is unreachable or holds no keys
     */
    std::set<KeyFingerprint> loaded_fingerprints(const AgentState& state) const;

    // ========================================================================
    // Format helpers
    // ========================================================================

    /**
     * @brief Decode the blob of a one-line public key ("type base64 comment")
     * @param text Public key file contents
     * @return Blob, or std::nullopt if malformed
     */
    static std::optional<std::vector<uint8_t>> public_blob_from_public_key(const std::string& text);

    /**
     * @brief Extract the public blob from an OpenSSH-format private key
     * @param text Private key file contents (PEM armored)
     * @return Blob of the first key, or std::nullopt if not that format
     */
    static std::optional<std::vector<uint8_t>> public_blob_from_openssh_private_key(const std::string& text);

    /**
     * @brief Extract the fingerprint from `ssh-keygen -l` output
     * @param output "bits fingerprint comment (type)"
     * @return Fingerprint, or std::nullopt if malformed
     */
    static std::optional<KeyFingerprint> parse_keygen_output(const std::string& output);

private:
    /// Agent access
    const AgentConnection& connection_;

    /// Runner for ssh-keygen
    CommandRunner& runner_;

    /// ssh-keygen program
    std::string ssh_keygen_;

    std::optional<KeyFingerprint> from_public_key_file(const std::filesystem::path& key_path) const;
    std::optional<KeyFingerprint> from_private_key_file(const std::filesystem::path& key_path) const;
    std::optional<KeyFingerprint> from_keygen(const std::filesystem::path& key_path) const;
};

} // namespace sshkeep
