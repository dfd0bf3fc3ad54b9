/**
 * @file key_classifier.hpp
 * @brief Private key discovery
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Finds candidate key files in a key source (one file, or the immediate
 * children of a directory) and filters out everything that is not a
 * private key: public keys, known_hosts, config, subdirectories.
 */

#pragma once

#include "sshkeep/agent_types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sshkeep {

/**
 * @brief KeyClassifier - best-effort textual private key detection
 *
 * A file qualifies when its content contains the private key marker.
 * This is a scan, not a parser: no size or encoding checks are made.
 */
class KeyClassifier {
public:
    /**
     * @brief Construct classifier
     * @param marker Substring identifying private keys
     */
    explicit KeyClassifier(std::string marker = security::PRIVATE_KEY_MARKER);

    /**
     * @brief Check whether a path holds a loadable private key
     * @param path File to inspect
     * @return true if the file is readable and contains the marker
     */
    bool is_candidate(const std::filesystem::path& path) const;

    /**
     * @brief List the files a key source refers to
     *
     * A regular file yields itself. A directory yields its immediate regular
     * files in lexicographic order (no recursion). Anything else yields
     * nothing.
     *
     * @param source File or directory
     * @return Unfiltered candidates
     */
    std::vector<KeyCandidate> enumerate(const std::filesystem::path& source) const;

    /**
     * @brief enumerate() followed by is_candidate()
     * @param source File or directory
     * @return Candidates containing the marker
     */
    std::vector<KeyCandidate> discover(const std::filesystem::path& source) const;

private:
    /// Private key marker
    std::string marker_;
};

} // namespace sshkeep
