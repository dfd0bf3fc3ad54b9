/**
 * @file key_classifier.cpp
 * @brief Implementation of private key discovery
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "sshkeep/key_classifier.hpp"
#include "sshkeep/utilities.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace sshkeep {

KeyClassifier::KeyClassifier(std::string marker)
    : marker_(std::move(marker))
{
}

bool KeyClassifier::is_candidate(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        utilities::log_debug("Cannot read " + path.string() + ", skipping");
        return false;
    }

    // Line-wise scan; the marker never spans a line break
    std::string line;
    while (std::getline(file, line)) {
        if (line.find(marker_) != std::string::npos) {
            return true;
        }
    }

    return false;
}

std::vector<KeyCandidate> KeyClassifier::enumerate(const std::filesystem::path& source) const {
    std::vector<KeyCandidate> candidates;
    std::error_code ec;

    if (std::filesystem::is_regular_file(source, ec)) {
        candidates.push_back(KeyCandidate{source});
        return candidates;
    }

    if (!std::filesystem::is_directory(source, ec)) {
        utilities::log_debug("Key source " + source.string() + " is neither file nor directory");
        return candidates;
    }

    std::filesystem::directory_iterator it(source, ec);
    if (ec) {
        utilities::log_debug("Cannot list " + source.string() + ": " + ec.message());
        return candidates;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            utilities::log_debug("Listing " + source.string() + " stopped: " + ec.message());
            break;
        }

        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            candidates.push_back(KeyCandidate{it->path()});
        }
    }

    std::sort(candidates.begin(), candidates.end(),
        [](const KeyCandidate& a, const KeyCandidate& b) { return a.path < b.path; });

    return candidates;
}

std::vector<KeyCandidate> KeyClassifier::discover(const std::filesystem::path& source) const {
    std::vector<KeyCandidate> keys;

    for (auto& candidate : enumerate(source)) {
        if (is_candidate(candidate.path)) {
            keys.push_back(std::move(candidate));
        } else {
            utilities::log_debug("Not a private key: " + candidate.path.string());
        }
    }

    return keys;
}

} // namespace sshkeep
