/**
 * @file key_codec.hpp
 * @brief Encoding and digest primitives for key material
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides SHA-256 digests (OpenSSL) and base64 coding (libsodium) used to
 * derive OpenSSH fingerprints from public key blobs.
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <vector>
#include <string>
#include <optional>

namespace sshkeep {

/// SHA-256 digest size in bytes
constexpr size_t SHA256_DIGEST_SIZE = 32;

/// Upper bound for key files read into memory
constexpr size_t MAX_SECRET_FILE_SIZE = 1024 * 1024;

/**
 * @brief KeyCodec - Stateless encoding helpers for key files
 *
 * All methods are static. initialize() must succeed once before the
 * base64 helpers are used.
 */
class KeyCodec {
public:
    /**
     * @brief Initialize libsodium (call once at startup)
     * @return true if initialization successful, false otherwise
     */
    static bool initialize();

    /**
     * @brief Compute SHA-256 digest
     * @param data Input bytes
     * @return Digest, or std::nullopt if the digest backend fails
     */
    static std::optional<std::array<uint8_t, SHA256_DIGEST_SIZE>> sha256(
        const std::vector<uint8_t>& data
    );

    /**
     * @brief OpenSSH SHA-256 fingerprint of a public key blob
     * @param blob Wire-format public key (string type, then key fields)
     * @return "SHA256:" + unpadded base64 digest, or std::nullopt on failure
     */
    static std::optional<std::string> fingerprint_of_blob(const std::vector<uint8_t>& blob);

    /**
     * @brief Convert bytes to base64 string
     * @param bytes Input bytes
     * @param padded Emit trailing '=' padding
     * @return Base64 string representation
     */
    static std::string bytes_to_base64(const std::vector<uint8_t>& bytes, bool padded = true);

    /**
     * @brief Convert base64 string to bytes
     *
     * Whitespace (line breaks of PEM bodies) is ignored.
     *
     * @param base64 Base64 string, padded
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const std::string& base64);

    /**
     * @brief Convert a base64 character range to bytes
     *
     * Decodes in place from the caller's buffer, so no copy of the input is
     * made. Whitespace is ignored.
     *
     * @param data First character
     * @param length Number of characters
     * @return Decoded bytes, or std::nullopt if invalid
     */
    static std::optional<std::vector<uint8_t>> base64_to_bytes(const char* data, size_t length);

    /**
     * @brief Securely zero memory (prevents compiler optimization from removing)
     * @param data Pointer to memory to zero
     * @param size Size of memory region
     */
    static void secure_zero(void* data, size_t size);

    /**
     * @brief Wipe and clear a string holding key material
     * @param text String to wipe
     */
    static void secure_clear(std::string& text);

    /**
     * @brief Read a file holding key material
     *
     * The contents land directly in the returned string; no stream or
     * intermediate buffer ever holds them. Callers wipe the result with
     * secure_clear() once parsed.
     *
     * @param path File to read
     * @return Contents, or std::nullopt if unreadable or larger than
     *         MAX_SECRET_FILE_SIZE
     */
    static std::optional<std::string> read_secret_file(const std::filesystem::path& path);
};

} // namespace sshkeep
