/**
 * @file key_codec.cpp
 * @brief Implementation of encoding and digest primitives
 *
 * sshkeep - shared ssh-agent keeper
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - SHA-256: OpenSSL EVP
 * - base64, memzero: libsodium
 */

#include "sshkeep/key_codec.hpp"
#include "sshkeep/security_config.hpp"

#include <sodium.h>
#include <openssl/evp.h>

#include <cerrno>
#include <memory>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sshkeep {

// ============================================================================
// Initialization
// ============================================================================

bool KeyCodec::initialize() {
    // Initialize libsodium (safe to call multiple times)
    if (sodium_init() < 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Digests
// ============================================================================

std::optional<std::array<uint8_t, SHA256_DIGEST_SIZE>> KeyCodec::sha256(
    const std::vector<uint8_t>& data
) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        return std::nullopt;
    }

    std::array<uint8_t, SHA256_DIGEST_SIZE> digest{};
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        return std::nullopt;
    }

    if (digest_len != SHA256_DIGEST_SIZE) {
        return std::nullopt;
    }

    return digest;
}

std::optional<std::string> KeyCodec::fingerprint_of_blob(const std::vector<uint8_t>& blob) {
    if (blob.empty()) {
        return std::nullopt;
    }

    auto digest = sha256(blob);
    if (!digest) {
        return std::nullopt;
    }

    // OpenSSH prints SHA-256 fingerprints as unpadded base64
    std::vector<uint8_t> digest_vec(digest->begin(), digest->end());
    return std::string(security::FINGERPRINT_PREFIX) + bytes_to_base64(digest_vec, false);
}

// ============================================================================
// Base64
// ============================================================================

std::string KeyCodec::bytes_to_base64(const std::vector<uint8_t>& bytes, bool padded) {
    const int variant = padded
        ? sodium_base64_VARIANT_ORIGINAL
        : sodium_base64_VARIANT_ORIGINAL_NO_PADDING;

    // Calculate base64 encoded length (includes terminating NUL)
    size_t base64_len = sodium_base64_encoded_len(bytes.size(), variant);

    // Allocate buffer for base64 string
    std::vector<char> base64(base64_len);

    // Encode to base64
    sodium_bin2base64(
        base64.data(),
        base64.size(),
        bytes.data(),
        bytes.size(),
        variant
    );

    return std::string(base64.data());
}

std::optional<std::vector<uint8_t>> KeyCodec::base64_to_bytes(const std::string& base64) {
    return base64_to_bytes(base64.data(), base64.length());
}

std::optional<std::vector<uint8_t>> KeyCodec::base64_to_bytes(const char* data, size_t length) {
    // Calculate maximum decoded length
    size_t max_decoded_len = length;

    // Allocate buffer for decoded bytes
    std::vector<uint8_t> bytes(max_decoded_len);

    size_t decoded_len = 0;
    const char* end_ptr = nullptr;

    // Decode from base64
    int result = sodium_base642bin(
        bytes.data(),
        bytes.size(),
        data,
        length,
        " \t\r\n",
        &decoded_len,
        &end_ptr,
        sodium_base64_VARIANT_ORIGINAL
    );

    // Trailing garbage means the input was not pure base64
    if (result != 0 || end_ptr != data + length) {
        secure_zero(bytes.data(), bytes.size());
        return std::nullopt;
    }

    // Resize to actual decoded length
    bytes.resize(decoded_len);

    return bytes;
}

// ============================================================================
// Memory hygiene
// ============================================================================

void KeyCodec::secure_zero(void* data, size_t size) {
    // Use libsodium's secure memzero (prevents compiler optimization from removing)
    sodium_memzero(data, size);
}

void KeyCodec::secure_clear(std::string& text) {
    if (!text.empty()) {
        secure_zero(&text[0], text.size());
    }
    text.clear();
}

std::optional<std::string> KeyCodec::read_secret_file(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::nullopt;
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode) ||
        static_cast<uintmax_t>(st.st_size) > MAX_SECRET_FILE_SIZE) {
        ::close(fd);
        return std::nullopt;
    }

    std::string text(static_cast<size_t>(st.st_size), '\0');
    size_t filled = 0;
    bool ok = true;

    while (filled < text.size()) {
        ssize_t n = ::read(fd, &text[filled], text.size() - filled);
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        if (n == 0) {
            // Shrunk while reading
            break;
        }
        filled += static_cast<size_t>(n);
    }
    ::close(fd);

    if (!ok) {
        secure_clear(text);
        return std::nullopt;
    }

    // resize() to a smaller size never reallocates
    text.resize(filled);
    return std::optional<std::string>(std::move(text));
}

} // namespace sshkeep
