/**
 * @file test_key_wipe.cpp
 * @brief Private key text must not survive in released heap memory
 *
 * Tests:
 * - Fingerprinting an OpenSSH private key frees no block still holding key text
 * - The secret file reader leaves nothing behind once its result is wiped
 *
 * Replaces the global allocator to inspect every block as it is freed, so
 * it is built as its own test executable.
 */

#include <gtest/gtest.h>
#include "sshkeep/fingerprint_index.hpp"
#include "sshkeep/key_codec.hpp"
#include "test_fakes.hpp"
#include "test_keys.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <new>
#include <string>

namespace {

// Every block carries its size in a header ahead of the user pointer
constexpr std::size_t HEADER_SIZE = alignof(std::max_align_t) > sizeof(std::size_t)
    ? alignof(std::max_align_t) : sizeof(std::size_t);

std::atomic<bool> g_inspecting{false};
std::atomic<int> g_leaked_blocks{0};
char g_marker[64] = {0};
std::size_t g_marker_length = 0;

void* allocate(std::size_t size) {
    void* base = std::malloc(size + HEADER_SIZE);
    if (base == nullptr) {
        return nullptr;
    }
    *static_cast<std::size_t*>(base) = size;
    return static_cast<char*>(base) + HEADER_SIZE;
}

void release(void* ptr) noexcept {
    if (ptr == nullptr) {
        return;
    }

    char* base = static_cast<char*>(ptr) - HEADER_SIZE;
    std::size_t size = *reinterpret_cast<std::size_t*>(base);

    if (g_inspecting.load() && g_marker_length > 0 && size >= g_marker_length) {
        const char* begin = static_cast<const char*>(ptr);
        const char* end = begin + size;
        if (std::search(begin, end, g_marker, g_marker + g_marker_length) != end) {
            ++g_leaked_blocks;
        }
    }

    std::free(base);
}

}

void* operator new(std::size_t size) {
    void* p = allocate(size);
    if (p == nullptr) {
        throw std::bad_alloc();
    }
    return p;
}

void* operator new[](std::size_t size) {
    return operator new(size);
}

void* operator new(std::size_t size, const std::nothrow_t&) noexcept {
    return allocate(size);
}

void* operator new[](std::size_t size, const std::nothrow_t&) noexcept {
    return allocate(size);
}

void operator delete(void* ptr) noexcept { release(ptr); }
void operator delete[](void* ptr) noexcept { release(ptr); }
void operator delete(void* ptr, std::size_t) noexcept { release(ptr); }
void operator delete[](void* ptr, std::size_t) noexcept { release(ptr); }
void operator delete(void* ptr, const std::nothrow_t&) noexcept { release(ptr); }
void operator delete[](void* ptr, const std::nothrow_t&) noexcept { release(ptr); }

using namespace sshkeep;
using namespace sshkeep::testing_fakes;
using namespace sshkeep::testing_keys;
namespace fs = std::filesystem;

class KeyWipeTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(KeyCodec::initialize());

        test_dir_ = scratch_directory("sshkeep_wipe");
        key_path_ = test_dir_ / "id_ed25519";

        std::string key_text = make_openssh_private_key(make_ed25519_blob(21));
        write_text(key_path_, key_text);

        // First base64 line of the PEM body: present in every copy of the key text
        auto body_start = key_text.find('\n') + 1;
        std::string marker = key_text.substr(body_start, 40);
        ASSERT_LT(marker.size(), sizeof(g_marker));
        std::memcpy(g_marker, marker.data(), marker.size());
        g_marker_length = marker.size();

        g_leaked_blocks = 0;
    }

    void TearDown() override {
        g_inspecting = false;
        g_marker_length = 0;
        remove_scratch_directory(test_dir_);
    }

    fs::path test_dir_;
    fs::path key_path_;
};

TEST_F(KeyWipeTest, SecretReaderLeavesNoCopies) {
    g_inspecting = true;
    {
        auto text = KeyCodec::read_secret_file(key_path_);
        ASSERT_TRUE(text.has_value());
        EXPECT_NE(text->find("OPENSSH PRIVATE KEY"), std::string::npos);
        KeyCodec::secure_clear(*text);
    }
    g_inspecting = false;

    EXPECT_EQ(g_leaked_blocks.load(), 0);
}

TEST_F(KeyWipeTest, FingerprintingPrivateKeyLeavesNoCopies) {
    FakeAgentConnection agent;
    ScriptedRunner runner;
    FingerprintIndex index(agent, runner);

    g_inspecting = true;
    KeyFingerprint fingerprint = index.fingerprint_of(key_path_);
    g_inspecting = false;

    EXPECT_EQ(fingerprint, *KeyCodec::fingerprint_of_blob(make_ed25519_blob(21)));
    EXPECT_EQ(g_leaked_blocks.load(), 0);
}

TEST_F(KeyWipeTest, MarkerIsDetectedInUnwipedBlocks) {
    g_inspecting = true;
    {
        std::string copy;
        copy.reserve(128);
        copy.append(g_marker, g_marker_length);
    }
    g_inspecting = false;

    EXPECT_EQ(g_leaked_blocks.load(), 1);
}
