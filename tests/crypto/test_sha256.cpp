// DELAYPAY - SHA256 Tests
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include <gtest/gtest.h>
#include "delaypay/crypto/sha256.h"

#include <string>
#include <vector>

using namespace delaypay;

// ============================================================================
// NIST Test Vectors
// ============================================================================

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(std::string()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(std::string("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(SHA256Hash(std::string(
                  "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, MillionA) {
    SHA256 hasher;
    std::vector<Byte> chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) {
        hasher.Write(chunk.data(), chunk.size());
    }
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)).ToHex(),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::string msg = "The quick brown fox jumps over the lazy dog";
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(msg.data()), 10)
          .Write(reinterpret_cast<const Byte*>(msg.data()) + 10, msg.size() - 10);
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), SHA256Hash(msg));
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    Byte junk[4] = {1, 2, 3, 4};
    hasher.Write(junk, sizeof(junk));
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);

    hasher.Reset();
    hasher.Finalize(out);
    EXPECT_EQ(Hash256(out, sizeof(out)), SHA256Hash(std::string()));
}
