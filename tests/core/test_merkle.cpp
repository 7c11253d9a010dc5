// DELAYPAY - Merkle Tree Tests
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include <gtest/gtest.h>
#include "delaypay/core/claim.h"
#include "delaypay/core/merkle.h"
#include "delaypay/crypto/sha256.h"

#include <algorithm>
#include <cstring>
#include <vector>

using namespace delaypay;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

// Distinct pseudo-random leaf per n; sorted order differs from input order
Hash256 MakeHash(uint64_t n) {
    return SHA256Hash(std::string("leaf-") + std::to_string(n));
}

std::vector<Hash256> MakeLeaves(size_t count) {
    std::vector<Hash256> leaves;
    for (size_t i = 0; i < count; ++i) {
        leaves.push_back(MakeHash(i));
    }
    return leaves;
}

} // namespace

// ============================================================================
// Node Hashing
// ============================================================================

TEST(MerkleTest, HashNodeIsCommutative) {
    Hash256 a = MakeHash(1);
    Hash256 b = MakeHash(2);
    EXPECT_EQ(HashNode(a, b), HashNode(b, a));
}

TEST(MerkleTest, HashNodeIsTaggedAndOrdered) {
    Hash256 a = MakeHash(1);
    Hash256 b = MakeHash(2);
    const Hash256& lo = (a < b) ? a : b;
    const Hash256& hi = (a < b) ? b : a;

    std::vector<Byte> preimage;
    preimage.push_back(NODE_TAG);
    preimage.insert(preimage.end(), lo.begin(), lo.end());
    preimage.insert(preimage.end(), hi.begin(), hi.end());
    EXPECT_EQ(HashNode(a, b), SHA256Hash(preimage));
}

// ============================================================================
// Tree Construction
// ============================================================================

TEST(MerkleTest, EmptyBatchRejected) {
    MerkleTreeResult result = BuildMerkleTree({});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error, ClaimError::EMPTY_BATCH);
    EXPECT_TRUE(ComputeMerkleRoot({}).IsNull());
}

TEST(MerkleTest, DuplicateLeafRejected) {
    std::vector<Hash256> leaves = {MakeHash(1), MakeHash(2), MakeHash(1)};
    MerkleTreeResult result = BuildMerkleTree(leaves);
    EXPECT_EQ(result.error, ClaimError::INVALID_CLAIM);
}

TEST(MerkleTest, SingleLeafIsRoot) {
    Hash256 leaf = MakeHash(7);
    MerkleTreeResult result = BuildMerkleTree({leaf});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.root, leaf);
    ASSERT_EQ(result.proofs.count(leaf), 1u);
    EXPECT_TRUE(result.proofs.at(leaf).empty());
    EXPECT_TRUE(VerifyMerkleProof(leaf, {}, result.root));
}

TEST(MerkleTest, TwoLeaves) {
    Hash256 a = MakeHash(1);
    Hash256 b = MakeHash(2);
    MerkleTreeResult result = BuildMerkleTree({a, b});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.root, HashNode(a, b));
    EXPECT_EQ(result.proofs.at(a), MerkleProof{b});
    EXPECT_EQ(result.proofs.at(b), MerkleProof{a});
}

TEST(MerkleTest, OddNodeIsPromoted) {
    std::vector<Hash256> leaves = MakeLeaves(3);
    std::vector<Hash256> sorted = leaves;
    std::sort(sorted.begin(), sorted.end());

    MerkleTreeResult result = BuildMerkleTree(leaves);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.root, HashNode(HashNode(sorted[0], sorted[1]), sorted[2]));

    // The promoted leaf has a single sibling: the pair above it
    EXPECT_EQ(result.proofs.at(sorted[2]), MerkleProof{HashNode(sorted[0], sorted[1])});
    EXPECT_EQ(result.proofs.at(sorted[0]).size(), 2u);
}

TEST(MerkleTest, OddCountDiffersFromDuplicatedLast) {
    std::vector<Hash256> three = MakeLeaves(3);
    std::vector<Hash256> sorted = three;
    std::sort(sorted.begin(), sorted.end());
    Hash256 duplicated = HashNode(HashNode(sorted[0], sorted[1]),
                                  HashNode(sorted[2], sorted[2]));
    EXPECT_NE(ComputeMerkleRoot(three), duplicated);
}

TEST(MerkleTest, RootIsOrderIndependent) {
    std::vector<Hash256> leaves = MakeLeaves(11);
    Hash256 root = ComputeMerkleRoot(leaves);

    std::reverse(leaves.begin(), leaves.end());
    EXPECT_EQ(ComputeMerkleRoot(leaves), root);

    std::rotate(leaves.begin(), leaves.begin() + 4, leaves.end());
    EXPECT_EQ(BuildMerkleTree(leaves).root, root);
}

TEST(MerkleTest, BuildAndComputeAgree) {
    for (size_t n = 1; n <= 9; ++n) {
        std::vector<Hash256> leaves = MakeLeaves(n);
        EXPECT_EQ(BuildMerkleTree(leaves).root, ComputeMerkleRoot(leaves)) << "n=" << n;
    }
}

TEST(MerkleTest, EveryProofVerifies) {
    for (size_t n = 1; n <= 17; ++n) {
        std::vector<Hash256> leaves = MakeLeaves(n);
        MerkleTreeResult result = BuildMerkleTree(leaves);
        ASSERT_TRUE(result.ok());
        ASSERT_EQ(result.proofs.size(), n);
        for (const Hash256& leaf : leaves) {
            EXPECT_TRUE(VerifyMerkleProof(leaf, result.proofs.at(leaf), result.root))
                << "n=" << n;
        }
    }
}

// ============================================================================
// Verification
// ============================================================================

TEST(MerkleTest, ProofForOtherLeafFails) {
    std::vector<Hash256> leaves = MakeLeaves(6);
    MerkleTreeResult result = BuildMerkleTree(leaves);
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(VerifyMerkleProof(leaves[0], result.proofs.at(leaves[1]), result.root));
}

TEST(MerkleTest, NonMemberFails) {
    MerkleTreeResult result = BuildMerkleTree(MakeLeaves(5));
    ASSERT_TRUE(result.ok());
    Hash256 outsider = MakeHash(99);
    for (const auto& entry : result.proofs) {
        EXPECT_FALSE(VerifyMerkleProof(outsider, entry.second, result.root));
    }
}

TEST(MerkleTest, SingleBitFlipInProofFails) {
    std::vector<Hash256> leaves = MakeLeaves(7);
    MerkleTreeResult result = BuildMerkleTree(leaves);
    ASSERT_TRUE(result.ok());

    for (const Hash256& leaf : leaves) {
        const MerkleProof& proof = result.proofs.at(leaf);
        for (size_t i = 0; i < proof.size(); ++i) {
            for (size_t byte = 0; byte < Hash256::SIZE; ++byte) {
                MerkleProof tampered = proof;
                tampered[i][byte] ^= 0x01;
                EXPECT_FALSE(VerifyMerkleProof(leaf, tampered, result.root));
            }
        }
    }
}

TEST(MerkleTest, TruncatedOrExtendedProofFails) {
    std::vector<Hash256> leaves = MakeLeaves(8);
    MerkleTreeResult result = BuildMerkleTree(leaves);
    ASSERT_TRUE(result.ok());

    MerkleProof proof = result.proofs.at(leaves[0]);
    MerkleProof shorter(proof.begin(), proof.end() - 1);
    EXPECT_FALSE(VerifyMerkleProof(leaves[0], shorter, result.root));

    MerkleProof longer = proof;
    longer.push_back(MakeHash(42));
    EXPECT_FALSE(VerifyMerkleProof(leaves[0], longer, result.root));
}

TEST(MerkleTest, NullRootNeverVerifies) {
    EXPECT_FALSE(VerifyMerkleProof(Hash256(), {}, Hash256()));
}
