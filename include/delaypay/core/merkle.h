// DELAYPAY - Merkle Tree Header
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// Sorted-pair Merkle tree over claim leaves.
//
// Construction rules:
// - Leaves are sorted byte-lexicographically before pairing, so the root
//   depends only on the set of leaves, never on their input order.
// - Siblings are ordered (smaller first) before hashing with NODE_TAG, so
//   proofs carry no left/right flags.
// - An odd node at the end of a level is promoted unchanged to the next
//   level and contributes no sibling to proofs at that level.
// - A single leaf is its own root and has an empty proof.

#ifndef DELAYPAY_CORE_MERKLE_H
#define DELAYPAY_CORE_MERKLE_H

#include "delaypay/core/types.h"
#include <map>
#include <string>
#include <vector>

namespace delaypay {

/// Ordered sibling hashes from a leaf up to the root
using MerkleProof = std::vector<Hash256>;

// ============================================================================
// Tree Construction
// ============================================================================

/// Result of building a tree over a list of leaves
struct MerkleTreeResult {
    ClaimError error{ClaimError::OK};
    std::string message;

    /// Root of the tree (null on failure)
    Hash256 root;

    /// Proof for every distinct input leaf
    std::map<Hash256, MerkleProof> proofs;

    bool ok() const { return error == ClaimError::OK; }

    static MerkleTreeResult Error(ClaimError err, const std::string& msg) {
        MerkleTreeResult result;
        result.error = err;
        result.message = msg;
        return result;
    }
};

/// Build the tree and every leaf's proof.
///
/// @param leaves Leaf hashes in any order
/// @return EMPTY_BATCH for no leaves, INVALID_CLAIM for a repeated leaf,
///         otherwise the root and one proof per leaf
MerkleTreeResult BuildMerkleTree(std::vector<Hash256> leaves);

/// Compute only the root. Pairing rules match BuildMerkleTree, but repeated
/// leaves are not rejected.
/// @return The root, or a null hash if leaves is empty
Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves);

// ============================================================================
// Verification
// ============================================================================

/// Check a proof against an expected root.
/// A null root never verifies.
bool VerifyMerkleProof(const Hash256& leaf, const MerkleProof& proof, const Hash256& root);

// ============================================================================
// Helper Functions
// ============================================================================

/// SHA256(NODE_TAG || min(a, b) || max(a, b))
Hash256 HashNode(const Hash256& a, const Hash256& b);

} // namespace delaypay

#endif // DELAYPAY_CORE_MERKLE_H
