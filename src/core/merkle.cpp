// DELAYPAY - Merkle Tree Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/core/merkle.h"
#include "delaypay/core/claim.h"
#include "delaypay/crypto/sha256.h"

#include <algorithm>
#include <cstring>

namespace delaypay {

// ============================================================================
// Helper Functions
// ============================================================================

Hash256 HashNode(const Hash256& a, const Hash256& b) {
    const Hash256& lo = (b < a) ? b : a;
    const Hash256& hi = (b < a) ? a : b;

    Byte combined[1 + 2 * Hash256::SIZE];
    combined[0] = NODE_TAG;
    std::memcpy(combined + 1, lo.data(), Hash256::SIZE);
    std::memcpy(combined + 1 + Hash256::SIZE, hi.data(), Hash256::SIZE);
    return SHA256Hash(combined, sizeof(combined));
}

namespace {

/// Combine one level into the next; a trailing odd node is promoted
std::vector<Hash256> NextLevel(const std::vector<Hash256>& level) {
    std::vector<Hash256> next;
    next.reserve((level.size() + 1) / 2);
    for (size_t i = 0; i + 1 < level.size(); i += 2) {
        next.push_back(HashNode(level[i], level[i + 1]));
    }
    if (level.size() & 1) {
        next.push_back(level.back());
    }
    return next;
}

/// Root implied by a leaf and its proof
Hash256 ComputeRootFromProof(const Hash256& leaf, const MerkleProof& proof) {
    Hash256 current = leaf;
    for (const Hash256& sibling : proof) {
        current = HashNode(current, sibling);
    }
    return current;
}

} // namespace

// ============================================================================
// Tree Construction
// ============================================================================

MerkleTreeResult BuildMerkleTree(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        return MerkleTreeResult::Error(ClaimError::EMPTY_BATCH,
                                       "cannot commit an empty batch");
    }

    std::sort(leaves.begin(), leaves.end());
    auto dup = std::adjacent_find(leaves.begin(), leaves.end());
    if (dup != leaves.end()) {
        return MerkleTreeResult::Error(ClaimError::INVALID_CLAIM,
                                       "duplicate leaf " + dup->ToHex());
    }

    // levels[0] holds the sorted leaves, levels.back() the root
    std::vector<std::vector<Hash256>> levels;
    levels.push_back(std::move(leaves));
    while (levels.back().size() > 1) {
        levels.push_back(NextLevel(levels.back()));
    }

    MerkleTreeResult result;
    result.root = levels.back()[0];

    const std::vector<Hash256>& base = levels[0];
    for (size_t i = 0; i < base.size(); ++i) {
        MerkleProof proof;
        size_t pos = i;
        for (size_t depth = 0; depth + 1 < levels.size(); ++depth) {
            const std::vector<Hash256>& level = levels[depth];
            size_t sibling = pos ^ 1;
            if (sibling < level.size()) {
                proof.push_back(level[sibling]);
            }
            pos /= 2;
        }
        result.proofs.emplace(base[i], std::move(proof));
    }

    return result;
}

Hash256 ComputeMerkleRoot(std::vector<Hash256> leaves) {
    if (leaves.empty()) {
        return Hash256();
    }

    std::sort(leaves.begin(), leaves.end());
    while (leaves.size() > 1) {
        leaves = NextLevel(leaves);
    }
    return leaves[0];
}

// ============================================================================
// Verification
// ============================================================================

bool VerifyMerkleProof(const Hash256& leaf, const MerkleProof& proof, const Hash256& root) {
    if (root.IsNull()) {
        return false;
    }
    return ComputeRootFromProof(leaf, proof) == root;
}

} // namespace delaypay
