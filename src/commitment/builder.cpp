// DELAYPAY - Commitment Builder Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/commitment/builder.h"
#include "delaypay/util/logging.h"

namespace delaypay {
namespace commitment {

const CommitmentEntry* BatchCommitment::FindByLeaf(const Hash256& leaf) const {
    for (const CommitmentEntry& entry : entries) {
        if (entry.leaf == leaf) {
            return &entry;
        }
    }
    return nullptr;
}

const CommitmentEntry* BatchCommitment::FindByClaimId(const ClaimId& claimId) const {
    for (const CommitmentEntry& entry : entries) {
        if (entry.claim.claimId == claimId) {
            return &entry;
        }
    }
    return nullptr;
}

CommitmentResult CommitmentBuilder::Build(const std::vector<Claim>& claims) const {
    util::ScopedLogTimer timer(util::LogCategory::MERKLE, "commitment build");

    if (claims.empty()) {
        LOG_WARN(util::LogCategory::MERKLE) << "Refusing to commit an empty batch";
        return CommitmentResult::Error(ClaimError::EMPTY_BATCH,
                                       "cannot commit an empty batch");
    }

    std::vector<Hash256> leaves;
    leaves.reserve(claims.size());
    for (size_t i = 0; i < claims.size(); ++i) {
        std::string reason;
        if (!CheckClaim(claims[i], &reason, maxAmount_)) {
            LOG_WARN(util::LogCategory::MERKLE) << "Rejected claim #" << i << ": " << reason;
            return CommitmentResult::Error(ClaimError::INVALID_CLAIM,
                                           "claim #" + std::to_string(i) + ": " + reason);
        }
        leaves.push_back(EncodeLeaf(claims[i]));
    }

    MerkleTreeResult tree = BuildMerkleTree(leaves);
    if (!tree.ok()) {
        LOG_WARN(util::LogCategory::MERKLE) << "Tree construction failed: " << tree.message;
        return CommitmentResult::Error(tree.error, tree.message);
    }

    CommitmentResult result;
    result.commitment.root = tree.root;
    result.commitment.entries.reserve(claims.size());
    for (size_t i = 0; i < claims.size(); ++i) {
        CommitmentEntry entry;
        entry.claim = claims[i];
        entry.leaf = leaves[i];
        entry.proof = tree.proofs.at(leaves[i]);
        result.commitment.entries.push_back(std::move(entry));
    }

    LogInfoF(util::LogCategory::MERKLE, "Committed %zu claims under root %s",
             claims.size(), tree.root.ToHex().c_str());
    return result;
}

bool VerifyClaim(const Claim& claim, const MerkleProof& proof, const Hash256& root) {
    return VerifyMerkleProof(EncodeLeaf(claim), proof, root);
}

} // namespace commitment
} // namespace delaypay
