// DELAYPAY - Commitment Builder
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// Turns a batch of eligible claims into one Merkle root plus an inclusion
// proof per claim. The builder is pure and keeps no shared state, so any
// number of builds may run alongside the ledger.

#ifndef DELAYPAY_COMMITMENT_BUILDER_H
#define DELAYPAY_COMMITMENT_BUILDER_H

#include "delaypay/core/claim.h"
#include "delaypay/core/merkle.h"
#include "delaypay/core/types.h"

#include <string>
#include <vector>

namespace delaypay {
namespace commitment {

// ============================================================================
// Batch Commitment
// ============================================================================

/// One committed claim with everything a claimant needs to redeem it
struct CommitmentEntry {
    Claim claim;
    Hash256 leaf;
    MerkleProof proof;
};

/// Root and per-claim proofs of one batch, entries in input order
struct BatchCommitment {
    Hash256 root;
    std::vector<CommitmentEntry> entries;

    size_t size() const { return entries.size(); }
    bool empty() const { return entries.empty(); }

    /// @return The entry for leaf, or nullptr
    const CommitmentEntry* FindByLeaf(const Hash256& leaf) const;

    /// @return The entry carrying claimId, or nullptr
    const CommitmentEntry* FindByClaimId(const ClaimId& claimId) const;
};

struct CommitmentResult {
    ClaimError error{ClaimError::OK};
    std::string message;
    BatchCommitment commitment;

    bool ok() const { return error == ClaimError::OK; }

    static CommitmentResult Error(ClaimError err, const std::string& msg) {
        CommitmentResult result;
        result.error = err;
        result.message = msg;
        return result;
    }
};

// ============================================================================
// Commitment Builder
// ============================================================================

class CommitmentBuilder {
public:
    /// @param maxAmount Per-claim payout cap, 0 for none
    explicit CommitmentBuilder(Amount maxAmount = 0) : maxAmount_(maxAmount) {}

    /**
     * Commit a batch.
     *
     * Fails with EMPTY_BATCH for no claims and with INVALID_CLAIM when a
     * claim is out of domain or two claims encode to the same leaf. On
     * failure nothing is returned but the error.
     */
    CommitmentResult Build(const std::vector<Claim>& claims) const;

    Amount GetMaxAmount() const { return maxAmount_; }

private:
    Amount maxAmount_;
};

/// Check a claim's proof against root using the committed leaf encoding
bool VerifyClaim(const Claim& claim, const MerkleProof& proof, const Hash256& root);

} // namespace commitment
} // namespace delaypay

#endif // DELAYPAY_COMMITMENT_BUILDER_H
