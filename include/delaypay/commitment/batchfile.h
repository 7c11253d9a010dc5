// DELAYPAY - Batch Files
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// Text formats exchanged between the batch side and the ledger side.
//
// Claims file, one claim per line, '#' starts a comment:
//
//     <beneficiary-hex> <policy-id> <amount>
//
// The claim id is ClaimIdFromPolicy(policy-id).
//
// Commitment file:
//
//     root <root-hex>
//     claim <beneficiary-hex> <claim-id-hex> <amount> <leaf-hex> <proof>
//
// where <proof> is the comma-separated sibling hashes, or "-" if empty.

#ifndef DELAYPAY_COMMITMENT_BATCHFILE_H
#define DELAYPAY_COMMITMENT_BATCHFILE_H

#include "delaypay/commitment/builder.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace delaypay {
namespace commitment {

struct ClaimsParseResult {
    ClaimError error{ClaimError::OK};
    std::string message;
    std::vector<Claim> claims;

    bool ok() const { return error == ClaimError::OK; }

    static ClaimsParseResult Error(ClaimError err, const std::string& msg) {
        ClaimsParseResult result;
        result.error = err;
        result.message = msg;
        return result;
    }
};

// ============================================================================
// Claims Files
// ============================================================================

/// Parse claims text; malformed lines fail with INVALID_CLAIM naming the line
ClaimsParseResult ParseClaims(std::istream& in, const std::string& source = "<stream>");

ClaimsParseResult ParseClaimsFile(const std::string& path);

// ============================================================================
// Commitment Files
// ============================================================================

void WriteCommitment(std::ostream& out, const BatchCommitment& commitment);

/// @return false with error set if the file cannot be written
bool WriteCommitmentFile(const std::string& path, const BatchCommitment& commitment,
                         std::string* error = nullptr);

/**
 * Read a commitment back.
 *
 * Every leaf is recomputed from its claim and every proof is checked
 * against the root: a mismatch fails with INVALID_PROOF, a syntax error
 * with INVALID_CLAIM.
 */
CommitmentResult ReadCommitment(std::istream& in, const std::string& source = "<stream>");

CommitmentResult ReadCommitmentFile(const std::string& path);

// ============================================================================
// Proof Text
// ============================================================================

/// Comma-separated hex, "-" for an empty proof
std::string FormatProof(const MerkleProof& proof);

/// Inverse of FormatProof; also accepts an empty string as the empty proof
bool ParseProof(const std::string& text, MerkleProof& proof);

} // namespace commitment
} // namespace delaypay

#endif // DELAYPAY_COMMITMENT_BATCHFILE_H
