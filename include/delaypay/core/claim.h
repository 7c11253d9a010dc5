// DELAYPAY - Payout Claim Header
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// A claim is one eligible payout: (beneficiary, claimId, amount).
// Its leaf hash is the only representation the Merkle tree and the ledger
// ever see, so the leaf encoding below is a frozen, versioned contract.
// Changing it invalidates every issued proof and requires a full batch
// rebuild plus a new root.

#ifndef DELAYPAY_CORE_CLAIM_H
#define DELAYPAY_CORE_CLAIM_H

#include "delaypay/core/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace delaypay {

// ============================================================================
// Leaf Encoding Constants
// ============================================================================

/// Domain tag prefixed to leaf preimages
constexpr uint8_t LEAF_TAG = 0x00;

/// Domain tag prefixed to interior node preimages
constexpr uint8_t NODE_TAG = 0x01;

/// Leaf encoding version (v1: tag | version | beneficiary | claimId | amount)
constexpr uint8_t LEAF_ENCODING_VERSION = 0x01;

/// Size of a v1 leaf preimage in bytes
constexpr size_t LEAF_ENCODING_SIZE = 1 + 1 + Address::SIZE + ClaimId::SIZE + 8;

// ============================================================================
// Claim
// ============================================================================

/// One eligible payout
struct Claim {
    /// Account receiving the payout
    Address beneficiary;

    /// Distinguishes claims of the same beneficiary (policy identifier)
    ClaimId claimId;

    /// Payout in the asset's smallest unit
    Amount amount{0};

    Claim() = default;
    Claim(const Address& who, const ClaimId& id, Amount value)
        : beneficiary(who), claimId(id), amount(value) {}

    bool operator==(const Claim& other) const {
        return beneficiary == other.beneficiary &&
               claimId == other.claimId &&
               amount == other.amount;
    }

    bool operator!=(const Claim& other) const { return !(*this == other); }

    std::string ToString() const;
};

/// Derive a fixed-width claim identifier from a policy identifier string
ClaimId ClaimIdFromPolicy(const std::string& policyId);

/// Canonical v1 leaf preimage (LEAF_ENCODING_SIZE bytes)
std::vector<Byte> SerializeLeaf(const Claim& claim);

/// Leaf hash: SHA256(SerializeLeaf(claim))
Hash256 EncodeLeaf(const Claim& claim);

/// Check that every field is inside its domain.
/// Zero amounts, null beneficiaries and null claim ids are rejected, as is
/// any amount above maxAmount when maxAmount is non-zero.
/// @param reason If not null, receives the rejection reason
bool CheckClaim(const Claim& claim, std::string* reason = nullptr, Amount maxAmount = 0);

/// Parse a decimal amount (digits only, must fit in 64 bits)
bool ParseAmount(const std::string& str, Amount& out);

} // namespace delaypay

#endif // DELAYPAY_CORE_CLAIM_H
