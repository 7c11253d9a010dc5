// DELAYPAY - Payout Claim Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/core/claim.h"
#include "delaypay/core/serialize.h"
#include "delaypay/crypto/sha256.h"

#include <limits>
#include <sstream>

namespace delaypay {

std::string Claim::ToString() const {
    std::ostringstream oss;
    oss << "Claim(beneficiary=" << beneficiary.ToHex()
        << ", claimId=" << claimId.ToHex()
        << ", amount=" << amount << ")";
    return oss.str();
}

ClaimId ClaimIdFromPolicy(const std::string& policyId) {
    return SHA256Hash(policyId);
}

std::vector<Byte> SerializeLeaf(const Claim& claim) {
    DataStream ss;
    ss.reserve(LEAF_ENCODING_SIZE);
    ss << LEAF_TAG << LEAF_ENCODING_VERSION
       << claim.beneficiary << claim.claimId << claim.amount;
    return ss.Data();
}

Hash256 EncodeLeaf(const Claim& claim) {
    return SHA256Hash(SerializeLeaf(claim));
}

bool CheckClaim(const Claim& claim, std::string* reason, Amount maxAmount) {
    auto reject = [reason](const char* why) {
        if (reason) *reason = why;
        return false;
    };

    if (claim.amount == 0) {
        return reject("amount must be greater than zero");
    }
    if (maxAmount != 0 && claim.amount > maxAmount) {
        return reject("amount exceeds configured maximum");
    }
    if (claim.beneficiary.IsNull()) {
        return reject("beneficiary is the null address");
    }
    if (claim.claimId.IsNull()) {
        return reject("claim id is null");
    }
    return true;
}

bool ParseAmount(const std::string& str, Amount& out) {
    if (str.empty() || str.size() > 20) {
        return false;
    }
    Amount value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        Amount digit = static_cast<Amount>(c - '0');
        if (value > (std::numeric_limits<Amount>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace delaypay
