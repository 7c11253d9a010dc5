// DELAYPAY - Core Types Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/core/types.h"
#include "delaypay/core/hex.h"

namespace delaypay {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: expected " +
                                    std::to_string(SIZE * 2) + " digits");
    }

    std::vector<Byte> bytes = HexToBytes(digits);

    BaseHash result;
    std::memcpy(result.data_.data(), bytes.data(), SIZE);
    return result;
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// ClaimError Implementation
// ============================================================================

const char* ClaimErrorToString(ClaimError err) {
    switch (err) {
        case ClaimError::OK: return "OK";

        case ClaimError::INVALID_CLAIM: return "Invalid claim";
        case ClaimError::EMPTY_BATCH: return "Empty batch";

        case ClaimError::INVALID_PROOF: return "Invalid proof";
        case ClaimError::ALREADY_CLAIMED: return "Already claimed";
        case ClaimError::UNAUTHORIZED: return "Unauthorized";
        case ClaimError::INVALID_ROOT: return "Invalid root";
        case ClaimError::STORAGE_ERROR: return "Storage error";

        case ClaimError::TRANSFER_FAILED: return "Transfer failed";
        case ClaimError::UNKNOWN_PAYOUT: return "Unknown payout";

        default: return "Unknown error";
    }
}

} // namespace delaypay
