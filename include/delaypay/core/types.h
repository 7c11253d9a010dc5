// DELAYPAY - Core Types Header
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// This file defines fundamental types used throughout DELAYPAY.

#ifndef DELAYPAY_CORE_TYPES_H
#define DELAYPAY_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstring>

namespace delaypay {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Payout quantity in the asset's smallest unit
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Get current Unix timestamp
inline Timestamp GetTime() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque byte string (hashes, addresses, identifiers)
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes; short input is zero-padded
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Byte-lexicographic order over the raw bytes (index 0 first).
    /// This is the canonical ordering used when combining Merkle siblings.
    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Lowercase hex of the raw bytes in storage order
    std::string ToHex() const;

    /// Parse hex (optional "0x" prefix, either case).
    /// @throws std::invalid_argument on wrong length or bad characters
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit value (20 bytes) - account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Account identifier of a beneficiary or an administrative caller
using Address = Hash160;

/// Identifier distinguishing claims of the same beneficiary (e.g. a policy)
using ClaimId = Hash256;

// ============================================================================
// Claim Errors
// ============================================================================

/// Typed failures of the commitment builder, the ledger and the payout engine
enum class ClaimError {
    OK = 0,

    // Builder errors
    INVALID_CLAIM,      ///< Claim field out of domain, malformed input
    EMPTY_BATCH,        ///< Commitment requested for zero claims

    // Verifier errors
    INVALID_PROOF,      ///< Proof does not reconstruct the committed root
    ALREADY_CLAIMED,    ///< Leaf already spent
    UNAUTHORIZED,       ///< Root change by a non-admin caller
    INVALID_ROOT,       ///< Null root offered for commitment
    STORAGE_ERROR,      ///< Durable write failed, state unchanged

    // Payout errors
    TRANSFER_FAILED,    ///< Leaf spent, transfer not confirmed (retryable)
    UNKNOWN_PAYOUT,     ///< No spend record for the leaf
};

/// Convert error to string
const char* ClaimErrorToString(ClaimError err);

} // namespace delaypay

#endif // DELAYPAY_CORE_TYPES_H
