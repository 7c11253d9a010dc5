// DELAYPAY - Claim Ledger
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// The authoritative side of the payout flow. The ledger owns the committed
// root and the spent-set, and is the only component that may change either.
//
// Guarantees:
// - A leaf is marked spent at most once, and never unmarked.
// - The spend mark reaches durable storage before VerifyAndSpend returns
//   success, so no payout can be authorized for a leaf that a restart
//   would forget.
// - Check, verify and mark happen under one lock; SetRoot takes the same
//   lock and is therefore serialized with every verification.
// - Exactly one root is valid at a time. Proofs built for an earlier root
//   fail with INVALID_PROOF once the root changes.

#ifndef DELAYPAY_LEDGER_LEDGER_H
#define DELAYPAY_LEDGER_LEDGER_H

#include "delaypay/core/claim.h"
#include "delaypay/core/merkle.h"
#include "delaypay/core/serialize.h"
#include "delaypay/core/types.h"
#include "delaypay/db/database.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace delaypay {
namespace ledger {

// ============================================================================
// Records
// ============================================================================

/// Serialization version of ledger records
constexpr uint8_t LEDGER_RECORD_VERSION = 1;

/// Payout progress of a spent leaf
enum class PayoutState : uint8_t {
    AUTHORIZED = 1,   ///< Spent; transfer not confirmed yet
    ISSUED = 2,       ///< Spent; transfer confirmed
};

const char* PayoutStateToString(PayoutState state);

/// The currently committed root
struct RootRecord {
    Hash256 root;

    /// Incremented on every SetRoot; 0 means no root was ever committed
    uint64_t batchId{0};

    Timestamp committedAt{0};

    bool IsNull() const { return root.IsNull(); }
};

/// Durable record of one spent leaf
struct SpendRecord {
    Hash256 leaf;
    Claim claim;

    /// Root the proof was verified against
    Hash256 root;
    uint64_t batchId{0};

    Timestamp spentAt{0};
    PayoutState state{PayoutState::AUTHORIZED};
};

template<typename Stream>
void Serialize(Stream& s, const RootRecord& r) {
    s << LEDGER_RECORD_VERSION << r.root << r.batchId << r.committedAt;
}

template<typename Stream>
void Unserialize(Stream& s, RootRecord& r) {
    uint8_t version;
    s >> version;
    if (version != LEDGER_RECORD_VERSION) {
        throw std::ios_base::failure("unknown root record version");
    }
    s >> r.root >> r.batchId >> r.committedAt;
}

template<typename Stream>
void Serialize(Stream& s, const SpendRecord& r) {
    s << LEDGER_RECORD_VERSION << r.leaf
      << r.claim.beneficiary << r.claim.claimId << r.claim.amount
      << r.root << r.batchId << r.spentAt << static_cast<uint8_t>(r.state);
}

template<typename Stream>
void Unserialize(Stream& s, SpendRecord& r) {
    uint8_t version;
    s >> version;
    if (version != LEDGER_RECORD_VERSION) {
        throw std::ios_base::failure("unknown spend record version");
    }
    uint8_t state;
    s >> r.leaf >> r.claim.beneficiary >> r.claim.claimId >> r.claim.amount
      >> r.root >> r.batchId >> r.spentAt >> state;
    if (state != static_cast<uint8_t>(PayoutState::AUTHORIZED) &&
        state != static_cast<uint8_t>(PayoutState::ISSUED)) {
        throw std::ios_base::failure("invalid payout state");
    }
    r.state = static_cast<PayoutState>(state);
}

// ============================================================================
// Authorization
// ============================================================================

/// Decides who may change the committed root
class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;
    virtual bool IsAuthorized(const Address& caller) const = 0;
};

/// Accepts a fixed set of administrator addresses
class AdminAuthorizer : public IAuthorizer {
public:
    AdminAuthorizer() = default;
    explicit AdminAuthorizer(std::set<Address> admins) : admins_(std::move(admins)) {}

    bool IsAuthorized(const Address& caller) const override {
        return !caller.IsNull() && admins_.count(caller) != 0;
    }

    void AddAdmin(const Address& admin) { admins_.insert(admin); }
    size_t size() const { return admins_.size(); }

private:
    std::set<Address> admins_;
};

// ============================================================================
// Ledger
// ============================================================================

struct SpendResult {
    ClaimError error{ClaimError::OK};
    std::string message;

    /// Leaf that was spent (also set on ALREADY_CLAIMED and INVALID_PROOF)
    Hash256 leaf;

    bool ok() const { return error == ClaimError::OK; }

    static SpendResult Error(ClaimError err, const Hash256& leaf, const std::string& msg) {
        SpendResult result;
        result.error = err;
        result.leaf = leaf;
        result.message = msg;
        return result;
    }
};

class ClaimLedger {
public:
    /**
     * @param db Backing store; the ledger takes ownership
     * @param authorizer Gate for SetRoot; a null authorizer rejects everyone
     */
    ClaimLedger(std::unique_ptr<db::Database> db, std::shared_ptr<const IAuthorizer> authorizer);

    ClaimLedger(const ClaimLedger&) = delete;
    ClaimLedger& operator=(const ClaimLedger&) = delete;

    /// Restore the root register and spent-set from the database
    db::Status Load();

    // ========================================================================
    // Root Register
    // ========================================================================

    /**
     * Commit a new root.
     *
     * The root register and the batch's archive record are written in one
     * atomic batch.
     *
     * @return UNAUTHORIZED if caller is rejected (nothing is touched),
     *         INVALID_ROOT for a null root, STORAGE_ERROR if the write
     *         fails, OK otherwise
     */
    ClaimError SetRoot(const Address& caller, const Hash256& newRoot);

    RootRecord GetRoot() const;

    /**
     * Every root ever committed, oldest first. Audit only: proofs are
     * checked against GetRoot() alone.
     */
    std::vector<RootRecord> GetRootHistory() const;

    // ========================================================================
    // Claims
    // ========================================================================

    /**
     * Verify a claim against the committed root and mark its leaf spent.
     *
     * ALREADY_CLAIMED takes precedence over INVALID_PROOF. On success the
     * spend record is durable and the leaf is leased for payout, see
     * AcquirePayout.
     */
    SpendResult VerifyAndSpend(const Claim& claim, const MerkleProof& proof);

    bool IsSpent(const Hash256& leaf) const;

    size_t SpentCount() const;

    std::optional<SpendRecord> GetSpendRecord(const Hash256& leaf) const;

    /// Spend records whose transfer is not confirmed, oldest first
    std::vector<SpendRecord> GetPendingPayouts() const;

    // ========================================================================
    // Payout Leases
    // ========================================================================

    /**
     * Lease an AUTHORIZED leaf for a transfer attempt.
     *
     * @return UNKNOWN_PAYOUT if the leaf was never spent, ALREADY_CLAIMED
     *         if its payout is issued or another attempt holds the lease
     */
    ClaimError AcquirePayout(const Hash256& leaf, SpendRecord* record = nullptr);

    /// Drop the lease after a failed transfer; the leaf stays AUTHORIZED
    void ReleasePayout(const Hash256& leaf);

    /**
     * Record a confirmed transfer and drop the lease.
     * If the write fails the lease is kept so the leaf cannot be paid
     * twice by this process.
     */
    ClaimError MarkPayoutIssued(const Hash256& leaf);

private:
    db::Status WriteSpend(const SpendRecord& record);

    std::unique_ptr<db::Database> db_;
    std::shared_ptr<const IAuthorizer> authorizer_;

    mutable std::mutex mutex_;
    RootRecord root_;
    std::map<Hash256, PayoutState> spent_;
    std::set<Hash256> leased_;
};

} // namespace ledger
} // namespace delaypay

#endif // DELAYPAY_LEDGER_LEDGER_H
