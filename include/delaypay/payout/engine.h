// DELAYPAY - Payout Engine
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// Turns a verified claim into exactly one transfer.
//
// The spend mark is made durable by the ledger before the transfer sink is
// invoked, and the sink runs outside the ledger lock. A claim for the same
// leaf made from inside the sink (or concurrently) therefore observes the
// leaf as spent and fails with ALREADY_CLAIMED.
//
// A failed transfer leaves the leaf spent and its payout AUTHORIZED; it is
// listed by ClaimLedger::GetPendingPayouts and can be re-driven with
// RetryPayout. Sinks receive the leaf as an idempotency key.

#ifndef DELAYPAY_PAYOUT_ENGINE_H
#define DELAYPAY_PAYOUT_ENGINE_H

#include "delaypay/core/claim.h"
#include "delaypay/core/merkle.h"
#include "delaypay/ledger/ledger.h"

#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace delaypay {
namespace payout {

// ============================================================================
// Transfer Sinks
// ============================================================================

/// Instruction handed to the asset-transfer side
struct PayoutAuthorization {
    /// Spent leaf; unique per payout
    Hash256 leaf;
    Address beneficiary;
    ClaimId claimId;
    Amount amount{0};

    std::string ToString() const;
};

/// Performs (or queues) the actual asset movement
class ITransferSink {
public:
    virtual ~ITransferSink() = default;

    /// @param error Receives a description on failure
    /// @return true once the transfer is confirmed
    virtual bool Transfer(const PayoutAuthorization& auth, std::string* error) = 0;
};

/// Adapts a function to ITransferSink
class CallbackTransferSink : public ITransferSink {
public:
    using Callback = std::function<bool(const PayoutAuthorization&, std::string*)>;

    explicit CallbackTransferSink(Callback callback) : callback_(std::move(callback)) {}

    bool Transfer(const PayoutAuthorization& auth, std::string* error) override;

private:
    Callback callback_;
};

/**
 * Appends one line per authorization to a journal file consumed by the
 * external transfer process:
 *
 *     payout <leaf> <beneficiary> <claim-id> <amount> <unix-time>
 *
 * A transfer is confirmed once its line is flushed.
 */
class JournalTransferSink : public ITransferSink {
public:
    explicit JournalTransferSink(const std::string& path);

    bool IsOpen() const;

    bool Transfer(const PayoutAuthorization& auth, std::string* error) override;

    const std::string& GetPath() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Payout Engine
// ============================================================================

struct ClaimResult {
    ClaimError error{ClaimError::OK};
    std::string message;

    Hash256 leaf;
    Amount amount{0};

    bool ok() const { return error == ClaimError::OK; }

    static ClaimResult Error(ClaimError err, const Hash256& leaf, const std::string& msg) {
        ClaimResult result;
        result.error = err;
        result.leaf = leaf;
        result.message = msg;
        return result;
    }
};

class PayoutEngine {
public:
    PayoutEngine(ledger::ClaimLedger& ledger, std::shared_ptr<ITransferSink> sink);

    /**
     * Verify, spend and pay a claim.
     *
     * Errors from the ledger are returned unchanged and no transfer is
     * attempted. TRANSFER_FAILED means the leaf is spent and the payout is
     * pending.
     */
    ClaimResult ClaimPayout(const Claim& claim, const MerkleProof& proof);

    /**
     * Re-drive the transfer of a pending payout.
     * @return UNKNOWN_PAYOUT for a leaf that was never spent,
     *         ALREADY_CLAIMED if the payout is issued or in progress
     */
    ClaimResult RetryPayout(const Hash256& leaf);

    /// Retry every pending payout; returns how many were issued
    size_t RetryPending();

private:
    ClaimResult Execute(const PayoutAuthorization& auth);

    ledger::ClaimLedger& ledger_;
    std::shared_ptr<ITransferSink> sink_;
};

} // namespace payout
} // namespace delaypay

#endif // DELAYPAY_PAYOUT_ENGINE_H
