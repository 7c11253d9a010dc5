// DELAYPAY - Payout Engine Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/payout/engine.h"
#include "delaypay/util/logging.h"

#include <sstream>
#include <stdexcept>

namespace delaypay {
namespace payout {

std::string PayoutAuthorization::ToString() const {
    std::ostringstream oss;
    oss << "Payout(leaf=" << leaf.ToHex()
        << ", beneficiary=" << beneficiary.ToHex()
        << ", amount=" << amount << ")";
    return oss.str();
}

// ============================================================================
// Transfer Sinks
// ============================================================================

bool CallbackTransferSink::Transfer(const PayoutAuthorization& auth, std::string* error) {
    if (!callback_) {
        if (error) *error = "no transfer callback";
        return false;
    }
    return callback_(auth, error);
}

JournalTransferSink::JournalTransferSink(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {
    if (!out_.is_open()) {
        LOG_ERROR(util::LogCategory::PAYOUT) << "Cannot open payout journal " << path_;
    }
}

bool JournalTransferSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return out_.is_open();
}

bool JournalTransferSink::Transfer(const PayoutAuthorization& auth, std::string* error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!out_.is_open()) {
        if (error) *error = "payout journal " + path_ + " is not open";
        return false;
    }

    out_ << "payout " << auth.leaf.ToHex() << ' ' << auth.beneficiary.ToHex()
         << ' ' << auth.claimId.ToHex() << ' ' << auth.amount
         << ' ' << GetTime() << '\n';
    out_.flush();
    if (!out_) {
        out_.clear();
        if (error) *error = "write to payout journal " + path_ + " failed";
        return false;
    }
    return true;
}

// ============================================================================
// Payout Engine
// ============================================================================

PayoutEngine::PayoutEngine(ledger::ClaimLedger& ledger, std::shared_ptr<ITransferSink> sink)
    : ledger_(ledger), sink_(std::move(sink)) {}

ClaimResult PayoutEngine::ClaimPayout(const Claim& claim, const MerkleProof& proof) {
    ledger::SpendResult spend = ledger_.VerifyAndSpend(claim, proof);
    if (!spend.ok()) {
        return ClaimResult::Error(spend.error, spend.leaf, spend.message);
    }

    PayoutAuthorization auth;
    auth.leaf = spend.leaf;
    auth.beneficiary = claim.beneficiary;
    auth.claimId = claim.claimId;
    auth.amount = claim.amount;
    return Execute(auth);
}

ClaimResult PayoutEngine::RetryPayout(const Hash256& leaf) {
    ledger::SpendRecord record;
    ClaimError err = ledger_.AcquirePayout(leaf, &record);
    if (err != ClaimError::OK) {
        return ClaimResult::Error(err, leaf, ClaimErrorToString(err));
    }

    PayoutAuthorization auth;
    auth.leaf = record.leaf;
    auth.beneficiary = record.claim.beneficiary;
    auth.claimId = record.claim.claimId;
    auth.amount = record.claim.amount;
    LOG_INFO(util::LogCategory::PAYOUT) << "Retrying " << auth.ToString();
    return Execute(auth);
}

size_t PayoutEngine::RetryPending() {
    size_t issued = 0;
    for (const ledger::SpendRecord& record : ledger_.GetPendingPayouts()) {
        if (RetryPayout(record.leaf).ok()) {
            ++issued;
        }
    }
    return issued;
}

ClaimResult PayoutEngine::Execute(const PayoutAuthorization& auth) {
    std::string error;
    bool transferred = false;
    if (!sink_) {
        error = "no transfer sink configured";
    } else {
        try {
            transferred = sink_->Transfer(auth, &error);
        } catch (const std::exception& e) {
            error = e.what();
        }
    }

    if (!transferred) {
        ledger_.ReleasePayout(auth.leaf);
        LOG_WARN(util::LogCategory::PAYOUT) << "Transfer failed for " << auth.ToString()
                                            << ": " << error << " (payout pending)";
        return ClaimResult::Error(ClaimError::TRANSFER_FAILED, auth.leaf,
                                  error.empty() ? "transfer failed" : error);
    }

    ClaimError err = ledger_.MarkPayoutIssued(auth.leaf);
    if (err != ClaimError::OK) {
        LOG_ERROR(util::LogCategory::PAYOUT) << "Transfer done but not recorded for "
            << auth.ToString() << ": " << ClaimErrorToString(err);
        return ClaimResult::Error(err, auth.leaf, "transfer confirmed but not recorded");
    }

    LOG_INFO(util::LogCategory::PAYOUT) << "Issued " << auth.ToString();
    ClaimResult result;
    result.leaf = auth.leaf;
    result.amount = auth.amount;
    return result;
}

} // namespace payout
} // namespace delaypay
