// DELAYPAY - Claim Ledger Implementation
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include "delaypay/ledger/ledger.h"
#include "delaypay/util/logging.h"

#include <algorithm>

namespace delaypay {
namespace ledger {

const char* PayoutStateToString(PayoutState state) {
    switch (state) {
        case PayoutState::AUTHORIZED: return "authorized";
        case PayoutState::ISSUED: return "issued";
    }
    return "unknown";
}

namespace {

db::WriteOptions SyncWrite() {
    db::WriteOptions options;
    options.sync = true;
    return options;
}

std::string RootKey() {
    return db::MakeKey(db::prefix::ROOT);
}

std::string SpendKey(const Hash256& leaf) {
    return db::MakeKey(db::prefix::SPENT, leaf);
}

std::string BatchKey(uint64_t batchId) {
    return db::MakeKey(db::prefix::BATCH, batchId);
}

} // namespace

ClaimLedger::ClaimLedger(std::unique_ptr<db::Database> db,
                         std::shared_ptr<const IAuthorizer> authorizer)
    : db_(std::move(db)), authorizer_(std::move(authorizer)) {}

db::Status ClaimLedger::Load() {
    std::lock_guard<std::mutex> lock(mutex_);

    RootRecord root;
    std::string value;
    db::Status s = db_->Get(RootKey(), &value);
    if (s.ok()) {
        if (!db::DeserializeFromString(value, root)) {
            return db::Status::Corruption("unreadable root record");
        }
    } else if (!s.IsNotFound()) {
        return s;
    }

    std::map<Hash256, PayoutState> spent;
    const std::string spentPrefix = db::MakeKey(db::prefix::SPENT);
    auto it = db_->NewIterator();
    for (it->Seek(spentPrefix); it->Valid() && it->key().starts_with(spentPrefix); it->Next()) {
        SpendRecord record;
        if (!db::DeserializeFromString(it->value().ToString(), record)) {
            return db::Status::Corruption("unreadable spend record");
        }
        if (SpendKey(record.leaf) != it->key().ToString()) {
            return db::Status::Corruption("spend record stored under the wrong key");
        }
        spent[record.leaf] = record.state;
    }
    if (!it->status().ok()) {
        return it->status();
    }

    root_ = root;
    spent_ = std::move(spent);
    leased_.clear();

    size_t pending = std::count_if(spent_.begin(), spent_.end(),
        [](const std::pair<const Hash256, PayoutState>& e) {
            return e.second == PayoutState::AUTHORIZED;
        });
    LOG_INFO(util::LogCategory::LEDGER) << "Loaded ledger: batch " << root_.batchId
        << ", " << spent_.size() << " spent leaves, " << pending << " pending payouts";
    return db::Status::Ok();
}

// ============================================================================
// Root Register
// ============================================================================

ClaimError ClaimLedger::SetRoot(const Address& caller, const Hash256& newRoot) {
    if (!authorizer_ || !authorizer_->IsAuthorized(caller)) {
        LOG_WARN(util::LogCategory::LEDGER) << "Rejected root change by " << caller.ToHex();
        return ClaimError::UNAUTHORIZED;
    }
    if (newRoot.IsNull()) {
        return ClaimError::INVALID_ROOT;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    RootRecord next;
    next.root = newRoot;
    next.batchId = root_.batchId + 1;
    next.committedAt = GetTime();

    // Register and archive entry land together or not at all
    const std::string encoded = db::SerializeToString(next);
    db::WriteBatch batch;
    batch.Put(RootKey(), encoded);
    batch.Put(BatchKey(next.batchId), encoded);
    db::Status s = db_->Write(SyncWrite(), &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Failed to persist root: " << s.ToString();
        return ClaimError::STORAGE_ERROR;
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Root " << root_.root.ToHex() << " -> "
        << newRoot.ToHex() << " (batch " << next.batchId << ") by " << caller.ToHex();
    root_ = next;
    return ClaimError::OK;
}

RootRecord ClaimLedger::GetRoot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return root_;
}

std::vector<RootRecord> ClaimLedger::GetRootHistory() const {
    std::vector<RootRecord> history;
    const std::string batchPrefix = db::MakeKey(db::prefix::BATCH);
    auto it = db_->NewIterator();
    for (it->Seek(batchPrefix); it->Valid() && it->key().starts_with(batchPrefix); it->Next()) {
        RootRecord record;
        if (!db::DeserializeFromString(it->value().ToString(), record)) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Skipping unreadable batch record";
            continue;
        }
        history.push_back(record);
    }
    // Keys hold the id little-endian, so store order is not numeric order
    std::sort(history.begin(), history.end(),
              [](const RootRecord& a, const RootRecord& b) { return a.batchId < b.batchId; });
    return history;
}

// ============================================================================
// Claims
// ============================================================================

db::Status ClaimLedger::WriteSpend(const SpendRecord& record) {
    return db_->Put(SyncWrite(), SpendKey(record.leaf), db::SerializeToString(record));
}

SpendResult ClaimLedger::VerifyAndSpend(const Claim& claim, const MerkleProof& proof) {
    const Hash256 leaf = EncodeLeaf(claim);

    std::lock_guard<std::mutex> lock(mutex_);

    if (spent_.count(leaf)) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Leaf " << leaf.ToHex() << " already claimed";
        return SpendResult::Error(ClaimError::ALREADY_CLAIMED, leaf, "leaf already claimed");
    }
    if (root_.IsNull()) {
        return SpendResult::Error(ClaimError::INVALID_PROOF, leaf, "no root committed");
    }
    if (!VerifyMerkleProof(leaf, proof, root_.root)) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "Proof for " << claim.ToString()
            << " does not reach root " << root_.root.ToHex();
        return SpendResult::Error(ClaimError::INVALID_PROOF, leaf,
                                  "proof does not reach the committed root");
    }

    SpendRecord record;
    record.leaf = leaf;
    record.claim = claim;
    record.root = root_.root;
    record.batchId = root_.batchId;
    record.spentAt = GetTime();
    record.state = PayoutState::AUTHORIZED;

    db::Status s = WriteSpend(record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Failed to persist spend of "
            << leaf.ToHex() << ": " << s.ToString();
        return SpendResult::Error(ClaimError::STORAGE_ERROR, leaf, s.ToString());
    }

    spent_[leaf] = PayoutState::AUTHORIZED;
    leased_.insert(leaf);

    LOG_INFO(util::LogCategory::LEDGER) << "Spent " << leaf.ToHex() << " for "
        << claim.amount << " to " << claim.beneficiary.ToHex();
    SpendResult result;
    result.leaf = leaf;
    return result;
}

bool ClaimLedger::IsSpent(const Hash256& leaf) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spent_.count(leaf) != 0;
}

size_t ClaimLedger::SpentCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spent_.size();
}

std::optional<SpendRecord> ClaimLedger::GetSpendRecord(const Hash256& leaf) const {
    std::string value;
    if (!db_->Get(SpendKey(leaf), &value).ok()) {
        return std::nullopt;
    }
    SpendRecord record;
    if (!db::DeserializeFromString(value, record)) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Unreadable spend record for " << leaf.ToHex();
        return std::nullopt;
    }
    return record;
}

std::vector<SpendRecord> ClaimLedger::GetPendingPayouts() const {
    std::vector<Hash256> leaves;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : spent_) {
            if (entry.second == PayoutState::AUTHORIZED) {
                leaves.push_back(entry.first);
            }
        }
    }

    std::vector<SpendRecord> pending;
    for (const Hash256& leaf : leaves) {
        auto record = GetSpendRecord(leaf);
        if (record && record->state == PayoutState::AUTHORIZED) {
            pending.push_back(*record);
        }
    }
    std::stable_sort(pending.begin(), pending.end(),
                     [](const SpendRecord& a, const SpendRecord& b) {
                         return a.spentAt < b.spentAt;
                     });
    return pending;
}

// ============================================================================
// Payout Leases
// ============================================================================

ClaimError ClaimLedger::AcquirePayout(const Hash256& leaf, SpendRecord* record) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = spent_.find(leaf);
    if (it == spent_.end()) {
        return ClaimError::UNKNOWN_PAYOUT;
    }
    if (it->second == PayoutState::ISSUED || leased_.count(leaf)) {
        return ClaimError::ALREADY_CLAIMED;
    }

    if (record) {
        std::string value;
        db::Status s = db_->Get(SpendKey(leaf), &value);
        if (!s.ok() || !db::DeserializeFromString(value, *record)) {
            LOG_ERROR(util::LogCategory::LEDGER) << "Cannot read spend record for "
                << leaf.ToHex() << ": " << s.ToString();
            return ClaimError::STORAGE_ERROR;
        }
    }

    leased_.insert(leaf);
    return ClaimError::OK;
}

void ClaimLedger::ReleasePayout(const Hash256& leaf) {
    std::lock_guard<std::mutex> lock(mutex_);
    leased_.erase(leaf);
}

ClaimError ClaimLedger::MarkPayoutIssued(const Hash256& leaf) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = spent_.find(leaf);
    if (it == spent_.end()) {
        return ClaimError::UNKNOWN_PAYOUT;
    }
    if (it->second == PayoutState::ISSUED) {
        leased_.erase(leaf);
        return ClaimError::ALREADY_CLAIMED;
    }

    std::string value;
    SpendRecord record;
    db::Status s = db_->Get(SpendKey(leaf), &value);
    if (!s.ok() || !db::DeserializeFromString(value, record)) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Cannot read spend record for "
            << leaf.ToHex() << ": " << s.ToString();
        return ClaimError::STORAGE_ERROR;
    }

    record.state = PayoutState::ISSUED;
    s = WriteSpend(record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Failed to record payout of "
            << leaf.ToHex() << ": " << s.ToString();
        return ClaimError::STORAGE_ERROR;
    }

    it->second = PayoutState::ISSUED;
    leased_.erase(leaf);
    return ClaimError::OK;
}

} // namespace ledger
} // namespace delaypay
