// DELAYPAY - Payout Engine Tests
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#include <gtest/gtest.h>
#include "delaypay/commitment/builder.h"
#include "delaypay/payout/engine.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace delaypay;
using namespace delaypay::payout;
using commitment::BatchCommitment;
using commitment::CommitmentBuilder;

namespace {

Address MakeAddress(Byte fill) {
    Address a;
    for (size_t i = 0; i < Address::SIZE; ++i) a[i] = fill;
    return a;
}

} // namespace

class PayoutEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        admin = MakeAddress(0xad);
        auto authorizer = std::make_shared<ledger::AdminAuthorizer>(std::set<Address>{admin});
        ledger = std::make_unique<ledger::ClaimLedger>(db::NewMemoryDatabase(), authorizer);
        ASSERT_TRUE(ledger->Load().ok());

        claimA = Claim(MakeAddress(0x0a), ClaimIdFromPolicy("1"), 100);
        claimB = Claim(MakeAddress(0x0b), ClaimIdFromPolicy("2"), 50);
        batch = CommitmentBuilder().Build({claimA, claimB}).commitment;
        ASSERT_EQ(ledger->SetRoot(admin, batch.root), ClaimError::OK);

        sink = std::make_shared<CallbackTransferSink>(
            [this](const PayoutAuthorization& auth, std::string* error) {
                if (failTransfers) {
                    if (error) *error = "bank offline";
                    return false;
                }
                transfers.push_back(auth);
                return true;
            });
        engine = std::make_unique<PayoutEngine>(*ledger, sink);
    }

    const MerkleProof& ProofOf(const Claim& claim) const {
        return batch.FindByLeaf(EncodeLeaf(claim))->proof;
    }

    Address admin;
    std::unique_ptr<ledger::ClaimLedger> ledger;
    Claim claimA;
    Claim claimB;
    BatchCommitment batch;

    bool failTransfers = false;
    std::vector<PayoutAuthorization> transfers;
    std::shared_ptr<CallbackTransferSink> sink;
    std::unique_ptr<PayoutEngine> engine;
};

TEST_F(PayoutEngineTest, SuccessfulClaimPaysOnce) {
    ClaimResult result = engine->ClaimPayout(claimA, ProofOf(claimA));
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.amount, 100u);
    EXPECT_EQ(result.leaf, EncodeLeaf(claimA));

    ASSERT_EQ(transfers.size(), 1u);
    EXPECT_EQ(transfers[0].beneficiary, claimA.beneficiary);
    EXPECT_EQ(transfers[0].claimId, claimA.claimId);
    EXPECT_EQ(transfers[0].amount, 100u);
    EXPECT_EQ(transfers[0].leaf, EncodeLeaf(claimA));
    EXPECT_EQ(ledger->GetSpendRecord(result.leaf)->state, ledger::PayoutState::ISSUED);

    EXPECT_EQ(engine->ClaimPayout(claimA, ProofOf(claimA)).error, ClaimError::ALREADY_CLAIMED);
    EXPECT_EQ(transfers.size(), 1u);
}

TEST_F(PayoutEngineTest, RejectedClaimNeverTransfers) {
    Claim inflated = claimB;
    inflated.amount = 5000;
    EXPECT_EQ(engine->ClaimPayout(inflated, ProofOf(claimB)).error, ClaimError::INVALID_PROOF);
    EXPECT_TRUE(transfers.empty());
    EXPECT_EQ(ledger->SpentCount(), 0u);
}

TEST_F(PayoutEngineTest, FailedTransferStaysPending) {
    failTransfers = true;
    ClaimResult result = engine->ClaimPayout(claimA, ProofOf(claimA));
    EXPECT_EQ(result.error, ClaimError::TRANSFER_FAILED);
    EXPECT_EQ(result.message, "bank offline");

    // The leaf is spent regardless; a second claim cannot pay again
    EXPECT_TRUE(ledger->IsSpent(result.leaf));
    EXPECT_EQ(engine->ClaimPayout(claimA, ProofOf(claimA)).error, ClaimError::ALREADY_CLAIMED);
    ASSERT_EQ(ledger->GetPendingPayouts().size(), 1u);

    failTransfers = false;
    ClaimResult retry = engine->RetryPayout(result.leaf);
    ASSERT_TRUE(retry.ok()) << retry.message;
    EXPECT_EQ(retry.amount, 100u);
    EXPECT_EQ(transfers.size(), 1u);
    EXPECT_TRUE(ledger->GetPendingPayouts().empty());

    EXPECT_EQ(engine->RetryPayout(result.leaf).error, ClaimError::ALREADY_CLAIMED);
    EXPECT_EQ(transfers.size(), 1u);
}

TEST_F(PayoutEngineTest, RetryUnknownLeaf) {
    EXPECT_EQ(engine->RetryPayout(EncodeLeaf(claimB)).error, ClaimError::UNKNOWN_PAYOUT);
}

TEST_F(PayoutEngineTest, RetryPendingIssuesAll) {
    failTransfers = true;
    engine->ClaimPayout(claimA, ProofOf(claimA));
    engine->ClaimPayout(claimB, ProofOf(claimB));
    EXPECT_EQ(ledger->GetPendingPayouts().size(), 2u);

    EXPECT_EQ(engine->RetryPending(), 0u);

    failTransfers = false;
    EXPECT_EQ(engine->RetryPending(), 2u);
    EXPECT_EQ(transfers.size(), 2u);
    EXPECT_EQ(engine->RetryPending(), 0u);
}

TEST_F(PayoutEngineTest, ReentrantClaimRejected) {
    ClaimError inner = ClaimError::OK;
    int calls = 0;
    PayoutEngine* self = nullptr;
    auto reentrant = std::make_shared<CallbackTransferSink>(
        [&](const PayoutAuthorization&, std::string*) {
            ++calls;
            if (calls == 1) {
                inner = self->ClaimPayout(claimA, ProofOf(claimA)).error;
            }
            return true;
        });
    PayoutEngine engine2(*ledger, reentrant);
    self = &engine2;

    ClaimResult outer = engine2.ClaimPayout(claimA, ProofOf(claimA));
    EXPECT_TRUE(outer.ok()) << outer.message;
    EXPECT_EQ(inner, ClaimError::ALREADY_CLAIMED);
    EXPECT_EQ(calls, 1);
}

TEST_F(PayoutEngineTest, RetryDuringTransferRejected) {
    ClaimError inner = ClaimError::OK;
    PayoutEngine* self = nullptr;
    auto reentrant = std::make_shared<CallbackTransferSink>(
        [&](const PayoutAuthorization& auth, std::string*) {
            inner = self->RetryPayout(auth.leaf).error;
            return true;
        });
    PayoutEngine engine2(*ledger, reentrant);
    self = &engine2;

    EXPECT_TRUE(engine2.ClaimPayout(claimB, ProofOf(claimB)).ok());
    EXPECT_EQ(inner, ClaimError::ALREADY_CLAIMED);
}

TEST_F(PayoutEngineTest, ThrowingSinkIsTransferFailure) {
    auto throwing = std::make_shared<CallbackTransferSink>(
        [](const PayoutAuthorization&, std::string*) -> bool {
            throw std::runtime_error("connection reset");
        });
    PayoutEngine engine2(*ledger, throwing);

    ClaimResult result = engine2.ClaimPayout(claimA, ProofOf(claimA));
    EXPECT_EQ(result.error, ClaimError::TRANSFER_FAILED);
    EXPECT_EQ(result.message, "connection reset");
    EXPECT_TRUE(engine->RetryPayout(result.leaf).ok());
}

TEST_F(PayoutEngineTest, MissingSinkIsTransferFailure) {
    PayoutEngine engine2(*ledger, nullptr);
    EXPECT_EQ(engine2.ClaimPayout(claimA, ProofOf(claimA)).error, ClaimError::TRANSFER_FAILED);
}

// ============================================================================
// Journal Sink
// ============================================================================

TEST(JournalTransferSinkTest, AppendsLines) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "delaypay_journal_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    std::string path = (dir / "payouts.journal").string();

    PayoutAuthorization auth;
    auth.leaf[0] = 0x11;
    auth.beneficiary[0] = 0x22;
    auth.claimId[0] = 0x33;
    auth.amount = 42;

    {
        JournalTransferSink sink(path);
        ASSERT_TRUE(sink.IsOpen());
        EXPECT_EQ(sink.GetPath(), path);
        std::string error;
        EXPECT_TRUE(sink.Transfer(auth, &error)) << error;
        EXPECT_TRUE(sink.Transfer(auth, &error)) << error;
    }

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        ++lines;
        std::istringstream iss(line);
        std::string tag, leaf, beneficiary, claimId;
        Amount amount = 0;
        iss >> tag >> leaf >> beneficiary >> claimId >> amount;
        EXPECT_EQ(tag, "payout");
        EXPECT_EQ(leaf, auth.leaf.ToHex());
        EXPECT_EQ(beneficiary, auth.beneficiary.ToHex());
        EXPECT_EQ(claimId, auth.claimId.ToHex());
        EXPECT_EQ(amount, 42u);
    }
    EXPECT_EQ(lines, 2);

    std::filesystem::remove_all(dir);
}

TEST(JournalTransferSinkTest, UnopenableJournalFails) {
    JournalTransferSink sink("/nonexistent/delaypay/payouts.journal");
    EXPECT_FALSE(sink.IsOpen());
    std::string error;
    EXPECT_FALSE(sink.Transfer(PayoutAuthorization(), &error));
    EXPECT_FALSE(error.empty());
}
