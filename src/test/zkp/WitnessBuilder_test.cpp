#include <libumbra/basics/Errors.h>
#include <libumbra/zkp/MerkleTreeManager.h>
#include <libumbra/zkp/Note.h>
#include <libumbra/zkp/NullifierRegistry.h>
#include <libumbra/zkp/PoseidonHasher.h>
#include <libumbra/zkp/WitnessBuilder.h>
#include <test/support/TestRandom.h>

#include <gtest/gtest.h>

namespace umbra {
namespace zkp {
namespace {

class WitnessBuilderTest : public ::testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        initCurveParameters();
    }

    WitnessBuilderTest()
        : tree_({8}, j_), registry_(j_), builder_(j_, &tree_, &registry_)
    {
        note_ = Note::random(rng_, fieldFromUint64(1000), FieldT(77));
        for (int i = 0; i < 3; ++i)
            tree_.append(hashToField("other" + std::to_string(i)));
        index_ = tree_.append(note_.commitment()).leafIndex;
    }

    WithdrawalParams params() const
    {
        WithdrawalParams p;
        p.recipient = FieldT(0xbeef);
        p.relayer = FieldT(0xcafe);
        p.fee = fieldFromUint64(10);
        return p;
    }

    Journal j_{Journal::nullSink()};
    test::DeterministicRandom rng_{3};
    MerkleTreeManager tree_;
    NullifierRegistry registry_;
    WitnessBuilder builder_;
    Note note_;
    std::uint64_t index_ = 0;
};

TEST_F(WitnessBuilderTest, NoteHashes)
{
    EXPECT_EQ(
        note_.commitment(),
        PoseidonHasher::hash4(
            note_.secret, note_.nullifier, note_.amount, note_.recipientBinding));
    EXPECT_EQ(note_.nullifierHash(), PoseidonHasher::hash2(note_.nullifier, note_.secret));
    EXPECT_EQ(note_.nullifierHash(), computeNullifierHash(note_.nullifier, note_.secret));

    auto other = note_;
    other.nullifier += FieldT::one();
    EXPECT_NE(other.nullifierHash(), note_.nullifierHash());
}

TEST_F(WitnessBuilderTest, NoteJson)
{
    auto const restored = Note::fromJson(note_.toJson());
    EXPECT_EQ(restored.commitment(), note_.commitment());

    auto json = note_.toJson();
    json.removeMember("nullifier");
    try
    {
        Note::fromJson(json);
        FAIL() << "expected MissingFieldError";
    }
    catch (MissingFieldError const& e)
    {
        EXPECT_EQ(e.field(), "nullifier");
    }
}

TEST_F(WitnessBuilderTest, DepositWitness)
{
    auto w = builder_.buildDepositWitness(note_);
    EXPECT_EQ(w.circuit, CircuitId::deposit);
    EXPECT_EQ(w.commitment, note_.commitment());
    EXPECT_FALSE(w.complete());

    auto const preview = tree_.previewAppend(w.commitment);
    builder_.bindInclusion(w, preview);
    EXPECT_TRUE(w.complete());
    ASSERT_EQ(w.publicSignals.size(), deposit_signal::count);
    EXPECT_EQ(w.publicSignals[deposit_signal::merkleRoot], preview.root);
    EXPECT_EQ(w.publicSignals[deposit_signal::commitment], note_.commitment());
    EXPECT_EQ(w.publicSignals[deposit_signal::amount], note_.amount);
}

TEST_F(WitnessBuilderTest, DepositRejectsMissingFields)
{
    NoteInputs inputs(note_);
    inputs.recipientBinding.reset();
    EXPECT_THROW(builder_.buildDepositWitness(inputs), MissingFieldError);

    NoteInputs empty;
    EXPECT_THROW(builder_.buildDepositWitness(empty), MissingFieldError);
}

TEST_F(WitnessBuilderTest, DepositRejectsWideAmount)
{
    auto wide = note_;
    wide.amount = -FieldT::one();
    EXPECT_THROW(builder_.buildDepositWitness(wide), RangeError);
}

TEST_F(WitnessBuilderTest, BindInclusionChecksLeaf)
{
    auto w = builder_.buildDepositWitness(note_);
    EXPECT_THROW(
        builder_.bindInclusion(w, tree_.previewAppend(FieldT(1))), CommitmentMismatchError);
}

TEST_F(WitnessBuilderTest, WithdrawalSignalOrder)
{
    auto const proof = tree_.proveInclusion(index_);
    auto const p = params();
    auto const w = builder_.buildWithdrawalWitness(note_, proof, p);

    EXPECT_EQ(w.circuit, CircuitId::withdraw);
    EXPECT_TRUE(w.complete());
    ASSERT_EQ(w.publicSignals.size(), withdraw_signal::count);
    EXPECT_EQ(w.publicSignals[withdraw_signal::merkleRoot], tree_.currentRoot());
    EXPECT_EQ(w.publicSignals[withdraw_signal::nullifierHash], note_.nullifierHash());
    EXPECT_EQ(w.publicSignals[withdraw_signal::recipient], *p.recipient);
    EXPECT_EQ(w.publicSignals[withdraw_signal::relayer], p.relayer);
    EXPECT_EQ(w.publicSignals[withdraw_signal::fee], p.fee);
    EXPECT_EQ(w.publicSignals[withdraw_signal::refund], p.refund);
}

TEST_F(WitnessBuilderTest, ForeignLeafIsCommitmentMismatch)
{
    // Leaf 0 belongs to someone else.
    auto const proof = tree_.proveInclusion(0);
    EXPECT_THROW(
        builder_.buildWithdrawalWitness(note_, proof, params()), CommitmentMismatchError);

    auto altered = note_;
    altered.amount = fieldFromUint64(999);
    EXPECT_THROW(
        builder_.buildWithdrawalWitness(altered, tree_.proveInclusion(index_), params()),
        CommitmentMismatchError);
}

TEST_F(WitnessBuilderTest, WithdrawalRangeChecks)
{
    auto const proof = tree_.proveInclusion(index_);

    auto p = params();
    p.recipient.reset();
    EXPECT_THROW(builder_.buildWithdrawalWitness(note_, proof, p), MissingFieldError);

    p = params();
    p.fee = fieldFromUint64(1001);
    EXPECT_THROW(builder_.buildWithdrawalWitness(note_, proof, p), RangeError);

    p = params();
    p.fee = note_.amount;
    EXPECT_NO_THROW(builder_.buildWithdrawalWitness(note_, proof, p));

    p = params();
    p.recipient = -FieldT::one();
    EXPECT_THROW(builder_.buildWithdrawalWitness(note_, proof, p), RangeError);

    p = params();
    p.refund = -FieldT::one();
    EXPECT_THROW(builder_.buildWithdrawalWitness(note_, proof, p), RangeError);
}

TEST_F(WitnessBuilderTest, WithdrawalChecksRootAndRegistry)
{
    auto proof = tree_.proveInclusion(index_);
    auto stale = proof;
    stale.root = FieldT(12345);
    EXPECT_THROW(builder_.buildWithdrawalWitness(note_, stale, params()), UnknownRootError);

    auto broken = proof;
    broken.pathIndices.pop_back();
    EXPECT_THROW(builder_.buildWithdrawalWitness(note_, broken, params()), InputValidationError);

    registry_.markSpent(note_.nullifierHash());
    EXPECT_THROW(builder_.buildWithdrawalWitness(note_, proof, params()), NullifierReplayError);
}

}  // namespace
}  // namespace zkp
}  // namespace umbra
