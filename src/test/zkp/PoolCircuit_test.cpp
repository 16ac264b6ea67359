#include <libumbra/basics/Errors.h>
#include <libumbra/zkp/MerkleTreeManager.h>
#include <libumbra/zkp/Note.h>
#include <libumbra/zkp/WitnessBuilder.h>
#include <libumbra/zkp/circuits/PoolCircuit.h>
#include <test/support/TestRandom.h>

#include <gtest/gtest.h>

namespace umbra {
namespace zkp {
namespace {

constexpr std::size_t depth = 3;

class PoolCircuitTest : public ::testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        initCurveParameters();
    }

    PoolCircuitTest() : tree_({depth}, j_), builder_(j_, &tree_)
    {
        note_ = Note::random(rng_, fieldFromUint64(500), FieldT(9));
        tree_.append(hashToField("first"));
        index_ = tree_.append(note_.commitment()).leafIndex;
    }

    WitnessVector depositWitness() const
    {
        auto w = builder_.buildDepositWitness(note_);
        builder_.bindInclusion(w, tree_.proveInclusion(index_));
        return w;
    }

    WitnessVector withdrawWitness() const
    {
        WithdrawalParams p;
        p.recipient = FieldT(0x1234);
        p.fee = fieldFromUint64(25);
        return builder_.buildWithdrawalWitness(note_, tree_.proveInclusion(index_), p);
    }

    Journal j_{Journal::nullSink()};
    test::DeterministicRandom rng_{11};
    MerkleTreeManager tree_;
    WitnessBuilder builder_;
    Note note_;
    std::uint64_t index_ = 0;
};

TEST_F(PoolCircuitTest, ConstraintSystemIsStable)
{
    for (auto const id : {CircuitId::deposit, CircuitId::withdraw})
    {
        auto const a = PoolCircuit::create(id, depth);
        auto const b = PoolCircuit::create(id, depth);
        EXPECT_EQ(a->numPublicInputs(), publicInputCount(id));
        EXPECT_EQ(a->getConstraintSystem().num_inputs(), publicInputCount(id));
        EXPECT_TRUE(a->getConstraintSystem() == b->getConstraintSystem());
    }
    EXPECT_THROW(PoolCircuit::create(CircuitId::deposit, 0), InputValidationError);
}

TEST_F(PoolCircuitTest, DepositSatisfied)
{
    auto const w = depositWitness();
    auto circuit = PoolCircuit::create(CircuitId::deposit, depth);
    EXPECT_TRUE(circuit->generateWitness(w));
    EXPECT_EQ(circuit->getPrimaryInput(), w.publicSignals);
}

TEST_F(PoolCircuitTest, WithdrawSatisfied)
{
    auto const w = withdrawWitness();
    auto circuit = PoolCircuit::create(CircuitId::withdraw, depth);
    EXPECT_TRUE(circuit->generateWitness(w));
    EXPECT_EQ(circuit->getPrimaryInput(), w.publicSignals);
}

TEST_F(PoolCircuitTest, BadMerklePathIsUnsatisfied)
{
    auto w = withdrawWitness();
    w.path.pathElements[1] = w.path.pathElements[1] + FieldT::one();
    auto circuit = PoolCircuit::create(CircuitId::withdraw, depth);
    EXPECT_FALSE(circuit->generateWitness(w));

    auto d = depositWitness();
    d.path.pathIndices[0] = !d.path.pathIndices[0];
    auto deposit = PoolCircuit::create(CircuitId::deposit, depth);
    EXPECT_FALSE(deposit->generateWitness(d));
}

TEST_F(PoolCircuitTest, WrongPublicNullifierHashIsUnsatisfied)
{
    auto w = withdrawWitness();
    w.publicSignals[withdraw_signal::nullifierHash] += FieldT::one();
    auto circuit = PoolCircuit::create(CircuitId::withdraw, depth);
    EXPECT_FALSE(circuit->generateWitness(w));
}

TEST_F(PoolCircuitTest, FeeAboveAmountFailsRangeCheck)
{
    auto w = withdrawWitness();
    w.publicSignals[withdraw_signal::fee] = note_.amount + FieldT::one();
    auto circuit = PoolCircuit::create(CircuitId::withdraw, depth);
    EXPECT_THROW(circuit->generateWitness(w), WitnessGenerationError);
}

TEST_F(PoolCircuitTest, MismatchedWitnessShape)
{
    auto circuit = PoolCircuit::create(CircuitId::deposit, depth);
    EXPECT_THROW(circuit->generateWitness(withdrawWitness()), WitnessGenerationError);

    auto deeper = PoolCircuit::create(CircuitId::withdraw, depth + 1);
    EXPECT_THROW(deeper->generateWitness(withdrawWitness()), WitnessGenerationError);
}

}  // namespace
}  // namespace zkp
}  // namespace umbra
