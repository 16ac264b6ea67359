#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/zkp/MerkleTreeManager.h>
#include <libumbra/zkp/NullifierRegistry.h>
#include <libumbra/zkp/Witness.h>

#include <optional>

namespace umbra {
namespace zkp {

/** Public parameters of a withdrawal. recipient is mandatory. */
struct WithdrawalParams
{
    std::optional<FieldT> recipient;
    FieldT relayer = FieldT::zero();
    FieldT fee = FieldT::zero();
    FieldT refund = FieldT::zero();
};

/**
 * Packages domain objects into circuit witnesses.
 *
 * Every check the circuits enforce is repeated here so a bad request fails
 * in microseconds instead of after a multi-second proving attempt. When a
 * tree and registry are supplied, withdrawals are also checked against
 * known roots and spent nullifiers.
 */
class WitnessBuilder
{
public:
    explicit WitnessBuilder(
        Journal j,
        MerkleTreeManager const* tree = nullptr,
        NullifierRegistry const* registry = nullptr);

    /**
     * Commitment opening for a deposit. The result is not yet bound to a
     * tree position; see bindInclusion.
     *
     * @throws MissingFieldError if any note field is absent
     * @throws RangeError if amount does not fit in 128 bits
     */
    WitnessVector buildDepositWitness(NoteInputs const& note) const;

    /**
     * Attaches the inclusion proof of a deposit witness's commitment and
     * completes its public signals [merkleRoot, commitment, amount].
     *
     * @throws CommitmentMismatchError if proof.leaf is not the commitment
     */
    void bindInclusion(WitnessVector& witness, MerkleProof const& proof) const;

    /**
     * Withdrawal witness with public signals
     * [merkleRoot, nullifierHash, recipient, relayer, fee, refund].
     *
     * @throws MissingFieldError        absent note field or recipient
     * @throws CommitmentMismatchError  proof.leaf is not the note's commitment
     * @throws RangeError               a value exceeds its circuit bit width,
     *                                  or fee exceeds amount
     * @throws UnknownRootError         root not in the tree's history
     * @throws NullifierReplayError     nullifier hash already spent
     */
    WitnessVector buildWithdrawalWitness(
        NoteInputs const& note,
        MerkleProof const& proof,
        WithdrawalParams const& params) const;

private:
    void checkPath(MerkleProof const& proof) const;

    Journal j_;
    MerkleTreeManager const* tree_;
    NullifierRegistry const* registry_;
};

}  // namespace zkp
}  // namespace umbra
