#include <libumbra/zkp/WitnessBuilder.h>

namespace umbra {
namespace zkp {

namespace {

void
requireBits(FieldT const& value, std::size_t bits, char const* name)
{
    if (!fitsInBits(value, bits))
        throw RangeError(
            std::string(name) + " exceeds " + std::to_string(bits) + " bits");
}

}  // namespace

WitnessBuilder::WitnessBuilder(
    Journal j, MerkleTreeManager const* tree, NullifierRegistry const* registry)
    : j_(j), tree_(tree), registry_(registry)
{
}

void
WitnessBuilder::checkPath(MerkleProof const& proof) const
{
    if (proof.pathElements.empty() ||
        proof.pathElements.size() != proof.pathIndices.size())
        throw InputValidationError("merkle proof has an inconsistent path");
    if (tree_ && proof.depth() != tree_->depth())
        throw InputValidationError(
            "merkle proof depth " + std::to_string(proof.depth()) +
            " does not match tree depth " + std::to_string(tree_->depth()));
}

WitnessVector
WitnessBuilder::buildDepositWitness(NoteInputs const& inputs) const
{
    Note const note = inputs.require();
    requireBits(note.amount, amountBits, "amount");

    WitnessVector w;
    w.circuit = CircuitId::deposit;
    w.note = note;
    w.commitment = note.commitment();
    w.nullifierHash = note.nullifierHash();

    JLOG(j_.trace()) << "deposit witness for commitment "
                     << fieldToHex(w.commitment);
    return w;
}

void
WitnessBuilder::bindInclusion(WitnessVector& w, MerkleProof const& proof) const
{
    if (w.circuit != CircuitId::deposit)
        throw InputValidationError("bindInclusion applies to deposit witnesses");
    checkPath(proof);
    if (proof.leaf != w.commitment)
        throw CommitmentMismatchError(
            "merkle proof leaf " + fieldToHex(proof.leaf) +
            " is not the deposit commitment " + fieldToHex(w.commitment));

    w.path = proof;
    w.publicSignals = {proof.root, w.commitment, w.note.amount};
}

WitnessVector
WitnessBuilder::buildWithdrawalWitness(
    NoteInputs const& inputs,
    MerkleProof const& proof,
    WithdrawalParams const& params) const
{
    Note const note = inputs.require();
    if (!params.recipient)
        throw MissingFieldError("recipient");
    checkPath(proof);

    FieldT const commitment = note.commitment();
    if (commitment != proof.leaf)
    {
        JLOG(j_.warn()) << "withdrawal commitment does not match leaf "
                        << proof.leafIndex;
        throw CommitmentMismatchError(
            "note commitment does not match merkle proof leaf " +
            std::to_string(proof.leafIndex));
    }

    requireBits(*params.recipient, addressBits, "recipient");
    requireBits(params.relayer, addressBits, "relayer");
    requireBits(params.fee, feeBits, "fee");
    requireBits(params.refund, feeBits, "refund");
    requireBits(note.amount, amountBits, "amount");
    // amount - fee must itself fit, which rules out fee > amount.
    if (!fitsInBits(note.amount - params.fee, amountBits))
        throw RangeError("fee exceeds note amount");

    if (tree_ && !tree_->isKnownRoot(proof.root))
        throw UnknownRootError(
            "merkle root " + fieldToHex(proof.root) + " is not a known root");

    FieldT const nullifierHash = note.nullifierHash();
    if (registry_ && registry_->isSpent(nullifierHash))
        throw NullifierReplayError(
            "nullifier hash already spent: " + fieldToHex(nullifierHash));

    WitnessVector w;
    w.circuit = CircuitId::withdraw;
    w.note = note;
    w.commitment = commitment;
    w.nullifierHash = nullifierHash;
    w.path = proof;
    w.publicSignals = {
        proof.root,
        nullifierHash,
        *params.recipient,
        params.relayer,
        params.fee,
        params.refund};

    JLOG(j_.debug()) << "withdrawal witness for leaf " << proof.leafIndex
                     << ", nullifier hash " << fieldToHex(nullifierHash);
    return w;
}

}  // namespace zkp
}  // namespace umbra
