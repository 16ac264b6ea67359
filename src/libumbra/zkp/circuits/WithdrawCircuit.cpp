#include <libumbra/zkp/circuits/WithdrawCircuit.h>
#include <libumbra/zkp/circuits/PoolGadgets.h>

namespace umbra {
namespace zkp {

using libsnark::linear_combination;
using libsnark::pb_linear_combination;
using libsnark::pb_variable;
using libsnark::r1cs_constraint;

class WithdrawCircuit::Impl
{
public:
    Impl(libsnark::protoboard<FieldT>& pb, std::size_t depth) : pb_(pb)
    {
        root_.allocate(pb_, "merkle_root");
        nullifierHash_.allocate(pb_, "nullifier_hash");
        recipient_.allocate(pb_, "recipient");
        relayer_.allocate(pb_, "relayer");
        fee_.allocate(pb_, "fee");
        refund_.allocate(pb_, "refund");
        pb_.set_input_sizes(withdraw_signal::count);

        secret_.allocate(pb_, "secret");
        nullifier_.allocate(pb_, "nullifier");
        amount_.allocate(pb_, "amount");
        binding_.allocate(pb_, "recipient_binding");
        recipientSquare_.allocate(pb_, "recipient_square");

        commitmentHasher_ = std::make_unique<PoseidonGadget>(
            pb_,
            std::vector<pb_linear_combination<FieldT>>{
                secret_, nullifier_, amount_, binding_},
            "commitment_hash");
        nullifierHasher_ = std::make_unique<PoseidonGadget>(
            pb_,
            std::vector<pb_linear_combination<FieldT>>{nullifier_, secret_},
            "nullifier_hash");

        pb_linear_combination<FieldT> commitment(commitmentHasher_->result());
        path_ = std::make_unique<MerklePathGadget>(
            pb_, depth, commitment, root_, "inclusion");

        change_.assign(
            pb_,
            linear_combination<FieldT>(amount_) - linear_combination<FieldT>(fee_));

        ranges_.push_back(std::make_unique<RangeCheckGadget>(
            pb_, recipient_, addressBits, "recipient_range"));
        ranges_.push_back(std::make_unique<RangeCheckGadget>(
            pb_, relayer_, addressBits, "relayer_range"));
        ranges_.push_back(
            std::make_unique<RangeCheckGadget>(pb_, fee_, feeBits, "fee_range"));
        ranges_.push_back(std::make_unique<RangeCheckGadget>(
            pb_, refund_, feeBits, "refund_range"));
        ranges_.push_back(std::make_unique<RangeCheckGadget>(
            pb_, amount_, amountBits, "amount_range"));
        ranges_.push_back(std::make_unique<RangeCheckGadget>(
            pb_, change_, amountBits, "change_range"));
    }

    void generateConstraints()
    {
        commitmentHasher_->generate_r1cs_constraints();
        nullifierHasher_->generate_r1cs_constraints();
        pb_.add_r1cs_constraint(
            r1cs_constraint<FieldT>(1, nullifierHasher_->result(), nullifierHash_),
            "nullifier_hash");
        path_->generate_r1cs_constraints();

        // Ties the recipient into a multiplicative constraint.
        pb_.add_r1cs_constraint(
            r1cs_constraint<FieldT>(recipient_, recipient_, recipientSquare_),
            "recipient_square");

        for (auto& range : ranges_)
            range->generate_r1cs_constraints();
    }

    void assignWitness(WitnessVector const& w)
    {
        auto const& s = w.publicSignals;
        pb_.val(root_) = s[withdraw_signal::merkleRoot];
        pb_.val(nullifierHash_) = s[withdraw_signal::nullifierHash];
        pb_.val(recipient_) = s[withdraw_signal::recipient];
        pb_.val(relayer_) = s[withdraw_signal::relayer];
        pb_.val(fee_) = s[withdraw_signal::fee];
        pb_.val(refund_) = s[withdraw_signal::refund];

        pb_.val(secret_) = w.note.secret;
        pb_.val(nullifier_) = w.note.nullifier;
        pb_.val(amount_) = w.note.amount;
        pb_.val(binding_) = w.note.recipientBinding;
        pb_.val(recipientSquare_) = pb_.val(recipient_) * pb_.val(recipient_);

        commitmentHasher_->generate_r1cs_witness();
        nullifierHasher_->generate_r1cs_witness();
        path_->generate_r1cs_witness(w.path.pathElements, w.path.pathIndices);

        for (auto& range : ranges_)
            range->generate_r1cs_witness();
    }

private:
    libsnark::protoboard<FieldT>& pb_;

    // ===== PUBLIC =====
    pb_variable<FieldT> root_;
    pb_variable<FieldT> nullifierHash_;
    pb_variable<FieldT> recipient_;
    pb_variable<FieldT> relayer_;
    pb_variable<FieldT> fee_;
    pb_variable<FieldT> refund_;

    // ===== PRIVATE =====
    pb_variable<FieldT> secret_;
    pb_variable<FieldT> nullifier_;
    pb_variable<FieldT> amount_;
    pb_variable<FieldT> binding_;
    pb_variable<FieldT> recipientSquare_;
    pb_linear_combination<FieldT> change_;

    std::unique_ptr<PoseidonGadget> commitmentHasher_;
    std::unique_ptr<PoseidonGadget> nullifierHasher_;
    std::unique_ptr<MerklePathGadget> path_;
    std::vector<std::unique_ptr<RangeCheckGadget>> ranges_;
};

WithdrawCircuit::WithdrawCircuit(std::size_t treeDepth)
    : PoolCircuit(CircuitId::withdraw, treeDepth)
    , impl_(std::make_unique<Impl>(pb_, treeDepth))
{
}

WithdrawCircuit::~WithdrawCircuit() = default;

void
WithdrawCircuit::generateConstraints()
{
    impl_->generateConstraints();
}

void
WithdrawCircuit::assignWitness(WitnessVector const& witness)
{
    impl_->assignWitness(witness);
}

}  // namespace zkp
}  // namespace umbra
