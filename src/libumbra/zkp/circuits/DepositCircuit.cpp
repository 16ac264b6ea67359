#include <libumbra/zkp/circuits/DepositCircuit.h>
#include <libumbra/zkp/circuits/PoolGadgets.h>

namespace umbra {
namespace zkp {

using libsnark::pb_linear_combination;
using libsnark::pb_variable;
using libsnark::r1cs_constraint;

class DepositCircuit::Impl
{
public:
    Impl(libsnark::protoboard<FieldT>& pb, std::size_t depth) : pb_(pb)
    {
        // Public inputs first, in signal order.
        root_.allocate(pb_, "merkle_root");
        commitment_.allocate(pb_, "commitment");
        amount_.allocate(pb_, "amount");
        pb_.set_input_sizes(deposit_signal::count);

        secret_.allocate(pb_, "secret");
        nullifier_.allocate(pb_, "nullifier");
        binding_.allocate(pb_, "recipient_binding");

        commitmentHasher_ = std::make_unique<PoseidonGadget>(
            pb_,
            std::vector<pb_linear_combination<FieldT>>{
                secret_, nullifier_, amount_, binding_},
            "commitment_hash");
        amountRange_ = std::make_unique<RangeCheckGadget>(
            pb_, amount_, amountBits, "amount_range");
        path_ = std::make_unique<MerklePathGadget>(
            pb_, depth, commitment_, root_, "inclusion");
    }

    void generateConstraints()
    {
        commitmentHasher_->generate_r1cs_constraints();
        pb_.add_r1cs_constraint(
            r1cs_constraint<FieldT>(1, commitmentHasher_->result(), commitment_),
            "commitment_opening");
        amountRange_->generate_r1cs_constraints();
        path_->generate_r1cs_constraints();
    }

    void assignWitness(WitnessVector const& w)
    {
        pb_.val(root_) = w.publicSignals[deposit_signal::merkleRoot];
        pb_.val(commitment_) = w.publicSignals[deposit_signal::commitment];
        pb_.val(amount_) = w.publicSignals[deposit_signal::amount];

        pb_.val(secret_) = w.note.secret;
        pb_.val(nullifier_) = w.note.nullifier;
        pb_.val(binding_) = w.note.recipientBinding;

        commitmentHasher_->generate_r1cs_witness();
        amountRange_->generate_r1cs_witness();
        path_->generate_r1cs_witness(w.path.pathElements, w.path.pathIndices);
    }

private:
    libsnark::protoboard<FieldT>& pb_;

    // ===== PUBLIC =====
    pb_variable<FieldT> root_;
    pb_variable<FieldT> commitment_;
    pb_variable<FieldT> amount_;

    // ===== PRIVATE =====
    pb_variable<FieldT> secret_;
    pb_variable<FieldT> nullifier_;
    pb_variable<FieldT> binding_;

    std::unique_ptr<PoseidonGadget> commitmentHasher_;
    std::unique_ptr<RangeCheckGadget> amountRange_;
    std::unique_ptr<MerklePathGadget> path_;
};

DepositCircuit::DepositCircuit(std::size_t treeDepth)
    : PoolCircuit(CircuitId::deposit, treeDepth)
    , impl_(std::make_unique<Impl>(pb_, treeDepth))
{
}

DepositCircuit::~DepositCircuit() = default;

void
DepositCircuit::generateConstraints()
{
    impl_->generateConstraints();
}

void
DepositCircuit::assignWitness(WitnessVector const& witness)
{
    impl_->assignWitness(witness);
}

}  // namespace zkp
}  // namespace umbra
