#include <libumbra/zkp/circuits/PoolGadgets.h>

namespace umbra {
namespace zkp {

using libsnark::linear_combination;
using libsnark::pb_linear_combination;
using libsnark::pb_variable;
using libsnark::r1cs_constraint;

MerklePathGadget::MerklePathGadget(
    libsnark::protoboard<FieldT>& pb,
    std::size_t depth,
    pb_linear_combination<FieldT> const& leaf,
    pb_variable<FieldT> const& root,
    std::string const& annotation)
    : libsnark::gadget<FieldT>(pb, annotation)
    , depth_(depth)
    , leaf_(leaf)
    , root_(root)
{
    siblings_.allocate(pb, depth_, annotation + "_siblings");
    bits_.allocate(pb, depth_, annotation + "_bits");
    swap_.allocate(pb, depth_, annotation + "_swap");

    hashers_.reserve(depth_);
    for (std::size_t level = 0; level < depth_; ++level)
    {
        linear_combination<FieldT> const cur = current(level);

        pb_linear_combination<FieldT> left;
        left.assign(pb, cur + linear_combination<FieldT>(swap_[level]));
        pb_linear_combination<FieldT> right;
        right.assign(
            pb,
            linear_combination<FieldT>(siblings_[level]) -
                linear_combination<FieldT>(swap_[level]));

        hashers_.push_back(std::make_unique<PoseidonGadget>(
            pb,
            std::vector<pb_linear_combination<FieldT>>{left, right},
            annotation + "_h" + std::to_string(level)));
    }
}

linear_combination<FieldT>
MerklePathGadget::current(std::size_t level) const
{
    if (level == 0)
        return leaf_;
    return linear_combination<FieldT>(hashers_[level - 1]->result());
}

FieldT
MerklePathGadget::currentValue(std::size_t level)
{
    if (level == 0)
    {
        leaf_.evaluate(this->pb);
        return this->pb.lc_val(leaf_);
    }
    return this->pb.val(hashers_[level - 1]->result());
}

void
MerklePathGadget::generate_r1cs_constraints()
{
    for (std::size_t level = 0; level < depth_; ++level)
    {
        libsnark::generate_boolean_r1cs_constraint<FieldT>(
            this->pb, bits_[level], "path_bit");
        this->pb.add_r1cs_constraint(
            r1cs_constraint<FieldT>(
                bits_[level],
                linear_combination<FieldT>(siblings_[level]) - current(level),
                swap_[level]),
            "path_swap");
        hashers_[level]->generate_r1cs_constraints();
    }

    this->pb.add_r1cs_constraint(
        r1cs_constraint<FieldT>(1, hashers_.back()->result(), root_), "path_root");
}

void
MerklePathGadget::generate_r1cs_witness(
    std::vector<FieldT> const& siblings, std::vector<bool> const& bits)
{
    if (siblings.size() != depth_ || bits.size() != depth_)
        throw WitnessGenerationError(
            "merkle path has " + std::to_string(siblings.size()) +
            " levels, circuit expects " + std::to_string(depth_));

    for (std::size_t level = 0; level < depth_; ++level)
    {
        FieldT const cur = currentValue(level);
        FieldT const bit = bits[level] ? FieldT::one() : FieldT::zero();

        this->pb.val(siblings_[level]) = siblings[level];
        this->pb.val(bits_[level]) = bit;
        this->pb.val(swap_[level]) = bit * (siblings[level] - cur);

        hashers_[level]->generate_r1cs_witness();
    }
}

//------------------------------------------------------------------------------

RangeCheckGadget::RangeCheckGadget(
    libsnark::protoboard<FieldT>& pb,
    pb_linear_combination<FieldT> const& value,
    std::size_t bits,
    std::string const& annotation)
    : libsnark::gadget<FieldT>(pb, annotation), value_(value)
{
    bits_.allocate(pb, bits, annotation + "_bits");
    packer_ = std::make_unique<libsnark::packing_gadget<FieldT>>(
        pb, bits_, value_, annotation + "_packer");
}

void
RangeCheckGadget::generate_r1cs_constraints()
{
    packer_->generate_r1cs_constraints(true);
}

void
RangeCheckGadget::generate_r1cs_witness()
{
    value_.evaluate(this->pb);
    if (!fitsInBits(this->pb.lc_val(value_), bits_.size()))
        throw WitnessGenerationError(
            this->annotation_prefix + " exceeds " + std::to_string(bits_.size()) +
            " bits");
    packer_->generate_r1cs_witness_from_packed();
}

}  // namespace zkp
}  // namespace umbra
