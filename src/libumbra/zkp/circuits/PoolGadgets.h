#pragma once

#include <libumbra/zkp/circuits/PoseidonGadget.h>

#include <libsnark/gadgetlib1/gadgets/basic_gadgets.hpp>

#include <memory>
#include <vector>

namespace umbra {
namespace zkp {

/**
 * Recomputes a Merkle root from a leaf and a private sibling path and
 * constrains it to equal root.
 *
 * At level i with path bit b:
 *   swap  = b * (sibling - current)
 *   left  = current + swap        (sibling when b = 1)
 *   right = sibling - swap        (current when b = 1)
 *   next  = Poseidon(left, right)
 */
class MerklePathGadget : public libsnark::gadget<FieldT>
{
public:
    MerklePathGadget(
        libsnark::protoboard<FieldT>& pb,
        std::size_t depth,
        libsnark::pb_linear_combination<FieldT> const& leaf,
        libsnark::pb_variable<FieldT> const& root,
        std::string const& annotation);

    void generate_r1cs_constraints();

    /** leaf and root must already be assigned. */
    void generate_r1cs_witness(
        std::vector<FieldT> const& siblings, std::vector<bool> const& bits);

private:
    libsnark::linear_combination<FieldT> current(std::size_t level) const;
    FieldT currentValue(std::size_t level);

    std::size_t depth_;
    libsnark::pb_linear_combination<FieldT> leaf_;
    libsnark::pb_variable<FieldT> root_;

    libsnark::pb_variable_array<FieldT> siblings_;
    libsnark::pb_variable_array<FieldT> bits_;
    libsnark::pb_variable_array<FieldT> swap_;
    std::vector<std::unique_ptr<PoseidonGadget>> hashers_;
};

/** Constrains a value to fit in a fixed number of bits. */
class RangeCheckGadget : public libsnark::gadget<FieldT>
{
public:
    RangeCheckGadget(
        libsnark::protoboard<FieldT>& pb,
        libsnark::pb_linear_combination<FieldT> const& value,
        std::size_t bits,
        std::string const& annotation);

    void generate_r1cs_constraints();

    /** Throws WitnessGenerationError when the value does not fit. */
    void generate_r1cs_witness();

private:
    libsnark::pb_linear_combination<FieldT> value_;
    libsnark::pb_variable_array<FieldT> bits_;
    std::unique_ptr<libsnark::packing_gadget<FieldT>> packer_;
};

}  // namespace zkp
}  // namespace umbra
