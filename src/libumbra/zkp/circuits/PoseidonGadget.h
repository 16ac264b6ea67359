#pragma once

#include <libumbra/zkp/PoseidonHasher.h>

#include <libsnark/gadgetlib1/gadget.hpp>
#include <libsnark/gadgetlib1/pb_variable.hpp>
#include <libsnark/gadgetlib1/protoboard.hpp>

#include <string>
#include <vector>

namespace umbra {
namespace zkp {

/**
 * R1CS version of PoseidonHasher::hash.
 *
 * Each S-box costs three constraints (x^2, x^4, x^5) and each round
 * materializes the MDS output with one constraint per state element.
 * Inputs are linear combinations over existing protoboard variables; the
 * caller assigns them before generate_r1cs_witness.
 */
class PoseidonGadget : public libsnark::gadget<FieldT>
{
public:
    PoseidonGadget(
        libsnark::protoboard<FieldT>& pb,
        std::vector<libsnark::pb_linear_combination<FieldT>> const& inputs,
        std::string const& annotation);

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    /** Output variable, state[0] after the last round. */
    libsnark::pb_variable<FieldT> const& result() const
    {
        return state_.back()[0];
    }

private:
    struct SBox
    {
        libsnark::pb_variable<FieldT> x2;
        libsnark::pb_variable<FieldT> x4;
        libsnark::pb_variable<FieldT> x5;
    };

    // State entering round r, after the round constant is added.
    libsnark::linear_combination<FieldT> roundInput(std::size_t round, std::size_t i) const;

    // Value of the element after the optional S-box.
    libsnark::linear_combination<FieldT> afterSBox(std::size_t round, std::size_t i) const;

    PoseidonParams const& params_;
    std::vector<libsnark::pb_linear_combination<FieldT>> inputs_;

    // sboxes_[r][i] exists for every element of a full round and for
    // element 0 of a partial round.
    std::vector<std::vector<SBox>> sboxes_;
    std::vector<std::vector<libsnark::pb_variable<FieldT>>> state_;
};

}  // namespace zkp
}  // namespace umbra
