#include <libumbra/zkp/circuits/PoseidonGadget.h>

#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

namespace umbra {
namespace zkp {

using libsnark::linear_combination;
using libsnark::pb_variable;
using libsnark::r1cs_constraint;
using libsnark::variable;

PoseidonGadget::PoseidonGadget(
    libsnark::protoboard<FieldT>& pb,
    std::vector<libsnark::pb_linear_combination<FieldT>> const& inputs,
    std::string const& annotation)
    : libsnark::gadget<FieldT>(pb, annotation)
    , params_(PoseidonParams::forArity(inputs.size()))
    , inputs_(inputs)
{
    std::size_t const t = params_.width;
    sboxes_.resize(params_.rounds());
    state_.resize(params_.rounds());

    for (std::size_t r = 0; r < params_.rounds(); ++r)
    {
        std::size_t const boxes = params_.isFullRound(r) ? t : 1;
        sboxes_[r].resize(boxes);
        for (std::size_t i = 0; i < boxes; ++i)
        {
            std::string const tag =
                annotation + "_r" + std::to_string(r) + "_" + std::to_string(i);
            sboxes_[r][i].x2.allocate(pb, tag + "_x2");
            sboxes_[r][i].x4.allocate(pb, tag + "_x4");
            sboxes_[r][i].x5.allocate(pb, tag + "_x5");
        }

        state_[r].resize(t);
        for (std::size_t i = 0; i < t; ++i)
            state_[r][i].allocate(
                pb, annotation + "_s" + std::to_string(r) + "_" + std::to_string(i));
    }
}

linear_combination<FieldT>
PoseidonGadget::roundInput(std::size_t round, std::size_t i) const
{
    linear_combination<FieldT> lc;
    if (round == 0)
    {
        // Capacity element starts at zero.
        if (i > 0)
            lc = inputs_[i - 1];
    }
    else
    {
        lc.add_term(state_[round - 1][i], FieldT::one());
    }
    lc.add_term(variable<FieldT>(0), params_.constant(round, i));
    return lc;
}

linear_combination<FieldT>
PoseidonGadget::afterSBox(std::size_t round, std::size_t i) const
{
    if (i < sboxes_[round].size())
        return linear_combination<FieldT>(sboxes_[round][i].x5);
    return roundInput(round, i);
}

void
PoseidonGadget::generate_r1cs_constraints()
{
    std::size_t const t = params_.width;
    for (std::size_t r = 0; r < params_.rounds(); ++r)
    {
        for (std::size_t i = 0; i < sboxes_[r].size(); ++i)
        {
            auto const x = roundInput(r, i);
            auto const& box = sboxes_[r][i];
            this->pb.add_r1cs_constraint(
                r1cs_constraint<FieldT>(x, x, box.x2), "poseidon_x2");
            this->pb.add_r1cs_constraint(
                r1cs_constraint<FieldT>(box.x2, box.x2, box.x4), "poseidon_x4");
            this->pb.add_r1cs_constraint(
                r1cs_constraint<FieldT>(box.x4, x, box.x5), "poseidon_x5");
        }

        for (std::size_t i = 0; i < t; ++i)
        {
            linear_combination<FieldT> mixed;
            for (std::size_t j = 0; j < t; ++j)
                mixed = mixed + afterSBox(r, j) * params_.mds[i][j];
            this->pb.add_r1cs_constraint(
                r1cs_constraint<FieldT>(1, mixed, state_[r][i]), "poseidon_mix");
        }
    }
}

void
PoseidonGadget::generate_r1cs_witness()
{
    std::size_t const t = params_.width;

    std::vector<FieldT> state(t, FieldT::zero());
    for (std::size_t i = 0; i < inputs_.size(); ++i)
    {
        inputs_[i].evaluate(this->pb);
        state[i + 1] = this->pb.lc_val(inputs_[i]);
    }

    std::vector<FieldT> next(t);
    for (std::size_t r = 0; r < params_.rounds(); ++r)
    {
        for (std::size_t i = 0; i < t; ++i)
            state[i] += params_.constant(r, i);

        for (std::size_t i = 0; i < sboxes_[r].size(); ++i)
        {
            auto const& box = sboxes_[r][i];
            FieldT const x = state[i];
            this->pb.val(box.x2) = x * x;
            this->pb.val(box.x4) = this->pb.val(box.x2) * this->pb.val(box.x2);
            this->pb.val(box.x5) = this->pb.val(box.x4) * x;
            state[i] = this->pb.val(box.x5);
        }

        for (std::size_t i = 0; i < t; ++i)
        {
            FieldT acc = FieldT::zero();
            for (std::size_t j = 0; j < t; ++j)
                acc += params_.mds[i][j] * state[j];
            next[i] = acc;
            this->pb.val(state_[r][i]) = acc;
        }
        state.swap(next);
    }
}

}  // namespace zkp
}  // namespace umbra
