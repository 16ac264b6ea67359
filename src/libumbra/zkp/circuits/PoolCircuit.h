#pragma once

#include <libumbra/zkp/Witness.h>

#include <libsnark/gadgetlib1/protoboard.hpp>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/r1cs.hpp>

#include <memory>

namespace umbra {
namespace zkp {

/**
 * A compiled-in circuit of the pool family over its own protoboard.
 *
 * Instances are single use per witness: ProofService builds a fresh one
 * for every proof so concurrent proofs never share mutable state. Public
 * inputs are allocated first, in the order of the circuit's signal layout.
 */
class PoolCircuit
{
public:
    virtual ~PoolCircuit() = default;

    PoolCircuit(PoolCircuit const&) = delete;
    PoolCircuit& operator=(PoolCircuit const&) = delete;

    /** Fresh, constraint-generated circuit of the given kind. */
    static std::unique_ptr<PoolCircuit> create(CircuitId id, std::size_t treeDepth);

    CircuitId id() const
    {
        return id_;
    }

    std::size_t treeDepth() const
    {
        return treeDepth_;
    }

    std::size_t numPublicInputs() const
    {
        return publicInputCount(id_);
    }

    /**
     * Assigns every variable from witness.
     *
     * @return true when the constraint system is satisfied.
     * @throws WitnessGenerationError if the witness does not fit this circuit
     *         or a range check fails.
     */
    bool generateWitness(WitnessVector const& witness);

    libsnark::r1cs_constraint_system<FieldT> getConstraintSystem() const;
    libsnark::r1cs_primary_input<FieldT> getPrimaryInput() const;
    libsnark::r1cs_auxiliary_input<FieldT> getAuxiliaryInput() const;

protected:
    PoolCircuit(CircuitId id, std::size_t treeDepth);

    virtual void generateConstraints() = 0;
    virtual void assignWitness(WitnessVector const& witness) = 0;

    libsnark::protoboard<FieldT> pb_;

private:
    CircuitId const id_;
    std::size_t const treeDepth_;
};

}  // namespace zkp
}  // namespace umbra
