#include <libumbra/zkp/circuits/PoolCircuit.h>
#include <libumbra/zkp/circuits/DepositCircuit.h>
#include <libumbra/zkp/circuits/WithdrawCircuit.h>

namespace umbra {
namespace zkp {

PoolCircuit::PoolCircuit(CircuitId id, std::size_t treeDepth)
    : id_(id), treeDepth_(treeDepth)
{
    if (treeDepth_ == 0 || treeDepth_ > MerkleTreeManager::maxDepth)
        throw InputValidationError(
            "circuit tree depth " + std::to_string(treeDepth_) + " out of range");
}

std::unique_ptr<PoolCircuit>
PoolCircuit::create(CircuitId id, std::size_t treeDepth)
{
    initCurveParameters();

    std::unique_ptr<PoolCircuit> circuit;
    switch (id)
    {
        case CircuitId::deposit:
            circuit = std::make_unique<DepositCircuit>(treeDepth);
            break;
        case CircuitId::withdraw:
            circuit = std::make_unique<WithdrawCircuit>(treeDepth);
            break;
    }
    if (!circuit)
        throw InputValidationError("unknown circuit id");

    circuit->generateConstraints();
    return circuit;
}

bool
PoolCircuit::generateWitness(WitnessVector const& witness)
{
    if (witness.circuit != id_)
        throw WitnessGenerationError(
            std::string("witness built for ") + to_string(witness.circuit) +
            ", circuit is " + to_string(id_));
    if (witness.publicSignals.size() != numPublicInputs())
        throw WitnessGenerationError(
            "witness has " + std::to_string(witness.publicSignals.size()) +
            " public signals, circuit expects " +
            std::to_string(numPublicInputs()));
    if (witness.path.depth() != treeDepth_)
        throw WitnessGenerationError(
            "witness path depth " + std::to_string(witness.path.depth()) +
            " does not match circuit depth " + std::to_string(treeDepth_));

    assignWitness(witness);
    return pb_.is_satisfied();
}

libsnark::r1cs_constraint_system<FieldT>
PoolCircuit::getConstraintSystem() const
{
    return pb_.get_constraint_system();
}

libsnark::r1cs_primary_input<FieldT>
PoolCircuit::getPrimaryInput() const
{
    return pb_.primary_input();
}

libsnark::r1cs_auxiliary_input<FieldT>
PoolCircuit::getAuxiliaryInput() const
{
    return pb_.auxiliary_input();
}

}  // namespace zkp
}  // namespace umbra
