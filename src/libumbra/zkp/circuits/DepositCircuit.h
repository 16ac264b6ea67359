#pragma once

#include <libumbra/zkp/circuits/PoolCircuit.h>

namespace umbra {
namespace zkp {

/**
 * Deposit circuit
 *
 * PUBLIC:  [merkleRoot, commitment, amount]
 * PRIVATE: secret, nullifier, recipientBinding, path siblings and bits
 *
 * Proves commitment = Poseidon(secret, nullifier, amount, recipientBinding),
 * that the commitment sits in the tree under merkleRoot, and that amount
 * fits in 128 bits.
 */
class DepositCircuit : public PoolCircuit
{
public:
    explicit DepositCircuit(std::size_t treeDepth);
    ~DepositCircuit() override;

protected:
    void generateConstraints() override;
    void assignWitness(WitnessVector const& witness) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace zkp
}  // namespace umbra
