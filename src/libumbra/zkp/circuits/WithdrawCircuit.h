#pragma once

#include <libumbra/zkp/circuits/PoolCircuit.h>

namespace umbra {
namespace zkp {

/**
 * Withdraw circuit
 *
 * PUBLIC:  [merkleRoot, nullifierHash, recipient, relayer, fee, refund]
 * PRIVATE: secret, nullifier, amount, recipientBinding, path siblings and bits
 *
 * CONSTRAINTS:
 * - cm = Poseidon(secret, nullifier, amount, recipientBinding) is in the
 *   tree under merkleRoot
 * - nullifierHash = Poseidon(nullifier, secret)
 * - recipient, relayer < 2^160
 * - fee, refund, amount, amount - fee < 2^128, so fee <= amount
 */
class WithdrawCircuit : public PoolCircuit
{
public:
    explicit WithdrawCircuit(std::size_t treeDepth);
    ~WithdrawCircuit() override;

protected:
    void generateConstraints() override;
    void assignWitness(WitnessVector const& witness) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace zkp
}  // namespace umbra
