#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/zkp/MerkleTreeManager.h>
#include <libumbra/zkp/NullifierRegistry.h>
#include <libumbra/zkp/PoolConfig.h>
#include <libumbra/zkp/PoolStore.h>
#include <libumbra/zkp/ProofService.h>
#include <libumbra/zkp/WitnessBuilder.h>

#include <chrono>
#include <memory>
#include <optional>

namespace umbra {
namespace zkp {

struct DepositReceipt
{
    std::uint64_t leafIndex = 0;
    FieldT root;
    Proof proof;
};

/**
 * Deposit and withdrawal flows over one tree, registry and prover.
 *
 * Proving never runs under the tree or registry locks: witnesses are
 * built from a snapshot, proven, and only then committed. A failed or
 * timed out proof leaves the pool untouched.
 */
class ShieldedPool
{
public:
    static constexpr int depositAttempts = 3;

    ShieldedPool(
        MerkleTreeManager& tree,
        NullifierRegistry& registry,
        ProofService& prover,
        Journal j);

    /**
     * Proves the deposit of note against the root its insertion produces,
     * then appends it. If another append lands first the deposit is
     * re-proven at the new position.
     *
     * @throws StateInvariantError when every attempt lost the race
     */
    DepositReceipt deposit(
        Note const& note,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Withdrawal proof for the note at leafIndex. Spent notes are rejected
     * before any proving.
     */
    Proof withdraw(
        Note const& note,
        std::uint64_t leafIndex,
        WithdrawalParams const& params,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * The verifier's acceptance rule: known root, valid proof, unspent
     * nullifier hash, which is then marked spent.
     *
     * @throws UnknownRootError, MalformedProofError, NullifierReplayError
     */
    void acceptWithdrawal(Proof const& proof);

    MerkleTreeManager const& tree() const
    {
        return tree_;
    }

    NullifierRegistry const& registry() const
    {
        return registry_;
    }

private:
    Proof prove(
        CircuitId id,
        WitnessVector const& witness,
        std::optional<std::chrono::milliseconds> timeout);

    MerkleTreeManager& tree_;
    NullifierRegistry& registry_;
    ProofService& prover_;
    WitnessBuilder builder_;
    Journal j_;
};

/**
 * A pool with all of its parts, assembled from a PoolConfig.
 *
 * Circuits are loaded from the configured artifact directory; missing
 * artifacts are generated first when bootstrap is enabled.
 */
class PoolEngine
{
public:
    PoolEngine(PoolConfig const& config, Journal j);

    PoolEngine(PoolEngine const&) = delete;
    PoolEngine& operator=(PoolEngine const&) = delete;

    ShieldedPool& pool()
    {
        return pool_;
    }

    ProofService& prover()
    {
        return prover_;
    }

    PoolConfig const& config() const
    {
        return config_;
    }

private:
    static std::shared_ptr<PoolStore> openStore(PoolConfig const& config);

    void loadCircuits();

    PoolConfig const config_;
    Journal j_;
    std::shared_ptr<PoolStore> store_;
    MerkleTreeManager tree_;
    NullifierRegistry registry_;
    ProofService prover_;
    ShieldedPool pool_;
};

}  // namespace zkp
}  // namespace umbra
