#include <libumbra/zkp/ShieldedPool.h>

#include <filesystem>

namespace umbra {
namespace zkp {

ShieldedPool::ShieldedPool(
    MerkleTreeManager& tree,
    NullifierRegistry& registry,
    ProofService& prover,
    Journal j)
    : tree_(tree)
    , registry_(registry)
    , prover_(prover)
    , builder_(j, &tree, &registry)
    , j_(j)
{
}

Proof
ShieldedPool::prove(
    CircuitId id,
    WitnessVector const& witness,
    std::optional<std::chrono::milliseconds> timeout)
{
    if (timeout)
        return prover_.prove(id, witness, *timeout);
    return prover_.prove(id, witness);
}

DepositReceipt
ShieldedPool::deposit(Note const& note, std::optional<std::chrono::milliseconds> timeout)
{
    auto const base = builder_.buildDepositWitness(note);

    for (int attempt = 1; attempt <= depositAttempts; ++attempt)
    {
        auto const preview = tree_.previewAppend(base.commitment);

        auto witness = base;
        builder_.bindInclusion(witness, preview);
        auto proof = prove(CircuitId::deposit, witness, timeout);

        if (auto const appended = tree_.appendAt(preview.leafIndex, base.commitment))
        {
            JLOG(j_.info()) << "deposit at leaf " << appended->leafIndex;
            return {appended->leafIndex, appended->newRoot, std::move(proof)};
        }

        JLOG(j_.debug()) << "tree advanced past leaf " << preview.leafIndex
                         << " while proving, attempt " << attempt;
    }

    throw StateInvariantError(
        "deposit lost the append race " + std::to_string(depositAttempts) + " times");
}

Proof
ShieldedPool::withdraw(
    Note const& note,
    std::uint64_t leafIndex,
    WithdrawalParams const& params,
    std::optional<std::chrono::milliseconds> timeout)
{
    if (registry_.isSpent(note.nullifierHash()))
        throw NullifierReplayError("note is already spent");

    auto const inclusion = tree_.proveInclusion(leafIndex);
    auto const witness = builder_.buildWithdrawalWitness(note, inclusion, params);

    JLOG(j_.debug()) << "proving withdrawal of leaf " << leafIndex;
    return prove(CircuitId::withdraw, witness, timeout);
}

void
ShieldedPool::acceptWithdrawal(Proof const& proof)
{
    auto const& signals = proof.publicSignals;
    if (signals.size() != withdraw_signal::count)
        throw InputValidationError(
            "withdrawal carries " + std::to_string(signals.size()) +
            " public signals, expected " + std::to_string(withdraw_signal::count));

    if (!tree_.isKnownRoot(signals[withdraw_signal::merkleRoot]))
        throw UnknownRootError(
            "withdrawal root " + fieldToHex(signals[withdraw_signal::merkleRoot]) +
            " is not a known root");

    auto const& nullifierHash = signals[withdraw_signal::nullifierHash];
    if (registry_.isSpent(nullifierHash))
        throw NullifierReplayError(
            "nullifier hash " + fieldToHex(nullifierHash) + " already spent");

    if (!prover_.verify(CircuitId::withdraw, proof, signals))
        throw MalformedProofError("withdrawal proof does not verify");

    registry_.markSpent(nullifierHash);
    JLOG(j_.info()) << "accepted withdrawal " << fieldToHex(nullifierHash);
}

//------------------------------------------------------------------------------

std::shared_ptr<PoolStore>
PoolEngine::openStore(PoolConfig const& config)
{
    if (config.storeDirectory.empty())
        return std::make_shared<MemoryPoolStore>();
    return std::make_shared<FilePoolStore>(config.storeDirectory);
}

PoolEngine::PoolEngine(PoolConfig const& config, Journal j)
    : config_(config)
    , j_(j)
    , store_(openStore(config))
    , tree_({config.treeDepth, config.rootHistory, store_}, j)
    , registry_(j, store_)
    , prover_({config.proverWorkers}, j)
    , pool_(tree_, registry_, prover_, j)
{
    loadCircuits();
}

void
PoolEngine::loadCircuits()
{
    if (config_.artifactDirectory.empty())
    {
        JLOG(j_.warn()) << "no artifact directory configured, circuits not loaded";
        return;
    }

    for (auto const id : {CircuitId::deposit, CircuitId::withdraw})
    {
        auto paths = CircuitArtifactPaths::inDirectory(config_.artifactDirectory, id);

        std::error_code ec;
        if (config_.bootstrap && !std::filesystem::exists(paths.witnessProgram, ec))
            paths = ProofService::bootstrapCircuit(
                id, config_.treeDepth, config_.artifactDirectory, j_);

        prover_.loadCircuit(id, paths, config_.loadTimeout);

        auto const depth = prover_.descriptor(id).treeDepth;
        if (depth != config_.treeDepth)
            throw CircuitLoadError(
                std::string(to_string(id)) + " circuit was built for depth " +
                std::to_string(depth) + ", pool depth is " +
                std::to_string(config_.treeDepth));
    }
}

}  // namespace zkp
}  // namespace umbra
