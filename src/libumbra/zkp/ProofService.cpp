#include <libumbra/zkp/ProofService.h>
#include <libumbra/zkp/circuits/PoolCircuit.h>

#include <mutex>

namespace umbra {
namespace zkp {

Proof
ProofTicket::wait()
{
    if (!job_)
        throw StateInvariantError("empty proof ticket");
    if (job_->isCancelled())
        throw TimeoutError("proof request was cancelled");
    return result_.get();
}

bool
ProofTicket::waitFor(std::chrono::milliseconds timeout)
{
    if (!job_)
        return false;
    return result_.wait_for(timeout) == std::future_status::ready;
}

void
ProofTicket::cancel() noexcept
{
    if (job_)
        job_->cancel();
}

bool
ProofTicket::cancelled() const
{
    return job_ && job_->isCancelled();
}

//------------------------------------------------------------------------------

ProofService::ProofService(Setup const& setup, Journal j)
    : j_(j), queue_(setup.workers, j)
{
    initCurveParameters();
}

ProofService::~ProofService()
{
    queue_.close();
}

void
ProofService::loadCircuit(
    CircuitId id,
    CircuitArtifactPaths const& paths,
    std::optional<std::chrono::milliseconds> timeout)
{
    if (isLoaded(id))
    {
        JLOG(j_.debug()) << to_string(id) << " circuit already loaded";
        return;
    }

    auto job = std::make_shared<ProverTask<std::shared_ptr<LoadedCircuit const>>>(
        [id, paths, j = j_] { return loadCircuitArtifacts(id, paths, j); });
    auto result = job->getFuture();
    queue_.add(job);

    if (timeout && result.wait_for(*timeout) != std::future_status::ready)
    {
        job->cancel();
        JLOG(j_.warn()) << "loading " << to_string(id) << " circuit timed out after "
                        << timeout->count() << "ms";
        throw TimeoutError(
            std::string("loading ") + to_string(id) + " circuit timed out");
    }

    auto loaded = result.get();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    circuits_.emplace(id, std::move(loaded));
}

void
ProofService::loadCircuit(
    std::string const& name,
    CircuitArtifactPaths const& paths,
    std::optional<std::chrono::milliseconds> timeout)
{
    loadCircuit(circuitIdFromString(name), paths, timeout);
}

bool
ProofService::isLoaded(CircuitId id) const
{
    return find(id) != nullptr;
}

CircuitDescriptor
ProofService::descriptor(CircuitId id) const
{
    return require(id)->descriptor;
}

Json::Value
ProofService::exportVerifyingKey(CircuitId id) const
{
    return require(id)->verifyingKey.toJson();
}

std::shared_ptr<LoadedCircuit const>
ProofService::find(CircuitId id) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto const it = circuits_.find(id);
    if (it == circuits_.end())
        return {};
    return it->second;
}

std::shared_ptr<LoadedCircuit const>
ProofService::require(CircuitId id) const
{
    auto loaded = find(id);
    if (!loaded)
        throw ProvingKeyMissingError(
            std::string("no keys loaded for the ") + to_string(id) + " circuit");
    return loaded;
}

//------------------------------------------------------------------------------

Proof
ProofService::generate(LoadedCircuit const& loaded, WitnessVector const& witness)
{
    auto const id = loaded.descriptor.id;
    auto circuit = PoolCircuit::create(id, loaded.descriptor.treeDepth);

    if (!circuit->generateWitness(witness))
        throw WitnessGenerationError(
            std::string("witness does not satisfy the ") + to_string(id) + " circuit");

    auto const primary = circuit->getPrimaryInput();
    auto const snark = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(
        loaded.provingKey, primary, circuit->getAuxiliaryInput());

    return Proof::fromSnark(snark, primary);
}

ProofTicket
ProofService::submit(CircuitId id, WitnessVector const& witness)
{
    auto loaded = require(id);
    if (!witness.complete())
        throw WitnessGenerationError("witness is incomplete");

    auto job = std::make_shared<ProverTask<Proof>>(
        [loaded, witness, j = j_] {
            auto const started = std::chrono::steady_clock::now();
            auto proof = generate(*loaded, witness);
            JLOG(j.debug())
                << to_string(loaded->descriptor.id) << " proof generated in "
                << std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - started)
                       .count()
                << "ms";
            return proof;
        });
    auto result = job->getFuture();
    queue_.add(job);
    return ProofTicket(std::move(job), std::move(result));
}

Proof
ProofService::prove(CircuitId id, WitnessVector const& witness)
{
    return submit(id, witness).wait();
}

Proof
ProofService::prove(
    CircuitId id, WitnessVector const& witness, std::chrono::milliseconds timeout)
{
    auto ticket = submit(id, witness);
    if (!ticket.waitFor(timeout))
    {
        ticket.cancel();
        JLOG(j_.warn()) << to_string(id) << " proof timed out after "
                        << timeout.count() << "ms";
        throw TimeoutError(std::string(to_string(id)) + " proof timed out");
    }
    return ticket.wait();
}

//------------------------------------------------------------------------------

bool
ProofService::verify(
    CircuitId id, Proof const& proof, std::vector<FieldT> const& publicSignals) const
{
    try
    {
        auto const loaded = find(id);
        if (!loaded)
        {
            JLOG(j_.warn()) << "verify: " << to_string(id) << " circuit not loaded";
            return false;
        }
        if (publicSignals.size() != loaded->descriptor.numPublicInputs)
        {
            JLOG(j_.debug()) << "verify: expected " << loaded->descriptor.numPublicInputs
                             << " public signals, got " << publicSignals.size();
            return false;
        }

        return libsnark::r1cs_gg_ppzksnark_online_verifier_strong_IC<DefaultCurve>(
            loaded->processedKey, publicSignals, proof.toSnark());
    }
    catch (std::exception const& e)
    {
        JLOG(j_.debug()) << "verify: " << e.what();
        return false;
    }
}

bool
ProofService::verifyCalldata(
    CircuitId id,
    ProofCalldata const& calldata,
    std::vector<FieldT> const& publicSignals) const
{
    try
    {
        return verify(id, decodeCalldata(calldata), publicSignals);
    }
    catch (MalformedProofError const& e)
    {
        JLOG(j_.debug()) << "verify: " << e.what();
        return false;
    }
}

CircuitArtifactPaths
ProofService::bootstrapCircuit(
    CircuitId id, std::size_t treeDepth, std::string const& directory, Journal j)
{
    initCurveParameters();
    auto paths = CircuitArtifactPaths::inDirectory(directory, id);
    bootstrapCircuitArtifacts(id, treeDepth, paths, j);
    return paths;
}

}  // namespace zkp
}  // namespace umbra
