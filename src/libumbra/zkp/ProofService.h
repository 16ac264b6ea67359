#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/zkp/CircuitArtifacts.h>
#include <libumbra/zkp/ProofCodec.h>
#include <libumbra/zkp/ProverQueue.h>
#include <libumbra/zkp/Witness.h>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace umbra {
namespace zkp {

/**
 * Handle to a proof request running on the prover queue.
 *
 * Dropping or cancelling a ticket abandons the request: a job that has not
 * started never runs, and the result of one that already finished is not
 * handed out.
 */
class ProofTicket
{
public:
    ProofTicket() = default;

    ProofTicket(ProofTicket&& other) noexcept = default;

    /** Abandons the request this ticket held before taking other's. */
    ProofTicket& operator=(ProofTicket&& other) noexcept
    {
        if (this != &other)
        {
            cancel();
            job_ = std::move(other.job_);
            result_ = std::move(other.result_);
        }
        return *this;
    }

    ~ProofTicket()
    {
        cancel();
    }

    bool valid() const
    {
        return job_ != nullptr;
    }

    /**
     * Blocks for the result.
     *
     * @throws TimeoutError if the request was cancelled, or whatever the
     *         proof generation raised.
     */
    Proof wait();

    /** @return true once the result is ready. */
    bool waitFor(std::chrono::milliseconds timeout);

    void cancel() noexcept;

    bool cancelled() const;

private:
    friend class ProofService;

    ProofTicket(std::shared_ptr<ProverJob> job, std::future<Proof> result)
        : job_(std::move(job)), result_(std::move(result))
    {
    }

    std::shared_ptr<ProverJob> job_;
    std::future<Proof> result_;
};

/**
 * Groth16 proving and verification over the compiled-in pool circuits.
 *
 * Holds a typed registry of loaded circuits. Keys are shared read-only;
 * every proof builds a private protoboard on a queue worker, so the
 * service may be used from any number of threads.
 */
class ProofService
{
public:
    struct Setup
    {
        std::size_t workers = 2;
    };

    ProofService(Setup const& setup, Journal j);
    ~ProofService();

    ProofService(ProofService const&) = delete;
    ProofService& operator=(ProofService const&) = delete;

    /**
     * Loads and cross-checks the artifacts of a circuit. A circuit that is
     * already loaded is left alone.
     *
     * @throws CircuitLoadError if files are missing or inconsistent
     * @throws TimeoutError if timeout expires first; nothing is installed
     */
    void loadCircuit(
        CircuitId id,
        CircuitArtifactPaths const& paths,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /** @throws InputValidationError for an unknown circuit name */
    void loadCircuit(
        std::string const& name,
        CircuitArtifactPaths const& paths,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool isLoaded(CircuitId id) const;

    /** @throws ProvingKeyMissingError if id is not loaded */
    CircuitDescriptor descriptor(CircuitId id) const;

    /** snarkjs verification_key.json of a loaded circuit. */
    Json::Value exportVerifyingKey(CircuitId id) const;

    /**
     * Proves witness, blocking until done.
     *
     * @throws ProvingKeyMissingError if id was never loaded
     * @throws WitnessGenerationError if the witness does not satisfy the
     *         circuit, such as a Merkle path that does not reach the root
     */
    Proof prove(CircuitId id, WitnessVector const& witness);

    /**
     * As prove(), but gives up after timeout.
     *
     * @throws TimeoutError on expiry; the request is cancelled.
     */
    Proof prove(CircuitId id, WitnessVector const& witness, std::chrono::milliseconds timeout);

    /** Queues a proof and returns immediately. */
    ProofTicket submit(CircuitId id, WitnessVector const& witness);

    /**
     * Checks proof against publicSignals. Returns false for malformed
     * proofs, wrong signal counts and circuits that are not loaded.
     */
    bool verify(
        CircuitId id,
        Proof const& proof,
        std::vector<FieldT> const& publicSignals) const;

    /** Decodes calldata first; a decoding failure yields false. */
    bool verifyCalldata(
        CircuitId id,
        ProofCalldata const& calldata,
        std::vector<FieldT> const& publicSignals) const;

    std::size_t workers() const
    {
        return queue_.workers();
    }

    /** Non-production key generation into the standard file names. */
    static CircuitArtifactPaths bootstrapCircuit(
        CircuitId id, std::size_t treeDepth, std::string const& directory, Journal j);

private:
    std::shared_ptr<LoadedCircuit const> find(CircuitId id) const;
    std::shared_ptr<LoadedCircuit const> require(CircuitId id) const;

    static Proof generate(LoadedCircuit const& circuit, WitnessVector const& witness);

    Journal j_;

    mutable std::shared_mutex mutex_;
    std::map<CircuitId, std::shared_ptr<LoadedCircuit const>> circuits_;

    ProverQueue queue_;
};

}  // namespace zkp
}  // namespace umbra
