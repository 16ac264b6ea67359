#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/zkp/ProofCodec.h>
#include <libumbra/zkp/Witness.h>

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <json/value.h>

#include <memory>
#include <string>
#include <vector>

namespace umbra {
namespace zkp {

using ProvingKey = libsnark::r1cs_gg_ppzksnark_proving_key<DefaultCurve>;
using ProcessedVerifyingKey =
    libsnark::r1cs_gg_ppzksnark_processed_verification_key<DefaultCurve>;

/** Where the four files of one circuit live. */
struct CircuitArtifactPaths
{
    std::string constraintSystem;  // <name>.r1cs
    std::string witnessProgram;    // <name>.circuit.json
    std::string provingKey;        // <name>.pk
    std::string verifyingKey;      // <name>_verification_key.json

    /** Standard file names for id inside directory. */
    static CircuitArtifactPaths inDirectory(std::string const& directory, CircuitId id);
};

/**
 * Witness-generation program descriptor. The witness generators are
 * compiled in; the descriptor selects one and pins its parameters so a
 * mismatched artifact set is caught at load time.
 */
struct CircuitDescriptor
{
    CircuitId id = CircuitId::deposit;
    std::size_t treeDepth = 0;
    std::size_t numPublicInputs = 0;
    std::size_t numConstraints = 0;
    std::size_t numVariables = 0;

    Json::Value toJson() const;

    /** @throws CircuitLoadError */
    static CircuitDescriptor fromJson(Json::Value const& v);
};

/** Groth16 verifying key in the affine form snarkjs exports. */
struct VerifyingKey
{
    G1T alpha;
    G2T beta;
    G2T gamma;
    G2T delta;
    std::vector<G1T> ic;

    libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve> toSnark() const;

    Json::Value toJson() const;

    /** @throws CircuitLoadError */
    static VerifyingKey fromJson(Json::Value const& v);
};

/** A fully loaded circuit, shared read-only between proofs. */
struct LoadedCircuit
{
    CircuitDescriptor descriptor;
    CircuitArtifactPaths paths;
    ProvingKey provingKey;
    VerifyingKey verifyingKey;
    ProcessedVerifyingKey processedKey;
};

/**
 * Reads and cross-checks all four artifacts of id.
 *
 * @throws CircuitLoadError naming missing, unreadable or inconsistent files
 */
std::shared_ptr<LoadedCircuit const> loadCircuitArtifacts(
    CircuitId id, CircuitArtifactPaths const& paths, Journal j);

/**
 * Local, non-production trusted setup: generates a keypair for id at the
 * given tree depth and writes all four artifacts. The toxic waste lives
 * in this process's memory only; never use the result to secure funds.
 */
void bootstrapCircuitArtifacts(
    CircuitId id, std::size_t treeDepth, CircuitArtifactPaths const& paths, Journal j);

}  // namespace zkp
}  // namespace umbra
