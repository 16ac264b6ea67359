#pragma once

#include <libumbra/zkp/FieldElement.h>

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <json/value.h>

#include <array>
#include <string>
#include <vector>

namespace umbra {
namespace zkp {

using SnarkProof = libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>;

/** A Groth16 proof and the public signals it was generated against. */
struct Proof
{
    G1T a;
    G2T b;
    G1T c;
    std::vector<FieldT> publicSignals;

    SnarkProof toSnark() const;
    static Proof fromSnark(SnarkProof const& p, std::vector<FieldT> publicSignals);

    bool operator==(Proof const& other) const;
    bool operator!=(Proof const& other) const
    {
        return !(*this == other);
    }
};

/**
 * Verifier-contract calldata:
 *   [A.x, A.y, B.x.c1, B.x.c0, B.y.c1, B.y.c0, C.x, C.y]
 * Each entry is "0x" plus 64 hex digits. B's coordinates are written
 * imaginary part first, which is what the pairing precompile expects.
 */
using ProofCalldata = std::array<std::string, 8>;

ProofCalldata encodeCalldata(Proof const& proof);

/**
 * Inverse of encodeCalldata. Public signals are not part of the calldata
 * and are left empty.
 *
 * @throws MalformedProofError for words other than "0x" plus 64 lowercase
 *         hex digits, non-canonical coordinates, points off the curve, or B
 *         outside the prime-order subgroup.
 */
Proof decodeCalldata(ProofCalldata const& calldata);

/** snarkjs proof.json layout (pi_a, pi_b, pi_c, decimal strings). */
Json::Value proofToJson(Proof const& proof);
Proof proofFromJson(Json::Value const& v);

/** Decimal strings, as snarkjs writes public.json. */
Json::Value publicSignalsToJson(std::vector<FieldT> const& signals);
std::vector<FieldT> publicSignalsFromJson(Json::Value const& v);

/** Projective points as snarkjs coordinate arrays. */
Json::Value g1ToJson(G1T const& p);
Json::Value g2ToJson(G2T const& p);

/** @throws MalformedProofError */
G1T g1FromJson(Json::Value const& v);
G2T g2FromJson(Json::Value const& v);

}  // namespace zkp
}  // namespace umbra
