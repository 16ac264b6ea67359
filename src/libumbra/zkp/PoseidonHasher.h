#pragma once

#include <libumbra/zkp/FieldElement.h>

#include <cstddef>
#include <vector>

namespace umbra {
namespace zkp {

/**
 * Poseidon permutation parameters for one state width.
 *
 * Width t = arity + 1. Round constants are derived from SHA-256 of a
 * domain label, the MDS matrix is the Cauchy matrix 1 / (i + t + j).
 * The same tables drive both the native hasher and PoseidonGadget, so the
 * two can never disagree.
 */
struct PoseidonParams
{
    std::size_t width;
    std::size_t fullRounds;
    std::size_t partialRounds;
    std::vector<FieldT> roundConstants;        // (fullRounds + partialRounds) * width
    std::vector<std::vector<FieldT>> mds;      // width x width

    std::size_t rounds() const
    {
        return fullRounds + partialRounds;
    }

    bool isFullRound(std::size_t round) const
    {
        return round < fullRounds / 2 || round >= fullRounds / 2 + partialRounds;
    }

    FieldT const& constant(std::size_t round, std::size_t i) const
    {
        return roundConstants[round * width + i];
    }

    /** Shared, lazily built tables for arity 1 through 4. */
    static PoseidonParams const& forArity(std::size_t arity);
};

class PoseidonHasher
{
public:
    static constexpr std::size_t maxArity = 4;

    /** Hashes 1 to 4 field elements. */
    static FieldT hash(std::vector<FieldT> const& inputs);

    static FieldT hash2(FieldT const& a, FieldT const& b);
    static FieldT hash4(
        FieldT const& a, FieldT const& b, FieldT const& c, FieldT const& d);

    /** Applies the full permutation in place. */
    static void permute(PoseidonParams const& params, std::vector<FieldT>& state);

    static FieldT sbox(FieldT const& x);
};

}  // namespace zkp
}  // namespace umbra
