#include <libumbra/zkp/PoseidonHasher.h>

#include <algorithm>
#include <array>
#include <memory>
#include <mutex>

namespace umbra {
namespace zkp {

namespace {

// Partial round counts for t = 2, 3, 4, 5 at the 128-bit level.
constexpr std::array<std::size_t, 4> partialRoundsByWidth = {56, 57, 56, 60};
constexpr std::size_t fullRounds = 8;

std::unique_ptr<PoseidonParams>
makeParams(std::size_t arity)
{
    auto p = std::make_unique<PoseidonParams>();
    std::size_t const t = arity + 1;
    p->width = t;
    p->fullRounds = fullRounds;
    p->partialRounds = partialRoundsByWidth[arity - 1];

    std::string const prefix = "umbra.poseidon.t" + std::to_string(t) + ".c";
    std::size_t const count = p->rounds() * t;
    p->roundConstants.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
        p->roundConstants.push_back(hashToField(prefix + std::to_string(i)));

    p->mds.assign(t, std::vector<FieldT>(t));
    for (std::size_t i = 0; i < t; ++i)
        for (std::size_t j = 0; j < t; ++j)
            p->mds[i][j] = fieldFromUint64(i + t + j).inverse();

    return p;
}

}  // namespace

PoseidonParams const&
PoseidonParams::forArity(std::size_t arity)
{
    if (arity == 0 || arity > PoseidonHasher::maxArity)
        throw InputValidationError(
            "unsupported Poseidon arity " + std::to_string(arity));

    initCurveParameters();

    static std::array<std::unique_ptr<PoseidonParams>, PoseidonHasher::maxArity> tables;
    static std::array<std::once_flag, PoseidonHasher::maxArity> built;
    std::call_once(built[arity - 1], [arity] { tables[arity - 1] = makeParams(arity); });
    return *tables[arity - 1];
}

FieldT
PoseidonHasher::sbox(FieldT const& x)
{
    FieldT const x2 = x * x;
    FieldT const x4 = x2 * x2;
    return x4 * x;
}

void
PoseidonHasher::permute(PoseidonParams const& params, std::vector<FieldT>& state)
{
    std::size_t const t = params.width;
    std::vector<FieldT> next(t);

    for (std::size_t r = 0; r < params.rounds(); ++r)
    {
        for (std::size_t i = 0; i < t; ++i)
            state[i] += params.constant(r, i);

        if (params.isFullRound(r))
        {
            for (std::size_t i = 0; i < t; ++i)
                state[i] = sbox(state[i]);
        }
        else
        {
            state[0] = sbox(state[0]);
        }

        for (std::size_t i = 0; i < t; ++i)
        {
            FieldT acc = FieldT::zero();
            for (std::size_t j = 0; j < t; ++j)
                acc += params.mds[i][j] * state[j];
            next[i] = acc;
        }
        state.swap(next);
    }
}

FieldT
PoseidonHasher::hash(std::vector<FieldT> const& inputs)
{
    auto const& params = PoseidonParams::forArity(inputs.size());

    std::vector<FieldT> state(params.width, FieldT::zero());
    std::copy(inputs.begin(), inputs.end(), state.begin() + 1);
    permute(params, state);
    return state[0];
}

FieldT
PoseidonHasher::hash2(FieldT const& a, FieldT const& b)
{
    return hash({a, b});
}

FieldT
PoseidonHasher::hash4(
    FieldT const& a, FieldT const& b, FieldT const& c, FieldT const& d)
{
    return hash({a, b, c, d});
}

}  // namespace zkp
}  // namespace umbra
