#include <libumbra/zkp/ProofCodec.h>

#include <algorithm>

namespace umbra {
namespace zkp {

using Fq2 = libff::alt_bn128_Fq2;

namespace {

/** "0x" and exactly 64 lowercase hex digits, the form encodeCalldata writes. */
bool
isCalldataWord(std::string const& text)
{
    if (text.size() != 66 || text.compare(0, 2, "0x") != 0)
        return false;
    return std::all_of(text.begin() + 2, text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

BaseFieldT
coordinateFromHex(std::string const& text, char const* name)
{
    if (!isCalldataWord(text))
        throw MalformedProofError(
            std::string(name) + " must be 0x followed by 64 lowercase hex digits");
    try
    {
        return fromHex<BaseFieldT>(text);
    }
    catch (InputValidationError const& e)
    {
        throw MalformedProofError(std::string(name) + ": " + e.what());
    }
}

BaseFieldT
coordinateFromJson(Json::Value const& v, char const* name)
{
    if (!v.isString())
        throw MalformedProofError(std::string(name) + " must be a decimal string");
    try
    {
        return fromDecimal<BaseFieldT>(v.asString());
    }
    catch (InputValidationError const& e)
    {
        throw MalformedProofError(std::string(name) + ": " + e.what());
    }
}

G1T
makeG1(BaseFieldT const& x, BaseFieldT const& y)
{
    if (x.is_zero() && y.is_zero())
        return G1T::zero();
    G1T p(x, y, BaseFieldT::one());
    if (!p.is_well_formed())
        throw MalformedProofError("G1 point is not on the curve");
    return p;
}

G2T
makeG2(Fq2 const& x, Fq2 const& y)
{
    if (x.is_zero() && y.is_zero())
        return G2T::zero();
    G2T p(x, y, Fq2::one());
    if (!p.is_well_formed())
        throw MalformedProofError("G2 point is not on the twist");
    if (!(libff::alt_bn128_modulus_r * p).is_zero())
        throw MalformedProofError("G2 point is not in the prime-order subgroup");
    return p;
}

std::pair<BaseFieldT, BaseFieldT>
affine(G1T p)
{
    if (p.is_zero())
        return {BaseFieldT::zero(), BaseFieldT::zero()};
    p.to_affine_coordinates();
    return {p.X, p.Y};
}

std::pair<Fq2, Fq2>
affine(G2T p)
{
    if (p.is_zero())
        return {Fq2::zero(), Fq2::zero()};
    p.to_affine_coordinates();
    return {p.X, p.Y};
}

}  // namespace

SnarkProof
Proof::toSnark() const
{
    return SnarkProof(G1T(a), G2T(b), G1T(c));
}

Proof
Proof::fromSnark(SnarkProof const& p, std::vector<FieldT> publicSignals)
{
    return Proof{p.g_A, p.g_B, p.g_C, std::move(publicSignals)};
}

bool
Proof::operator==(Proof const& other) const
{
    return a == other.a && b == other.b && c == other.c &&
        publicSignals == other.publicSignals;
}

//------------------------------------------------------------------------------

ProofCalldata
encodeCalldata(Proof const& proof)
{
    auto const [ax, ay] = affine(proof.a);
    auto const [bx, by] = affine(proof.b);
    auto const [cx, cy] = affine(proof.c);

    return {
        toHex(ax),
        toHex(ay),
        toHex(bx.c1),
        toHex(bx.c0),
        toHex(by.c1),
        toHex(by.c0),
        toHex(cx),
        toHex(cy)};
}

Proof
decodeCalldata(ProofCalldata const& d)
{
    Proof proof;
    proof.a = makeG1(coordinateFromHex(d[0], "A.x"), coordinateFromHex(d[1], "A.y"));
    proof.b = makeG2(
        Fq2(coordinateFromHex(d[3], "B.x.c0"), coordinateFromHex(d[2], "B.x.c1")),
        Fq2(coordinateFromHex(d[5], "B.y.c0"), coordinateFromHex(d[4], "B.y.c1")));
    proof.c = makeG1(coordinateFromHex(d[6], "C.x"), coordinateFromHex(d[7], "C.y"));
    return proof;
}

//------------------------------------------------------------------------------

Json::Value
g1ToJson(G1T const& p)
{
    Json::Value v(Json::arrayValue);
    if (p.is_zero())
    {
        v.append("0");
        v.append("1");
        v.append("0");
        return v;
    }
    auto const [x, y] = affine(p);
    v.append(toDecimal(x));
    v.append(toDecimal(y));
    v.append("1");
    return v;
}

Json::Value
g2ToJson(G2T const& p)
{
    auto pair = [](std::string const& c0, std::string const& c1) {
        Json::Value v(Json::arrayValue);
        v.append(c0);
        v.append(c1);
        return v;
    };

    Json::Value v(Json::arrayValue);
    if (p.is_zero())
    {
        v.append(pair("0", "0"));
        v.append(pair("1", "0"));
        v.append(pair("0", "0"));
        return v;
    }
    auto const [x, y] = affine(p);
    v.append(pair(toDecimal(x.c0), toDecimal(x.c1)));
    v.append(pair(toDecimal(y.c0), toDecimal(y.c1)));
    v.append(pair("1", "0"));
    return v;
}

G1T
g1FromJson(Json::Value const& v)
{
    if (!v.isArray() || v.size() < 2)
        throw MalformedProofError("G1 point must be a coordinate array");
    if (v.size() >= 3 && v[2u].isString() && v[2u].asString() == "0")
        return G1T::zero();
    return makeG1(coordinateFromJson(v[0u], "x"), coordinateFromJson(v[1u], "y"));
}

G2T
g2FromJson(Json::Value const& v)
{
    if (!v.isArray() || v.size() < 2 || !v[0u].isArray() || !v[1u].isArray() ||
        v[0u].size() != 2 || v[1u].size() != 2)
        throw MalformedProofError("G2 point must be a pair of coordinate pairs");
    if (v.size() >= 3 && v[2u].isArray() && v[2u].size() == 2 &&
        v[2u][0u].isString() && v[2u][0u].asString() == "0" &&
        v[2u][1u].isString() && v[2u][1u].asString() == "0")
        return G2T::zero();

    Fq2 const x(
        coordinateFromJson(v[0u][0u], "x.c0"), coordinateFromJson(v[0u][1u], "x.c1"));
    Fq2 const y(
        coordinateFromJson(v[1u][0u], "y.c0"), coordinateFromJson(v[1u][1u], "y.c1"));
    return makeG2(x, y);
}

Json::Value
publicSignalsToJson(std::vector<FieldT> const& signals)
{
    Json::Value v(Json::arrayValue);
    for (auto const& s : signals)
        v.append(toDecimal(s));
    return v;
}

std::vector<FieldT>
publicSignalsFromJson(Json::Value const& v)
{
    if (!v.isArray())
        throw InputValidationError("public signals must be an array");
    std::vector<FieldT> out;
    out.reserve(v.size());
    for (auto const& s : v)
    {
        if (!s.isString())
            throw InputValidationError("public signal must be a decimal string");
        out.push_back(fieldFromDecimal(s.asString()));
    }
    return out;
}

Json::Value
proofToJson(Proof const& proof)
{
    Json::Value v(Json::objectValue);
    v["pi_a"] = g1ToJson(proof.a);
    v["pi_b"] = g2ToJson(proof.b);
    v["pi_c"] = g1ToJson(proof.c);
    v["protocol"] = "groth16";
    v["curve"] = "bn128";
    v["publicSignals"] = publicSignalsToJson(proof.publicSignals);
    return v;
}

Proof
proofFromJson(Json::Value const& v)
{
    if (!v.isObject())
        throw MalformedProofError("proof must be a JSON object");
    for (char const* field : {"pi_a", "pi_b", "pi_c"})
        if (!v.isMember(field))
            throw MalformedProofError(std::string("proof is missing ") + field);

    Proof proof;
    proof.a = g1FromJson(v["pi_a"]);
    proof.b = g2FromJson(v["pi_b"]);
    proof.c = g1FromJson(v["pi_c"]);
    if (v.isMember("publicSignals"))
        proof.publicSignals = publicSignalsFromJson(v["publicSignals"]);
    return proof;
}

}  // namespace zkp
}  // namespace umbra
