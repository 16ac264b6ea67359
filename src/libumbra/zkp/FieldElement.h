#pragma once

#include <libumbra/basics/Errors.h>
#include <libumbra/basics/RandomSource.h>

#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <gmpxx.h>

#include <array>
#include <cstdint>
#include <string>

namespace umbra {
namespace zkp {

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;
using BaseFieldT = libff::Fq<DefaultCurve>;
using G1T = libff::G1<DefaultCurve>;
using G2T = libff::G2<DefaultCurve>;

using FieldBytes = std::array<std::uint8_t, 32>;

/** Sets up alt_bn128 parameters and silences libff profiling. Idempotent. */
void initCurveParameters();

namespace detail {

template <typename Fp>
mpz_class
toMpz(Fp const& x)
{
    mpz_class v;
    x.as_bigint().to_mpz(v.get_mpz_t());
    return v;
}

template <typename Fp>
mpz_class
modulusOf()
{
    mpz_class m;
    Fp::mod.to_mpz(m.get_mpz_t());
    return m;
}

template <typename Fp>
Fp
fromMpz(mpz_class const& v, char const* what)
{
    if (v < 0 || v >= modulusOf<Fp>())
        throw RangeError(std::string(what) + " is not a canonical field element");
    libff::bigint<Fp::num_limbs> b(v.get_mpz_t());
    return Fp(b);
}

mpz_class parseDigits(std::string const& text, int base, char const* what);

std::string padHex(std::string digits, std::size_t width);

}  // namespace detail

/** "0x" followed by 64 lowercase hex digits. */
template <typename Fp>
std::string
toHex(Fp const& x)
{
    return "0x" + detail::padHex(detail::toMpz(x).get_str(16), 64);
}

template <typename Fp>
std::string
toDecimal(Fp const& x)
{
    return detail::toMpz(x).get_str(10);
}

/** Parses hex (optional "0x"). Rejects values >= the modulus. */
template <typename Fp>
Fp
fromHex(std::string const& text)
{
    return detail::fromMpz<Fp>(detail::parseDigits(text, 16, "hex value"), "hex value");
}

/** Parses an unsigned decimal string. Rejects values >= the modulus. */
template <typename Fp>
Fp
fromDecimal(std::string const& text)
{
    return detail::fromMpz<Fp>(
        detail::parseDigits(text, 10, "decimal value"), "decimal value");
}

inline std::string fieldToHex(FieldT const& x) { return toHex(x); }
inline FieldT fieldFromHex(std::string const& s) { return fromHex<FieldT>(s); }
inline std::string fieldToDecimal(FieldT const& x) { return toDecimal(x); }
inline FieldT fieldFromDecimal(std::string const& s) { return fromDecimal<FieldT>(s); }

/** 32-byte big-endian encoding. */
FieldBytes fieldToBytes(FieldT const& x);

/** Inverse of fieldToBytes. Throws RangeError when the value is not canonical. */
FieldT fieldFromBytes(std::uint8_t const* data, std::size_t size);

inline FieldT
fieldFromBytes(FieldBytes const& bytes)
{
    return fieldFromBytes(bytes.data(), bytes.size());
}

/** Interprets a digest big-endian and reduces it mod r. For derived constants only. */
FieldT fieldFromDigest(std::uint8_t const* data, std::size_t size);

/** SHA-256 of a label, reduced into the field. */
FieldT hashToField(std::string const& label);

FieldT fieldFromUint64(std::uint64_t v);

/** Uniform element of Fr by rejection sampling 254-bit strings. */
FieldT randomFieldElement(RandomSource& rng);

/** True when x < 2^bits. */
bool fitsInBits(FieldT const& x, std::size_t bits);

}  // namespace zkp
}  // namespace umbra
