#include <libumbra/zkp/FieldElement.h>

#include <libff/common/profiling.hpp>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace umbra {
namespace zkp {

void
initCurveParameters()
{
    static std::once_flag once;
    std::call_once(once, [] {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        DefaultCurve::init_public_params();
    });
}

namespace detail {

mpz_class
parseDigits(std::string const& text, int base, char const* what)
{
    std::string digits = text;
    if (base == 16 && digits.size() >= 2 && digits[0] == '0' &&
        (digits[1] == 'x' || digits[1] == 'X'))
        digits = digits.substr(2);

    if (digits.empty())
        throw InputValidationError(std::string(what) + " is empty");

    for (char c : digits)
    {
        bool const ok = base == 16 ? std::isxdigit(static_cast<unsigned char>(c))
                                   : std::isdigit(static_cast<unsigned char>(c));
        if (!ok)
            throw InputValidationError(
                std::string(what) + " contains an invalid digit: " + text);
    }

    mpz_class v;
    if (v.set_str(digits, base) != 0)
        throw InputValidationError(std::string(what) + " could not be parsed: " + text);
    return v;
}

std::string
padHex(std::string digits, std::size_t width)
{
    if (digits.size() < width)
        digits.insert(0, width - digits.size(), '0');
    return digits;
}

}  // namespace detail

FieldBytes
fieldToBytes(FieldT const& x)
{
    FieldBytes out{};
    mpz_class const v = detail::toMpz(x);
    std::size_t count = 0;
    std::uint8_t buf[32];
    mpz_export(buf, &count, 1, 1, 1, 0, v.get_mpz_t());
    // mpz_export writes the minimal number of bytes; right-align them.
    std::copy(buf, buf + count, out.begin() + (out.size() - count));
    return out;
}

FieldT
fieldFromBytes(std::uint8_t const* data, std::size_t size)
{
    if (size != 32)
        throw InputValidationError(
            "field element must be 32 bytes, got " + std::to_string(size));
    mpz_class v;
    mpz_import(v.get_mpz_t(), size, 1, 1, 1, 0, data);
    return detail::fromMpz<FieldT>(v, "byte value");
}

FieldT
fieldFromDigest(std::uint8_t const* data, std::size_t size)
{
    mpz_class v;
    mpz_import(v.get_mpz_t(), size, 1, 1, 1, 0, data);
    v %= detail::modulusOf<FieldT>();
    return detail::fromMpz<FieldT>(v, "digest");
}

FieldT
hashToField(std::string const& label)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(
        reinterpret_cast<unsigned char const*>(label.data()),
        label.size(),
        digest);
    return fieldFromDigest(digest, sizeof(digest));
}

FieldT
fieldFromUint64(std::uint64_t v)
{
    return FieldT(static_cast<long>(v), true);
}

FieldT
randomFieldElement(RandomSource& rng)
{
    mpz_class const modulus = detail::modulusOf<FieldT>();
    for (;;)
    {
        auto bytes = rng.bytes<32>();
        bytes[0] &= 0x3f;
        mpz_class v;
        mpz_import(v.get_mpz_t(), bytes.size(), 1, 1, 1, 0, bytes.data());
        if (v < modulus)
            return detail::fromMpz<FieldT>(v, "random value");
    }
}

bool
fitsInBits(FieldT const& x, std::size_t bits)
{
    return x.as_bigint().num_bits() <= bits;
}

}  // namespace zkp
}  // namespace umbra
