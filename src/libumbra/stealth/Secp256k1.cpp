#include <libumbra/stealth/Secp256k1.h>
#include <libumbra/basics/Errors.h>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>

namespace umbra {
namespace stealth {

namespace {

struct GroupDeleter
{
    void operator()(EC_GROUP* g) const
    {
        EC_GROUP_free(g);
    }
};

struct PointDeleter
{
    void operator()(EC_POINT* p) const
    {
        EC_POINT_clear_free(p);
    }
};

struct BignumDeleter
{
    void operator()(BIGNUM* b) const
    {
        BN_clear_free(b);
    }
};

struct ContextDeleter
{
    void operator()(BN_CTX* c) const
    {
        BN_CTX_free(c);
    }
};

using Group = std::unique_ptr<EC_GROUP, GroupDeleter>;
using Point = std::unique_ptr<EC_POINT, PointDeleter>;
using Bignum = std::unique_ptr<BIGNUM, BignumDeleter>;
using Context = std::unique_ptr<BN_CTX, ContextDeleter>;

void
check(int result, char const* what)
{
    if (result != 1)
        throw CryptoArtifactError(std::string("secp256k1: ") + what + " failed");
}

template <class T>
T
checked(T value, char const* what)
{
    if (!value)
        throw CryptoArtifactError(std::string("secp256k1: ") + what + " failed");
    return value;
}

EC_GROUP const*
group()
{
    static Group const g(EC_GROUP_new_by_curve_name(NID_secp256k1));
    return checked(g.get(), "EC_GROUP_new_by_curve_name");
}

BIGNUM const*
order()
{
    return checked(EC_GROUP_get0_order(group()), "EC_GROUP_get0_order");
}

Context
newContext()
{
    return Context(checked(BN_CTX_new(), "BN_CTX_new"));
}

Point
newPoint()
{
    return Point(checked(EC_POINT_new(group()), "EC_POINT_new"));
}

Bignum
toBignum(std::uint8_t const* data, std::size_t size)
{
    return Bignum(checked(
        BN_bin2bn(data, static_cast<int>(size), nullptr), "BN_bin2bn"));
}

Point
decode(PublicKey const& p, BN_CTX* ctx)
{
    auto point = newPoint();
    check(EC_POINT_oct2point(group(), point.get(), p.data(), PublicKey::size, ctx),
          "EC_POINT_oct2point");
    return point;
}

PublicKey
encode(EC_POINT const* point, BN_CTX* ctx)
{
    if (EC_POINT_is_at_infinity(group(), point) == 1)
        throw InputValidationError("secp256k1: point at infinity");

    std::array<std::uint8_t, PublicKey::size> out;
    auto const written = EC_POINT_point2oct(
        group(), point, POINT_CONVERSION_COMPRESSED, out.data(), out.size(), ctx);
    if (written != out.size())
        throw CryptoArtifactError("secp256k1: EC_POINT_point2oct failed");
    return PublicKey(out.data(), out.size());
}

}  // namespace

//------------------------------------------------------------------------------

PublicKey::PublicKey(std::uint8_t const* data, std::size_t length)
{
    if (length != size || (data[0] != 0x02 && data[0] != 0x03))
        throw InputValidationError("public key must be a 33-byte compressed point");

    std::copy(data, data + size, bytes_.begin());

    auto ctx = newContext();
    auto point = newPoint();
    if (EC_POINT_oct2point(group(), point.get(), data, length, ctx.get()) != 1 ||
        EC_POINT_is_on_curve(group(), point.get(), ctx.get()) != 1)
    {
        bytes_.fill(0);
        throw InputValidationError("public key is not a point on secp256k1");
    }
}

std::optional<PublicKey>
PublicKey::fromHex(std::string const& hex)
{
    auto const raw = strUnHex(hex);
    if (!raw || raw->size() != size)
        return std::nullopt;
    try
    {
        return PublicKey(raw->data(), raw->size());
    }
    catch (InputValidationError const&)
    {
        return std::nullopt;
    }
}

//------------------------------------------------------------------------------

bool
isValidScalar(std::uint8_t const* data, std::size_t length)
{
    if (length != SecretKey::size)
        return false;
    auto const bn = toBignum(data, length);
    return !BN_is_zero(bn.get()) && BN_cmp(bn.get(), order()) < 0;
}

SecretKey::SecretKey(std::uint8_t const* data, std::size_t length)
{
    if (!isValidScalar(data, length))
        throw InputValidationError("secret key must be a scalar in [1, n-1]");
    std::copy(data, data + size, bytes_.begin());
}

SecretKey&
SecretKey::operator=(SecretKey const& other)
{
    if (this != &other)
        bytes_ = other.bytes_;
    return *this;
}

SecretKey::~SecretKey()
{
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
}

SecretKey
SecretKey::random(RandomSource& rng)
{
    std::array<std::uint8_t, size> candidate;
    for (;;)
    {
        rng.fill(candidate.data(), candidate.size());
        if (isValidScalar(candidate.data(), candidate.size()))
        {
            SecretKey key(candidate.data(), candidate.size());
            OPENSSL_cleanse(candidate.data(), candidate.size());
            return key;
        }
    }
}

bool
SecretKey::empty() const
{
    for (auto b : bytes_)
        if (b != 0)
            return false;
    return true;
}

bool
SecretKey::operator==(SecretKey const& other) const
{
    return CRYPTO_memcmp(bytes_.data(), other.bytes_.data(), size) == 0;
}

//------------------------------------------------------------------------------

PublicKey
derivePublicKey(SecretKey const& s)
{
    if (s.empty())
        throw InputValidationError("cannot derive a public key from an empty secret");

    auto ctx = newContext();
    auto const scalar = toBignum(s.data(), SecretKey::size);
    auto point = newPoint();
    check(EC_POINT_mul(group(), point.get(), scalar.get(), nullptr, nullptr, ctx.get()),
          "EC_POINT_mul");
    return encode(point.get(), ctx.get());
}

PublicKey
multiply(PublicKey const& p, SecretKey const& s)
{
    if (p.empty() || s.empty())
        throw InputValidationError("ECDH needs a public point and a secret scalar");

    auto ctx = newContext();
    auto const base = decode(p, ctx.get());
    auto const scalar = toBignum(s.data(), SecretKey::size);
    auto point = newPoint();
    check(EC_POINT_mul(group(), point.get(), nullptr, base.get(), scalar.get(), ctx.get()),
          "EC_POINT_mul");
    return encode(point.get(), ctx.get());
}

PublicKey
addTweak(PublicKey const& p, Digest const& tweak)
{
    auto ctx = newContext();
    auto const base = decode(p, ctx.get());

    auto h = toBignum(tweak.data(), tweak.size());
    check(BN_nnmod(h.get(), h.get(), order(), ctx.get()), "BN_nnmod");

    // h*G + 1*P
    auto const one = Bignum(checked(BN_new(), "BN_new"));
    check(BN_one(one.get()), "BN_one");
    auto point = newPoint();
    check(EC_POINT_mul(group(), point.get(), h.get(), base.get(), one.get(), ctx.get()),
          "EC_POINT_mul");
    return encode(point.get(), ctx.get());
}

SecretKey
addTweak(SecretKey const& s, Digest const& tweak)
{
    auto ctx = newContext();
    auto const a = toBignum(s.data(), SecretKey::size);
    auto const h = toBignum(tweak.data(), tweak.size());
    auto sum = Bignum(checked(BN_new(), "BN_new"));
    check(BN_mod_add(sum.get(), a.get(), h.get(), order(), ctx.get()), "BN_mod_add");
    if (BN_is_zero(sum.get()))
        throw InputValidationError("tweaked secret key is zero");

    std::array<std::uint8_t, SecretKey::size> out;
    check(BN_bn2binpad(sum.get(), out.data(), static_cast<int>(out.size())) ==
                  static_cast<int>(out.size())
              ? 1
              : 0,
          "BN_bn2binpad");
    SecretKey key(out.data(), out.size());
    OPENSSL_cleanse(out.data(), out.size());
    return key;
}

}  // namespace stealth
}  // namespace umbra
