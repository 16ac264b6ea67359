#include <libumbra/basics/Errors.h>
#include <libumbra/stealth/PaymentCipher.h>
#include <libumbra/stealth/Secp256k1.h>
#include <test/support/TestRandom.h>

#include <gtest/gtest.h>

namespace umbra {
namespace stealth {
namespace {

std::string const generatorHex =
    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
std::string const twiceGeneratorHex =
    "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5";
std::string const orderHex =
    "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";

SecretKey
secretFromHex(std::string const& hex)
{
    auto const raw = strUnHex(hex);
    return SecretKey(raw->data(), raw->size());
}

SecretKey
smallSecret(std::uint8_t v)
{
    std::array<std::uint8_t, SecretKey::size> raw{};
    raw.back() = v;
    return SecretKey(raw.data(), raw.size());
}

TEST(Secp256k1, KnownMultiples)
{
    EXPECT_EQ(derivePublicKey(smallSecret(1)).toHex(), generatorHex);
    EXPECT_EQ(derivePublicKey(smallSecret(2)).toHex(), twiceGeneratorHex);
    EXPECT_EQ(multiply(derivePublicKey(smallSecret(1)), smallSecret(2)).toHex(),
              twiceGeneratorHex);
}

TEST(Secp256k1, ScalarRange)
{
    std::array<std::uint8_t, SecretKey::size> zero{};
    EXPECT_FALSE(isValidScalar(zero.data(), zero.size()));
    EXPECT_THROW(SecretKey(zero.data(), zero.size()), InputValidationError);

    auto const order = strUnHex(orderHex);
    EXPECT_FALSE(isValidScalar(order->data(), order->size()));
    EXPECT_THROW(SecretKey(order->data(), order->size()), InputValidationError);

    auto below = *order;
    below.back() -= 1;
    EXPECT_TRUE(isValidScalar(below.data(), below.size()));
    EXPECT_FALSE(isValidScalar(below.data(), 31));

    EXPECT_TRUE(SecretKey().empty());
    EXPECT_FALSE(smallSecret(3).empty());
}

TEST(Secp256k1, PublicKeyValidation)
{
    auto const g = PublicKey::fromHex(generatorHex);
    ASSERT_TRUE(g);
    EXPECT_EQ(g->toHex(), generatorHex);
    EXPECT_FALSE(g->empty());
    EXPECT_TRUE(PublicKey().empty());

    // x above the field prime.
    std::string const offCurve = "02" + std::string(64, 'f');
    EXPECT_FALSE(PublicKey::fromHex(offCurve));
    EXPECT_FALSE(PublicKey::fromHex("04" + generatorHex.substr(2)));
    EXPECT_FALSE(PublicKey::fromHex(generatorHex.substr(0, 64)));
    EXPECT_FALSE(PublicKey::fromHex("not hex"));

    auto const raw = strUnHex(offCurve);
    EXPECT_THROW(PublicKey(raw->data(), raw->size()), InputValidationError);
}

TEST(Secp256k1, TweaksCommute)
{
    test::DeterministicRandom rng(17);
    for (int i = 0; i < 8; ++i)
    {
        auto const s = SecretKey::random(rng);
        auto const tweak = rng.bytes<32>();
        EXPECT_EQ(derivePublicKey(addTweak(s, tweak)), addTweak(derivePublicKey(s), tweak));
    }

    // A tweak of n - s cancels the key entirely.
    auto const one = smallSecret(1);
    Digest minusOne;
    auto const order = strUnHex(orderHex);
    std::copy(order->begin(), order->end(), minusOne.begin());
    minusOne.back() -= 1;
    EXPECT_THROW(addTweak(one, minusOne), InputValidationError);
    EXPECT_THROW(addTweak(derivePublicKey(one), minusOne), InputValidationError);
}

TEST(Secp256k1, RandomKeys)
{
    test::DeterministicRandom a(1), b(1), c(2);
    EXPECT_EQ(SecretKey::random(a), SecretKey::random(b));
    EXPECT_FALSE(SecretKey::random(a) == SecretKey::random(c));

    test::FailingRandom failing;
    EXPECT_THROW(SecretKey::random(failing), RngFailureError);
}

TEST(Secp256k1, SecretKeyHex)
{
    auto const s = secretFromHex(std::string(62, '0') + "2a");
    EXPECT_EQ(s.toHex(), std::string(62, '0') + "2a");
    EXPECT_EQ(s, smallSecret(42));
}

//------------------------------------------------------------------------------

class PaymentCipherTest : public ::testing::Test
{
protected:
    test::DeterministicRandom rng_{8};
    Digest const key_ = cipher::amountKey(rng_.bytes<32>());
    PublicKey const ephemeral_ = derivePublicKey(SecretKey::random(rng_));
};

TEST_F(PaymentCipherTest, SealAndOpen)
{
    mpz_class const amount("123456789012345678901234567890");
    auto const sealed = cipher::sealAmount(key_, amount, ephemeral_, rng_);
    EXPECT_EQ(sealed.size(), cipher::sealedSize);

    auto const opened = cipher::openAmount(key_, sealed, ephemeral_);
    ASSERT_TRUE(opened);
    EXPECT_EQ(*opened, amount);

    // Fresh nonce every time.
    EXPECT_NE(cipher::sealAmount(key_, amount, ephemeral_, rng_), sealed);
}

TEST_F(PaymentCipherTest, Boundaries)
{
    mpz_class const largest = (mpz_class(1) << 256) - 1;
    auto const sealed = cipher::sealAmount(key_, largest, ephemeral_, rng_);
    EXPECT_EQ(*cipher::openAmount(key_, sealed, ephemeral_), largest);
    auto const zero = cipher::sealAmount(key_, 0, ephemeral_, rng_);
    EXPECT_EQ(*cipher::openAmount(key_, zero, ephemeral_), 0);

    EXPECT_THROW(
        cipher::sealAmount(key_, mpz_class(1) << 256, ephemeral_, rng_), InputValidationError);
    EXPECT_THROW(cipher::sealAmount(key_, -1, ephemeral_, rng_), InputValidationError);
}

TEST_F(PaymentCipherTest, RejectsTampering)
{
    auto const sealed = cipher::sealAmount(key_, 1000, ephemeral_, rng_);

    for (std::size_t i : {std::size_t(0), cipher::nonceSize, cipher::sealedSize - 1})
    {
        auto flipped = sealed;
        flipped[i] ^= 0x01;
        EXPECT_FALSE(cipher::openAmount(key_, flipped, ephemeral_)) << i;
    }

    auto otherKey = key_;
    otherKey[0] ^= 0x80;
    EXPECT_FALSE(cipher::openAmount(otherKey, sealed, ephemeral_));

    auto const otherEphemeral = derivePublicKey(SecretKey::random(rng_));
    EXPECT_FALSE(cipher::openAmount(key_, sealed, otherEphemeral));

    Blob truncated(sealed.begin(), sealed.end() - 1);
    EXPECT_FALSE(cipher::openAmount(key_, truncated, ephemeral_));
    EXPECT_FALSE(cipher::openAmount(key_, Blob{}, ephemeral_));
}

TEST_F(PaymentCipherTest, SealNeedsEntropy)
{
    test::FailingRandom failing;
    EXPECT_THROW(cipher::sealAmount(key_, 5, ephemeral_, failing), RngFailureError);
}

}  // namespace
}  // namespace stealth
}  // namespace umbra
