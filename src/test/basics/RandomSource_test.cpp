#include <libumbra/basics/Errors.h>
#include <libumbra/basics/RandomSource.h>
#include <libumbra/basics/StringUtilities.h>
#include <test/support/TestRandom.h>

#include <gtest/gtest.h>

namespace umbra {
namespace {

TEST(CryptoRandom, ProducesDistinctOutput)
{
    CryptoRandom rng;
    auto const a = rng.bytes<32>();
    auto const b = rng.bytes<32>();
    EXPECT_NE(a, b);
}

TEST(CryptoRandom, ReseedsAfterInterval)
{
    CryptoRandom rng(64);
    std::array<std::uint8_t, 48> buf;
    for (int i = 0; i < 8; ++i)
        EXPECT_NO_THROW(rng.fill(buf.data(), buf.size()));
    EXPECT_NO_THROW(rng.reseed());
}

TEST(DeterministicRandom, SameSeedSameStream)
{
    test::DeterministicRandom a(42);
    test::DeterministicRandom b(42);
    test::DeterministicRandom c(43);

    auto const x = a.bytes<100>();
    EXPECT_EQ(x, b.bytes<100>());
    EXPECT_NE(x, c.bytes<100>());
}

TEST(FailingRandom, RaisesRngFailure)
{
    test::FailingRandom rng;
    EXPECT_THROW(rng.bytes<16>(), RngFailureError);
}

TEST(StringUtilities, HexRoundTrip)
{
    Blob const data{0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(strHex(data), "0001abff");
    EXPECT_EQ(strPrefixedHex(data), "0x0001abff");
    EXPECT_EQ(*strUnHex("0x0001ABff"), data);
    EXPECT_FALSE(strUnHex("abc"));
    EXPECT_FALSE(strUnHex("zz"));
    EXPECT_EQ(stripHexPrefix("0Xdead"), "dead");
}

}  // namespace
}  // namespace umbra
