#include <libumbra/basics/Errors.h>
#include <libumbra/zkp/FieldElement.h>
#include <test/support/TestRandom.h>

#include <gtest/gtest.h>

namespace umbra {
namespace zkp {
namespace {

class FieldElementTest : public ::testing::Test
{
protected:
    static void SetUpTestSuite()
    {
        initCurveParameters();
    }
};

// r, the order of the alt_bn128 scalar field
char const* const modulusHex =
    "30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001";

TEST_F(FieldElementTest, HexAndDecimalRoundTrip)
{
    auto const x = fieldFromUint64(1234567890123ull);
    EXPECT_EQ(fieldToDecimal(x), "1234567890123");
    EXPECT_EQ(fieldFromHex(fieldToHex(x)), x);
    EXPECT_EQ(fieldFromDecimal("1234567890123"), x);
    EXPECT_EQ(fieldToHex(x).size(), 66u);
    EXPECT_EQ(fieldToHex(x).substr(0, 2), "0x");
}

TEST_F(FieldElementTest, RejectsNonCanonicalValues)
{
    EXPECT_THROW(fieldFromHex(std::string("0x") + modulusHex), RangeError);
    EXPECT_THROW(fieldFromHex("0xzz"), InputValidationError);
    EXPECT_THROW(fieldFromDecimal(""), InputValidationError);

    FieldBytes bytes;
    bytes.fill(0xff);
    EXPECT_THROW(fieldFromBytes(bytes), RangeError);
}

TEST_F(FieldElementTest, BytesAreBigEndian)
{
    auto const bytes = fieldToBytes(fieldFromUint64(0x0102));
    EXPECT_EQ(bytes[30], 0x01);
    EXPECT_EQ(bytes[31], 0x02);
    EXPECT_EQ(fieldFromBytes(bytes), fieldFromUint64(0x0102));
}

TEST_F(FieldElementTest, BitWidth)
{
    EXPECT_TRUE(fitsInBits(FieldT::zero(), 1));
    EXPECT_TRUE(fitsInBits(fieldFromUint64(255), 8));
    EXPECT_FALSE(fitsInBits(fieldFromUint64(256), 8));
    EXPECT_FALSE(fitsInBits(-FieldT::one(), 128));
}

TEST_F(FieldElementTest, DerivedConstantsAreStable)
{
    EXPECT_EQ(hashToField("umbra.merkle.zero"), hashToField("umbra.merkle.zero"));
    EXPECT_NE(hashToField("a"), hashToField("b"));
}

TEST_F(FieldElementTest, RandomElementsFromInjectedSource)
{
    test::DeterministicRandom a(7);
    test::DeterministicRandom b(7);
    auto const x = randomFieldElement(a);
    EXPECT_EQ(x, randomFieldElement(b));
    EXPECT_NE(x, randomFieldElement(a));

    test::FailingRandom broken;
    EXPECT_THROW(randomFieldElement(broken), RngFailureError);
}

}  // namespace
}  // namespace zkp
}  // namespace umbra
