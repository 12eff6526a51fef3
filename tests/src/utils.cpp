#include "unit-tests.hpp"

using namespace tkd;
using namespace tkd::tests;

TEST_F(UnitTest, Utils_HexToBytesAcceptsPrefixAndCase)
{
    const auto bytes = utils::hexToBytes("0xDeAdbeef");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, (utils::Bytes{0xde, 0xad, 0xbe, 0xef}));

    const auto unprefixed = utils::hexToBytes("00ff");
    ASSERT_TRUE(unprefixed.has_value());
    EXPECT_EQ(*unprefixed, (utils::Bytes{0x00, 0xff}));
}

TEST_F(UnitTest, Utils_HexToBytesRejectsInvalidInput)
{
    EXPECT_FALSE(utils::hexToBytes("").has_value());
    EXPECT_FALSE(utils::hexToBytes("0x").has_value());
    EXPECT_FALSE(utils::hexToBytes("0xabc").has_value());
    EXPECT_FALSE(utils::hexToBytes("0xzz").has_value());
}

TEST_F(UnitTest, Utils_BytesToHex)
{
    EXPECT_EQ(utils::bytesToHex(utils::Bytes{0x01, 0xab}), "0x01ab");
    EXPECT_EQ(utils::bytesToHex(utils::Bytes{0x01, 0xab}, false), "01ab");
    EXPECT_EQ(utils::bytesToHex(utils::Bytes{}), "0x");
}

TEST_F(UnitTest, Utils_ParseQuantity)
{
    EXPECT_EQ(utils::parseQuantity("0x0"), 0u);
    EXPECT_EQ(utils::parseQuantity("0x"), 0u);
    EXPECT_EQ(utils::parseQuantity("0x5208"), 21000u);
    EXPECT_EQ(utils::parseQuantity("0xaa36a7"), 11155111u);
    EXPECT_EQ(utils::parseQuantity("0xffffffffffffffff"), 0xffffffffffffffffull);

    EXPECT_FALSE(utils::parseQuantity("").has_value());
    EXPECT_FALSE(utils::parseQuantity("0x10000000000000000").has_value());
    EXPECT_FALSE(utils::parseQuantity("0xg1").has_value());

    EXPECT_EQ(utils::toQuantity(0), "0x0");
    EXPECT_EQ(utils::toQuantity(21000), "0x5208");
}

TEST_F(UnitTest, Utils_ParseDecimal)
{
    EXPECT_EQ(utils::parseDecimal("10000000000000000"), 10'000'000'000'000'000ull);
    EXPECT_FALSE(utils::parseDecimal("-1").has_value());
    EXPECT_FALSE(utils::parseDecimal("12a").has_value());
    EXPECT_FALSE(utils::parseDecimal("").has_value());
}

TEST_F(UnitTest, Utils_FormatUnits)
{
    EXPECT_EQ(utils::formatUnits(1'500'000'000, 9), "1.5");
    EXPECT_EQ(utils::formatUnits(1'000'000'000, 9), "1");
    EXPECT_EQ(utils::formatUnits(1, 9), "0.000000001");
    EXPECT_EQ(utils::formatUnits(0, 9), "0");
    EXPECT_EQ(utils::formatUnits(42, 0), "42");
}

TEST_F(UnitTest, Utils_Trim)
{
    EXPECT_EQ(utils::trim("  0xabc \n"), "0xabc");
    EXPECT_EQ(utils::trim("\t \n"), "");
}
