#include "unit-tests.hpp"

using namespace tkd;
using namespace tkd::tests;

TEST_F(UnitTest, Chain_Address_ChecksumEncoding)
{
    const auto address = chain::parseAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(chain::toChecksumAddress(*address), "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
    EXPECT_EQ(chain::addressToHex(*address), "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed");
}

TEST_F(UnitTest, Chain_Address_ParseAcceptsValidChecksumAndSingleCase)
{
    EXPECT_TRUE(chain::parseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed").has_value());
    EXPECT_TRUE(chain::parseAddress("0x5AAEB6053F3E94C9B9A09F33669435E7EF1BEAED").has_value());
    EXPECT_TRUE(chain::parseAddress("5aaeb6053f3e94c9b9a09f33669435e7ef1beaed").has_value());
}

TEST_F(UnitTest, Chain_Address_ParseRejectsInvalidInput)
{
    // last character case flipped
    EXPECT_FALSE(chain::parseAddress("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAeD").has_value());
    EXPECT_FALSE(chain::parseAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1bea").has_value());
    EXPECT_FALSE(chain::parseAddress("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed00").has_value());
    EXPECT_FALSE(chain::parseAddress("").has_value());
    EXPECT_FALSE(chain::parseAddress("not-an-address").has_value());
}

TEST_F(UnitTest, Chain_Address_ComputeCreateAddress)
{
    const chain::Address sender = addressFromHex("0x6ac7ea33f8831ea9dcc53393aaa88b25a785dbf0");

    EXPECT_EQ(chain::addressToHex(chain::computeCreateAddress(sender, 0)), "0xcd234a471b72ba2f1ccf0a70fcaba648a5eecd8d");
    EXPECT_EQ(chain::addressToHex(chain::computeCreateAddress(sender, 1)), "0x343c43a37d37dff08ae8c4a11544c718abb4fcf8");
    EXPECT_EQ(chain::addressToHex(chain::computeCreateAddress(sender, 2)), "0xf778b86fa74e846c4f0a1fbd1335fe81c00a0c91");
}

TEST_F(UnitTest, Chain_Address_ZeroAddress)
{
    EXPECT_TRUE(chain::isZeroAddress(chain::Address{}));
    EXPECT_FALSE(chain::isZeroAddress(addressFromHex(TEST_FEE_RECIPIENT)));
}

TEST_F(UnitTest, Chain_Address_ParseHash)
{
    const std::string hex = "0x1c8ed1fb5def33c23fc71f2ffbb66fb77dc12c5889643edd4e47c36782e4b235";
    const auto hash = chain::parseHash(hex);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(chain::hashToHex(*hash), hex);

    EXPECT_FALSE(chain::parseHash("0x1c8e").has_value());
}
