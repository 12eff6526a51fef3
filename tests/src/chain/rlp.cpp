#include "unit-tests.hpp"

using namespace tkd;
using namespace tkd::tests;

namespace
{
    utils::Bytes bytesOf(const std::string & text)
    {
        return utils::Bytes(text.begin(), text.end());
    }
}

TEST_F(UnitTest, Chain_Rlp_EncodeStrings)
{
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeBytes(bytesOf("dog"))), "0x83646f67");
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeBytes(utils::Bytes{})), "0x80");
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeBytes(utils::Bytes{0x0f})), "0x0f");
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeBytes(utils::Bytes{0x80})), "0x8180");
}

TEST_F(UnitTest, Chain_Rlp_EncodeLongString)
{
    const std::string text = "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
    ASSERT_EQ(text.size(), 56u);

    const utils::Bytes encoded = chain::rlp::encodeBytes(bytesOf(text));
    ASSERT_EQ(encoded.size(), 58u);
    EXPECT_EQ(encoded[0], 0xb8);
    EXPECT_EQ(encoded[1], 0x38);
    EXPECT_EQ(encoded[2], 'L');
}

TEST_F(UnitTest, Chain_Rlp_EncodeIntegers)
{
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeUint64(0)), "0x80");
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeUint64(15)), "0x0f");
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeUint64(1024)), "0x820400");
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeUint64(121000)), "0x8301d8a8");

    const std::uint8_t padded[4] = {0x00, 0x00, 0x04, 0x00};
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeBigInteger(padded, sizeof(padded))), "0x820400");

    const std::uint8_t zero[3] = {0x00, 0x00, 0x00};
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeBigInteger(zero, sizeof(zero))), "0x80");
}

TEST_F(UnitTest, Chain_Rlp_EncodeLists)
{
    EXPECT_EQ(utils::bytesToHex(chain::rlp::encodeList({})), "0xc0");

    const utils::Bytes cat_dog = chain::rlp::encodeList({
        chain::rlp::encodeBytes(bytesOf("cat")),
        chain::rlp::encodeBytes(bytesOf("dog"))
    });
    EXPECT_EQ(utils::bytesToHex(cat_dog), "0xc88363617483646f67");

    // [ [], [[]], [ [], [[]] ] ]
    const utils::Bytes empty = chain::rlp::encodeList({});
    const utils::Bytes nested_one = chain::rlp::encodeList({empty});
    const utils::Bytes nested = chain::rlp::encodeList({empty, nested_one, chain::rlp::encodeList({empty, nested_one})});
    EXPECT_EQ(utils::bytesToHex(nested), "0xc7c0c1c0c3c0c1c0");
}

TEST_F(UnitTest, Chain_Rlp_EncodeLongList)
{
    std::vector<utils::Bytes> items(20, chain::rlp::encodeBytes(bytesOf("dog")));
    const utils::Bytes encoded = chain::rlp::encodeList(items);

    ASSERT_EQ(encoded.size(), 2u + 80u);
    EXPECT_EQ(encoded[0], 0xf8);
    EXPECT_EQ(encoded[1], 80);
}
