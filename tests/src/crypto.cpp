#include "unit-tests.hpp"

using namespace tkd;
using namespace tkd::tests;

TEST_F(UnitTest, Crypto_Keccak256KnownVectors)
{
    EXPECT_EQ(chain::hashToHex(crypto::keccak256(std::string_view{})),
        "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");

    EXPECT_EQ(chain::hashToHex(crypto::keccak256(std::string_view{"abc"})),
        "0x4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST_F(UnitTest, Crypto_Keccak256SelectorPrefix)
{
    const evmc::bytes32 hash = crypto::keccak256(std::string_view{"transfer(address,uint256)"});
    EXPECT_EQ(utils::bytesToHex(hash.bytes, 4, false), "a9059cbb");
}

TEST_F(UnitTest, Crypto_Keccak256OverloadsAgree)
{
    const std::vector<std::uint8_t> bytes{'a', 'b', 'c'};
    EXPECT_EQ(crypto::keccak256(bytes), crypto::keccak256(std::string_view{"abc"}));
    EXPECT_EQ(crypto::keccak256(bytes.data(), bytes.size()), crypto::keccak256(bytes));
}
