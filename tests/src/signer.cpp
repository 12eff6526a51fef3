#include "unit-tests.hpp"

using namespace tkd;
using namespace tkd::tests;

namespace
{
    chain::UnsignedTransaction makeTx(const chain::Address & from)
    {
        chain::UnsignedTransaction tx;
        tx.from = from;
        tx.nonce = 5;
        tx.gas_price = 1'000'000'000;
        tx.gas_limit = 121000;
        tx.chain_id = 11155111;
        tx.data = {0x60, 0x80, 0x60, 0x40, 0x52};
        return tx;
    }
}

TEST_F(UnitTest, Signer_DeriveKnownAddresses)
{
    auto identity_res = signer::SigningIdentity::derive(TEST_PRIVATE_KEY);
    ASSERT_TRUE(identity_res.has_value());
    EXPECT_EQ(chain::toChecksumAddress(identity_res->address()), TEST_SIGNER_ADDRESS);

    // without prefix
    auto one_res = signer::SigningIdentity::derive("0000000000000000000000000000000000000000000000000000000000000001");
    ASSERT_TRUE(one_res.has_value());
    EXPECT_EQ(chain::toChecksumAddress(one_res->address()), "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
}

TEST_F(UnitTest, Signer_DeriveRejectsInvalidKeys)
{
    const std::vector<std::string> invalid_keys = {
        "",
        "0x",
        "0x4646",
        "0x464646464646464646464646464646464646464646464646464646464646464646",
        "0xzz46464646464646464646464646464646464646464646464646464646464646",
        "0x0000000000000000000000000000000000000000000000000000000000000000",
        // curve order n
        "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141",
        "0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"
    };

    for(const std::string & key : invalid_keys)
    {
        const auto identity_res = signer::SigningIdentity::derive(key);
        ASSERT_FALSE(identity_res.has_value()) << key;
        EXPECT_EQ(identity_res.error().kind, signer::KeyError::Kind::INVALID_KEY) << key;
        if(key.size() > 4)
        {
            EXPECT_EQ(identity_res.error().message.find(key), std::string::npos);
        }
    }
}

TEST_F(UnitTest, Signer_SignAndRecover)
{
    auto identity_res = signer::SigningIdentity::derive(TEST_PRIVATE_KEY);
    ASSERT_TRUE(identity_res.has_value());

    const chain::UnsignedTransaction tx = makeTx(identity_res->address());
    const auto signed_res = identity_res->sign(tx);
    ASSERT_TRUE(signed_res.has_value());

    const std::uint64_t base_v = tx.chain_id * 2 + 35;
    EXPECT_TRUE(signed_res->v == base_v || signed_res->v == base_v + 1);
    EXPECT_EQ(signed_res->raw_bytes, chain::encodeSigned(tx, signed_res->v, signed_res->r, signed_res->s));
    EXPECT_EQ(signed_res->hash, crypto::keccak256(signed_res->raw_bytes));

    EXPECT_TRUE(signer::verifySignedTransaction(*signed_res, identity_res->address()));
    EXPECT_FALSE(signer::verifySignedTransaction(*signed_res, addressFromHex(TEST_FEE_RECIPIENT)));
}

TEST_F(UnitTest, Signer_SignIsDeterministic)
{
    auto identity_res = signer::SigningIdentity::derive(TEST_PRIVATE_KEY);
    ASSERT_TRUE(identity_res.has_value());

    const chain::UnsignedTransaction tx = makeTx(identity_res->address());
    const auto first = identity_res->sign(tx);
    const auto second = identity_res->sign(tx);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first->raw_bytes, second->raw_bytes);
    EXPECT_EQ(first->hash, second->hash);
}

TEST_F(UnitTest, Signer_TamperedTransactionFailsVerification)
{
    auto identity_res = signer::SigningIdentity::derive(TEST_PRIVATE_KEY);
    ASSERT_TRUE(identity_res.has_value());

    auto signed_res = identity_res->sign(makeTx(identity_res->address()));
    ASSERT_TRUE(signed_res.has_value());

    chain::SignedTransaction tampered = *signed_res;
    tampered.transaction.nonce += 1;
    EXPECT_FALSE(signer::verifySignedTransaction(tampered, identity_res->address()));

    // consistent re-encoding still recovers a different signer
    tampered.raw_bytes = chain::encodeSigned(tampered.transaction, tampered.v, tampered.r, tampered.s);
    EXPECT_FALSE(signer::verifySignedTransaction(tampered, identity_res->address()));
}

TEST_F(UnitTest, Signer_RejectsInvalidTransactions)
{
    auto identity_res = signer::SigningIdentity::derive(TEST_PRIVATE_KEY);
    ASSERT_TRUE(identity_res.has_value());

    const auto foreign = identity_res->sign(makeTx(addressFromHex(TEST_FEE_RECIPIENT)));
    ASSERT_FALSE(foreign.has_value());
    EXPECT_EQ(foreign.error().kind, signer::SigningError::Kind::INVALID_TRANSACTION);

    chain::UnsignedTransaction no_chain = makeTx(identity_res->address());
    no_chain.chain_id = 0;
    const auto no_chain_res = identity_res->sign(no_chain);
    ASSERT_FALSE(no_chain_res.has_value());
    EXPECT_EQ(no_chain_res.error().kind, signer::SigningError::Kind::INVALID_TRANSACTION);

    chain::UnsignedTransaction no_data = makeTx(identity_res->address());
    no_data.data.clear();
    const auto no_data_res = identity_res->sign(no_data);
    ASSERT_FALSE(no_data_res.has_value());
    EXPECT_EQ(no_data_res.error().kind, signer::SigningError::Kind::INVALID_TRANSACTION);
}

TEST_F(UnitTest, Signer_MovedFromIdentityIsCleared)
{
    auto identity_res = signer::SigningIdentity::derive(TEST_PRIVATE_KEY);
    ASSERT_TRUE(identity_res.has_value());

    signer::SigningIdentity moved = std::move(*identity_res);
    EXPECT_EQ(chain::toChecksumAddress(moved.address()), TEST_SIGNER_ADDRESS);
    EXPECT_TRUE(chain::isZeroAddress(identity_res->address()));

    // the cleared identity cannot sign for the real account
    const auto signed_res = identity_res->sign(makeTx(moved.address()));
    ASSERT_FALSE(signed_res.has_value());
    EXPECT_EQ(signed_res.error().kind, signer::SigningError::Kind::INVALID_TRANSACTION);
}
