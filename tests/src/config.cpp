#include <map>

#include "unit-tests.hpp"

using namespace tkd;
using namespace tkd::tests;

namespace
{
    config::EnvLookup makeEnv(std::map<std::string, std::string> values)
    {
        return [values = std::move(values)](const std::string & name) -> std::optional<std::string>
        {
            const auto it = values.find(name);
            if(it == values.end())
            {
                return std::nullopt;
            }
            return it->second;
        };
    }
}

TEST_F(UnitTest, Config_LoadsAllValues)
{
    const auto cfg_res = config::loadFromEnvironment(config::Config{}, makeEnv({
        {"RPC_URL", "  https://sepolia.example.org  "},
        {"PRIVATE_KEY", TEST_PRIVATE_KEY},
        {"CONTRACT_ARTIFACT_PATH", "artifacts/PumpToken.json"},
        {"FEE_RECIPIENT_ADDRESS", TEST_FEE_RECIPIENT},
        {"MIGRATION_THRESHOLD_WEI", "5000"},
        {"RECEIPT_TIMEOUT_SECONDS", "60"},
        {"RECEIPT_POLL_INTERVAL_MS", "250"},
        {"FALLBACK_GAS_PRICE_WEI", "2000000000"},
        {"RPC_REQUEST_TIMEOUT_SECONDS", "10"},
        {"TKD_LOGS_PATH", "/tmp/tkd-logs"}
    }));
    ASSERT_TRUE(cfg_res.has_value()) << cfg_res.error().message;

    EXPECT_EQ(cfg_res->rpc_url, "https://sepolia.example.org");
    ASSERT_TRUE(cfg_res->private_key_hex.has_value());
    EXPECT_EQ(*cfg_res->private_key_hex, TEST_PRIVATE_KEY);
    EXPECT_EQ(cfg_res->artifact_path, std::filesystem::path("artifacts/PumpToken.json"));
    EXPECT_EQ(chain::toChecksumAddress(cfg_res->fee_recipient), TEST_FEE_RECIPIENT);
    EXPECT_EQ(cfg_res->migration_threshold_wei, chain::abi::toUint256(5000));
    EXPECT_EQ(cfg_res->receipt_timeout_s, 60u);
    EXPECT_EQ(cfg_res->receipt_poll_interval_ms, 250u);
    EXPECT_EQ(cfg_res->fallback_gas_price_wei, 2'000'000'000u);
    EXPECT_EQ(cfg_res->rpc_request_timeout_s, 10u);
    EXPECT_EQ(cfg_res->logs_path, std::filesystem::path("/tmp/tkd-logs"));
}

TEST_F(UnitTest, Config_DefaultsWhenOptionalValuesAbsent)
{
    config::Config base;
    base.logs_path = "base-logs";

    const auto cfg_res = config::loadFromEnvironment(base, makeEnv({
        {"FEE_RECIPIENT_ADDRESS", TEST_FEE_RECIPIENT},
        {"PRIVATE_KEY", "   "}
    }));
    ASSERT_TRUE(cfg_res.has_value()) << cfg_res.error().message;

    EXPECT_TRUE(cfg_res->rpc_url.empty());
    EXPECT_FALSE(cfg_res->private_key_hex.has_value());
    EXPECT_TRUE(cfg_res->artifact_path.empty());
    EXPECT_EQ(cfg_res->logs_path, std::filesystem::path("base-logs"));
    EXPECT_EQ(cfg_res->migration_threshold_wei, chain::abi::toUint256(10'000'000'000'000'000));
    EXPECT_EQ(cfg_res->receipt_timeout_s, 300u);
    EXPECT_EQ(cfg_res->receipt_poll_interval_ms, 1500u);
    EXPECT_EQ(cfg_res->fallback_gas_price_wei, 1'000'000'000u);
    EXPECT_EQ(cfg_res->rpc_request_timeout_s, 30u);
}

TEST_F(UnitTest, Config_FeeRecipientRequired)
{
    const auto missing_res = config::loadFromEnvironment(config::Config{}, makeEnv({
        {"RPC_URL", "http://localhost:8545"}
    }));
    ASSERT_FALSE(missing_res.has_value());
    EXPECT_EQ(missing_res.error().kind, config::ConfigError::Kind::MISSING_VALUE);

    const auto invalid_res = config::loadFromEnvironment(config::Config{}, makeEnv({
        {"FEE_RECIPIENT_ADDRESS", "0x1234"}
    }));
    ASSERT_FALSE(invalid_res.has_value());
    EXPECT_EQ(invalid_res.error().kind, config::ConfigError::Kind::INVALID_VALUE);
}

TEST_F(UnitTest, Config_InvalidNumbers)
{
    for(const std::string & value : {"abc", "-1", "1.5", "1e18",
        "115792089237316195423570985008687907853269984665640564039457584007913129639936"})
    {
        const auto cfg_res = config::loadFromEnvironment(config::Config{}, makeEnv({
            {"FEE_RECIPIENT_ADDRESS", TEST_FEE_RECIPIENT},
            {"MIGRATION_THRESHOLD_WEI", value}
        }));
        ASSERT_FALSE(cfg_res.has_value()) << value;
        EXPECT_EQ(cfg_res.error().kind, config::ConfigError::Kind::INVALID_VALUE);
        EXPECT_NE(cfg_res.error().message.find("MIGRATION_THRESHOLD_WEI"), std::string::npos);
    }
}

TEST_F(UnitTest, Config_ThresholdAbove64Bits)
{
    const auto cfg_res = config::loadFromEnvironment(config::Config{}, makeEnv({
        {"FEE_RECIPIENT_ADDRESS", TEST_FEE_RECIPIENT},
        {"MIGRATION_THRESHOLD_WEI", "100000000000000000000"}
    }));
    ASSERT_TRUE(cfg_res.has_value()) << cfg_res.error().message;
    EXPECT_EQ(cfg_res->migration_threshold_wei, chain::abi::parseUint256("100000000000000000000"));
    EXPECT_NE(cfg_res->migration_threshold_wei, chain::abi::toUint256(0));
}

TEST_F(UnitTest, Config_KeyNeverInErrors)
{
    const auto cfg_res = config::loadFromEnvironment(config::Config{}, makeEnv({
        {"PRIVATE_KEY", TEST_PRIVATE_KEY},
        {"FEE_RECIPIENT_ADDRESS", "garbage"}
    }));
    ASSERT_FALSE(cfg_res.has_value());
    EXPECT_EQ(cfg_res.error().message.find(TEST_PRIVATE_KEY), std::string::npos);
}
