#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "abi.hpp"
#include "address.hpp"
#include "chain_interface.hpp"
#include "result.hpp"

namespace tkd::deployer
{
    constexpr std::uint64_t DEFAULT_GAS_LIMIT_BUFFER = 100'000;
    constexpr std::uint64_t DEFAULT_FALLBACK_GAS_PRICE_WEI = 1'000'000'000; // 1 gwei
    constexpr std::uint64_t DEFAULT_MIGRATION_THRESHOLD_WEI = 10'000'000'000'000'000; // 0.01 ether
    constexpr std::chrono::seconds DEFAULT_RECEIPT_TIMEOUT{300};

    struct DeploymentRequest
    {
        std::string name;
        std::string symbol;
        chain::Address fee_recipient{};
        chain::abi::Uint256 migration_threshold_wei = chain::abi::toUint256(DEFAULT_MIGRATION_THRESHOLD_WEI);
    };

    struct DeploymentSettings
    {
        std::optional<std::string> private_key_hex;
        std::filesystem::path artifact_path;

        std::uint64_t gas_limit_buffer = DEFAULT_GAS_LIMIT_BUFFER;
        std::uint64_t fallback_gas_price_wei = DEFAULT_FALLBACK_GAS_PRICE_WEI;
        std::chrono::seconds receipt_timeout = DEFAULT_RECEIPT_TIMEOUT;
    };

    /**
     * (name, symbol, migrationThreshold, feeRecipient). The artifact constructor has to declare
     * the same parameter list, `(string,string,uint256,address)`.
     */
    std::vector<chain::abi::Value> constructorArguments(const DeploymentRequest & request);

    /**
     * Runs a single deployment attempt. Nothing is retried; the returned value is the only
     * outcome reported to the caller and never carries secret key material.
     *
     * @param client Node connection, may be null when no endpoint is configured.
     */
    DeploymentResult deployToken(
        const chain::IChainClient * client,
        const DeploymentSettings & settings,
        const DeploymentRequest & request);
}
