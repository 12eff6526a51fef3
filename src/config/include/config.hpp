#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "abi.hpp"
#include "address.hpp"

namespace tkd::config
{
    struct ConfigError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            MISSING_VALUE,
            INVALID_VALUE
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    struct Config
    {
        std::filesystem::path bin_path;
        std::filesystem::path logs_path;

        // deployment fails with a configuration error when these are absent
        std::string rpc_url;
        std::optional<std::string> private_key_hex;
        std::filesystem::path artifact_path;

        chain::Address fee_recipient{};
        chain::abi::Uint256 migration_threshold_wei = chain::abi::toUint256(10'000'000'000'000'000);

        std::uint64_t receipt_timeout_s = 300;
        std::uint64_t receipt_poll_interval_ms = 1500;
        std::uint64_t fallback_gas_price_wei = 1'000'000'000;
        std::uint64_t rpc_request_timeout_s = 30;
    };

    using EnvLookup = std::function<std::optional<std::string>(const std::string & name)>;

    std::optional<std::string> systemEnvironment(const std::string & name);

    /**
     * Reads RPC_URL, PRIVATE_KEY, CONTRACT_ARTIFACT_PATH, FEE_RECIPIENT_ADDRESS and the optional
     * tuning variables. A missing or invalid fee recipient is an error, a missing key, endpoint
     * or artifact path is not (the deployment itself reports those).
     */
    std::expected<Config, ConfigError> loadFromEnvironment(Config base, const EnvLookup & lookup = systemEnvironment);
}

template <>
struct fmt::formatter<tkd::config::ConfigError::Kind> : fmt::formatter<std::string_view>
{
    template<class FormatContext>
    auto format(const tkd::config::ConfigError::Kind & err, FormatContext & ctx) const
    {
        switch(err)
        {
            case tkd::config::ConfigError::Kind::MISSING_VALUE:
                return formatter<std::string_view>::format("Missing value", ctx);
            case tkd::config::ConfigError::Kind::INVALID_VALUE:
                return formatter<std::string_view>::format("Invalid value", ctx);
            default:
                return formatter<std::string_view>::format("Unknown", ctx);
        }
    }
};
