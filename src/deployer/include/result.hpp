#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include "address.hpp"

namespace tkd::deployer
{
    enum class Stage : std::uint8_t
    {
        INIT = 0,
        IDENTITY_READY,
        ARTIFACT_READY,
        NONCE_READY,
        GAS_ESTIMATED,
        PRICE_READY,
        BUILT,
        SIGNED,
        SUBMITTED,
        CONFIRMED,
        FAILED
    };

    enum class FailureKind : std::uint8_t
    {
        UNKNOWN = 0,
        CONFIGURATION_ERROR,
        INVALID_REQUEST,
        ARTIFACT_NOT_FOUND,
        ARTIFACT_MALFORMED,
        INVALID_KEY,
        NODE_UNREACHABLE,
        RPC_ERROR,
        GAS_ESTIMATION_FAILURE,
        SIGNING_ERROR,
        SUBMISSION_TIMEOUT,
        ON_CHAIN_REVERT
    };

    struct Success
    {
        chain::Address contract_address{};
        chain::Hash tx_hash{};
        chain::Address deployer{};
        std::uint64_t block_number = 0;
        std::uint64_t gas_used = 0;
    };

    struct Failure
    {
        FailureKind kind = FailureKind::UNKNOWN;

        // last state reached before the failure
        Stage stage = Stage::INIT;

        std::string reason;
    };

    using DeploymentResult = std::variant<Success, Failure>;

    bool isSuccess(const DeploymentResult & result);

    /**
     * Outbound value: {"contractAddress": "0x..."} or {"error": "..."}.
     */
    nlohmann::json toJson(const DeploymentResult & result);
}

template <>
struct fmt::formatter<tkd::deployer::Stage> : fmt::formatter<std::string_view>
{
    template<class FormatContext>
    auto format(const tkd::deployer::Stage & stage, FormatContext & ctx) const
    {
        switch(stage)
        {
            case tkd::deployer::Stage::INIT:            return formatter<std::string_view>::format("Init", ctx);
            case tkd::deployer::Stage::IDENTITY_READY:  return formatter<std::string_view>::format("IdentityReady", ctx);
            case tkd::deployer::Stage::ARTIFACT_READY:  return formatter<std::string_view>::format("ArtifactReady", ctx);
            case tkd::deployer::Stage::NONCE_READY:     return formatter<std::string_view>::format("NonceReady", ctx);
            case tkd::deployer::Stage::GAS_ESTIMATED:   return formatter<std::string_view>::format("GasEstimated", ctx);
            case tkd::deployer::Stage::PRICE_READY:     return formatter<std::string_view>::format("PriceReady", ctx);
            case tkd::deployer::Stage::BUILT:           return formatter<std::string_view>::format("Built", ctx);
            case tkd::deployer::Stage::SIGNED:          return formatter<std::string_view>::format("Signed", ctx);
            case tkd::deployer::Stage::SUBMITTED:       return formatter<std::string_view>::format("Submitted", ctx);
            case tkd::deployer::Stage::CONFIRMED:       return formatter<std::string_view>::format("Confirmed", ctx);
            case tkd::deployer::Stage::FAILED:          return formatter<std::string_view>::format("Failed", ctx);
            default:                                    return formatter<std::string_view>::format("Unknown", ctx);
        }
    }
};

template <>
struct fmt::formatter<tkd::deployer::FailureKind> : fmt::formatter<std::string_view>
{
    template<class FormatContext>
    auto format(const tkd::deployer::FailureKind & kind, FormatContext & ctx) const
    {
        switch(kind)
        {
            case tkd::deployer::FailureKind::CONFIGURATION_ERROR:    return formatter<std::string_view>::format("Configuration error", ctx);
            case tkd::deployer::FailureKind::INVALID_REQUEST:        return formatter<std::string_view>::format("Invalid request", ctx);
            case tkd::deployer::FailureKind::ARTIFACT_NOT_FOUND:     return formatter<std::string_view>::format("Artifact not found", ctx);
            case tkd::deployer::FailureKind::ARTIFACT_MALFORMED:     return formatter<std::string_view>::format("Malformed artifact", ctx);
            case tkd::deployer::FailureKind::INVALID_KEY:            return formatter<std::string_view>::format("Invalid key", ctx);
            case tkd::deployer::FailureKind::NODE_UNREACHABLE:       return formatter<std::string_view>::format("Node unreachable", ctx);
            case tkd::deployer::FailureKind::RPC_ERROR:              return formatter<std::string_view>::format("RPC error", ctx);
            case tkd::deployer::FailureKind::GAS_ESTIMATION_FAILURE: return formatter<std::string_view>::format("Gas estimation failure", ctx);
            case tkd::deployer::FailureKind::SIGNING_ERROR:          return formatter<std::string_view>::format("Signing error", ctx);
            case tkd::deployer::FailureKind::SUBMISSION_TIMEOUT:     return formatter<std::string_view>::format("Submission timeout", ctx);
            case tkd::deployer::FailureKind::ON_CHAIN_REVERT:        return formatter<std::string_view>::format("On-chain revert", ctx);
            default:                                                 return formatter<std::string_view>::format("Unknown", ctx);
        }
    }
};
