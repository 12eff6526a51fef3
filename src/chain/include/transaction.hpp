#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "abi.hpp"
#include "address.hpp"
#include "artifact.hpp"
#include "utils.hpp"

namespace tkd::chain
{
    using utils::Bytes;

    /**
     * Legacy (EIP-155) contract creation transaction. The recipient is always empty.
     */
    struct UnsignedTransaction
    {
        Address from{};
        std::uint64_t nonce = 0;
        std::uint64_t gas_limit = 0;
        std::uint64_t gas_price = 0; // wei per gas
        std::uint64_t chain_id = 0;
        std::uint64_t value = 0;
        Bytes data;                  // bytecode followed by the encoded constructor arguments
    };

    struct SignedTransaction
    {
        UnsignedTransaction transaction;

        std::uint64_t v = 0;
        Hash r{};
        Hash s{};

        Bytes raw_bytes;
        Hash hash{};
    };

    struct TransactionReceipt
    {
        enum class Status : std::uint8_t
        {
            FAILURE = 0,
            SUCCESS = 1
        } status = Status::FAILURE;

        Hash tx_hash{};
        std::optional<Address> contract_address;
        std::uint64_t block_number = 0;
        std::uint64_t gas_used = 0;

        nlohmann::json raw;
    };

    /**
     * rlp([nonce, gasPrice, gasLimit, "", value, data, chainId, 0, 0])
     */
    Bytes encodeForSigning(const UnsignedTransaction & tx);

    Hash signingHash(const UnsignedTransaction & tx);

    /**
     * rlp([nonce, gasPrice, gasLimit, "", value, data, v, r, s])
     */
    Bytes encodeSigned(const UnsignedTransaction & tx, std::uint64_t v, const Hash & r, const Hash & s);

    /**
     * Assembles the creation transaction for `artifact`. Pure: equal inputs give an equal payload.
     * `gas_limit` is used as is, any safety margin has to be added by the caller.
     */
    UnsignedTransaction buildDeployTransaction(
        const artifact::ContractArtifact & artifact,
        const Address & from,
        const std::vector<abi::Value> & constructor_args,
        std::uint64_t nonce,
        std::uint64_t gas_limit,
        std::uint64_t gas_price,
        std::uint64_t chain_id);

    Bytes deploymentData(const artifact::ContractArtifact & artifact, const std::vector<abi::Value> & constructor_args);
}
