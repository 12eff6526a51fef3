#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "address.hpp"
#include "chain_error.hpp"
#include "transaction.hpp"

namespace tkd::chain
{
    /**
     * Capability set of a remote node. Implementations must allow concurrent read-only calls.
     */
    class IChainClient
    {
    public:
        virtual ~IChainClient() = default;

        virtual bool isConnected() const = 0;

        virtual ChainResult<std::uint64_t> getChainId() const = 0;

        virtual ChainResult<std::uint64_t> getNonce(const Address & address) const = 0;

        // wei per gas
        virtual ChainResult<std::uint64_t> getGasPrice() const = 0;

        virtual ChainResult<std::uint64_t> estimateGas(const Address & from, const std::vector<std::uint8_t> & data) const = 0;

        virtual ChainResult<Hash> submit(const SignedTransaction & signed_tx) const = 0;

        /**
         * Polls until the transaction is mined or `timeout` elapses. Never resubmits.
         */
        virtual ChainResult<TransactionReceipt> waitForReceipt(const Hash & tx_hash, std::chrono::milliseconds timeout) const = 0;

        virtual ChainResult<nlohmann::json> getTransaction(const Hash & tx_hash) const = 0;
    };
}
