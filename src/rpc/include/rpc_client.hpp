#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chain_interface.hpp"

namespace tkd::rpc
{
    /**
     * Posts one JSON-RPC request and returns the full response envelope.
     */
    using RpcTransport = std::function<chain::ChainResult<nlohmann::json>(const std::string & rpc_url, const nlohmann::json & request)>;

    struct ClientConfig
    {
        std::string rpc_url;

        std::uint64_t request_timeout_s = 30;
        std::uint64_t receipt_poll_interval_ms = 1500;
    };

    struct ClientRuntimeOptions
    {
        RpcTransport transport = {};
        bool skip_sleep = false;
    };

    /**
     * Default transport, spawns `curl` with a bounded request time.
     */
    chain::ChainResult<nlohmann::json> curlTransport(const std::string & rpc_url, const nlohmann::json & request, std::uint64_t timeout_s);

    class JsonRpcChainClient final : public chain::IChainClient
    {
    public:
        explicit JsonRpcChainClient(ClientConfig cfg, ClientRuntimeOptions runtime_options = {});

        bool isConnected() const override;

        chain::ChainResult<std::uint64_t> getChainId() const override;

        chain::ChainResult<std::uint64_t> getNonce(const chain::Address & address) const override;

        chain::ChainResult<std::uint64_t> getGasPrice() const override;

        chain::ChainResult<std::uint64_t> estimateGas(const chain::Address & from, const std::vector<std::uint8_t> & data) const override;

        chain::ChainResult<chain::Hash> submit(const chain::SignedTransaction & signed_tx) const override;

        chain::ChainResult<chain::TransactionReceipt> waitForReceipt(const chain::Hash & tx_hash, std::chrono::milliseconds timeout) const override;

        chain::ChainResult<nlohmann::json> getTransaction(const chain::Hash & tx_hash) const override;

    private:
        chain::ChainResult<nlohmann::json> rpc(const std::string & method, nlohmann::json params) const;

        chain::ChainResult<std::uint64_t> rpcQuantity(const std::string & method, nlohmann::json params) const;

        ClientConfig _cfg;
        ClientRuntimeOptions _runtime_options;

        mutable std::atomic<std::uint64_t> _next_request_id{1};
    };
}
