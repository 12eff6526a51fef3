#include "rpc_client.hpp"

#include <algorithm>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "native.h"
#include "utils.hpp"

namespace tkd::rpc
{
    using json = nlohmann::json;

    namespace
    {
        // curl exit codes, see `man curl`
        constexpr int CURL_COULDNT_RESOLVE_HOST = 6;
        constexpr int CURL_COULDNT_CONNECT = 7;
        constexpr int CURL_OPERATION_TIMEDOUT = 28;

        std::unexpected<chain::ChainError> _malformed(std::string message)
        {
            return std::unexpected(chain::ChainError{
                .kind = chain::ChainError::Kind::RPC_MALFORMED,
                .message = std::move(message)
            });
        }

        std::string _errorMessage(const json & error)
        {
            if(error.is_object() && error.contains("message") && error["message"].is_string())
            {
                return error["message"].get<std::string>();
            }
            return error.dump();
        }

        chain::ChainResult<chain::TransactionReceipt> _parseReceipt(const chain::Hash & tx_hash, const json & receipt)
        {
            if(!receipt.is_object())
            {
                return _malformed("eth_getTransactionReceipt returned non-object result");
            }

            chain::TransactionReceipt out;
            out.tx_hash = tx_hash;
            out.raw = receipt;

            if(receipt.contains("status") && receipt["status"].is_string())
            {
                const auto status = utils::parseQuantity(receipt["status"].get<std::string>());
                if(!status || *status > 1)
                {
                    return _malformed("Receipt contains invalid status");
                }
                out.status = (*status == 1) ? chain::TransactionReceipt::Status::SUCCESS : chain::TransactionReceipt::Status::FAILURE;
            }
            else
            {
                // pre-Byzantium receipts carry no status field
                out.status = chain::TransactionReceipt::Status::SUCCESS;
            }

            if(receipt.contains("contractAddress") && receipt["contractAddress"].is_string())
            {
                const auto contract_address = chain::parseAddress(receipt["contractAddress"].get<std::string>());
                if(!contract_address)
                {
                    return _malformed("Receipt contains invalid contractAddress");
                }
                out.contract_address = *contract_address;
            }

            if(receipt.contains("blockNumber") && receipt["blockNumber"].is_string())
            {
                out.block_number = utils::parseQuantity(receipt["blockNumber"].get<std::string>()).value_or(0);
            }

            if(receipt.contains("gasUsed") && receipt["gasUsed"].is_string())
            {
                out.gas_used = utils::parseQuantity(receipt["gasUsed"].get<std::string>()).value_or(0);
            }

            return out;
        }
    }

    chain::ChainResult<json> curlTransport(const std::string & rpc_url, const json & request, const std::uint64_t timeout_s)
    {
        std::vector<std::string> args{
            "-sS",
            "-X", "POST",
            rpc_url,
            "-H", "Content-Type: application/json",
            "--max-time", std::to_string(timeout_s),
            "--data", request.dump()
        };

        const std::string method = request.value("method", "");

        const auto [exit_code, output] = native::runProcess("curl", std::move(args));
        if(exit_code == CURL_COULDNT_RESOLVE_HOST || exit_code == CURL_COULDNT_CONNECT)
        {
            return std::unexpected(chain::ChainError{
                .kind = chain::ChainError::Kind::NODE_UNREACHABLE,
                .message = fmt::format("Node unreachable for method '{}': {}", method, utils::trim(output))
            });
        }

        if(exit_code == CURL_OPERATION_TIMEDOUT)
        {
            return std::unexpected(chain::ChainError{
                .kind = chain::ChainError::Kind::TIMEOUT,
                .message = fmt::format("Request '{}' timed out after {}s", method, timeout_s)
            });
        }

        if(exit_code != 0)
        {
            return std::unexpected(chain::ChainError{
                .kind = chain::ChainError::Kind::RPC_ERROR,
                .message = fmt::format("curl failed for method '{}' with code {}: {}", method, exit_code, utils::trim(output))
            });
        }

        const json response = json::parse(output, nullptr, false);
        if(response.is_discarded())
        {
            return _malformed(fmt::format("Invalid JSON response for method '{}': {}", method, output));
        }

        return response;
    }

    JsonRpcChainClient::JsonRpcChainClient(ClientConfig cfg, ClientRuntimeOptions runtime_options)
        : _cfg(std::move(cfg)), _runtime_options(std::move(runtime_options))
    {
        if(!_runtime_options.transport)
        {
            const std::uint64_t timeout_s = _cfg.request_timeout_s;
            _runtime_options.transport = [timeout_s](const std::string & rpc_url, const json & request)
            {
                return curlTransport(rpc_url, request, timeout_s);
            };
        }
    }

    bool JsonRpcChainClient::isConnected() const
    {
        const auto version_res = rpc("web3_clientVersion", json::array());
        if(!version_res)
        {
            spdlog::warn("Node {} is not reachable: {}", _cfg.rpc_url, version_res.error().message);
            return false;
        }

        spdlog::debug("Connected to node {} ({})", _cfg.rpc_url, version_res->is_string() ? version_res->get<std::string>() : version_res->dump());
        return true;
    }

    chain::ChainResult<std::uint64_t> JsonRpcChainClient::getChainId() const
    {
        return rpcQuantity("eth_chainId", json::array());
    }

    chain::ChainResult<std::uint64_t> JsonRpcChainClient::getNonce(const chain::Address & address) const
    {
        return rpcQuantity("eth_getTransactionCount", json::array({chain::addressToHex(address), "pending"}));
    }

    chain::ChainResult<std::uint64_t> JsonRpcChainClient::getGasPrice() const
    {
        return rpcQuantity("eth_gasPrice", json::array());
    }

    chain::ChainResult<std::uint64_t> JsonRpcChainClient::estimateGas(const chain::Address & from, const std::vector<std::uint8_t> & data) const
    {
        return rpcQuantity("eth_estimateGas", json::array({json{
            {"from", chain::addressToHex(from)},
            {"data", utils::bytesToHex(data, true)},
            {"value", utils::toQuantity(0)}
        }}));
    }

    chain::ChainResult<chain::Hash> JsonRpcChainClient::submit(const chain::SignedTransaction & signed_tx) const
    {
        const auto send_res = rpc("eth_sendRawTransaction", json::array({utils::bytesToHex(signed_tx.raw_bytes, true)}));
        if(!send_res)
        {
            return std::unexpected(send_res.error());
        }

        if(!send_res->is_string())
        {
            return _malformed("eth_sendRawTransaction returned non-string result");
        }

        const auto tx_hash = chain::parseHash(send_res->get<std::string>());
        if(!tx_hash)
        {
            return _malformed(fmt::format("eth_sendRawTransaction returned invalid hash {}", send_res->get<std::string>()));
        }

        if(*tx_hash != signed_tx.hash)
        {
            spdlog::warn("Node reported transaction hash {} but {} was computed locally",
                chain::hashToHex(*tx_hash), chain::hashToHex(signed_tx.hash));
        }

        return *tx_hash;
    }

    chain::ChainResult<chain::TransactionReceipt> JsonRpcChainClient::waitForReceipt(const chain::Hash & tx_hash, const std::chrono::milliseconds timeout) const
    {
        const std::string tx_hash_hex = chain::hashToHex(tx_hash);
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        const auto poll_interval = std::chrono::milliseconds(_cfg.receipt_poll_interval_ms);

        std::size_t polls = 0;
        while(true)
        {
            ++polls;
            const auto receipt_res = rpc("eth_getTransactionReceipt", json::array({tx_hash_hex}));
            if(receipt_res && !receipt_res->is_null())
            {
                spdlog::debug("Receipt for {} observed after {} polls", tx_hash_hex, polls);
                return _parseReceipt(tx_hash, *receipt_res);
            }

            if(!receipt_res)
            {
                if(receipt_res.error().kind != chain::ChainError::Kind::NODE_UNREACHABLE &&
                    receipt_res.error().kind != chain::ChainError::Kind::TIMEOUT)
                {
                    return std::unexpected(receipt_res.error());
                }
                spdlog::warn("Receipt poll for {} failed, will retry: {}", tx_hash_hex, receipt_res.error().message);
            }

            const auto now = std::chrono::steady_clock::now();
            if(now >= deadline)
            {
                break;
            }

            if(!_runtime_options.skip_sleep)
            {
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
                std::this_thread::sleep_for(std::min(poll_interval, remaining));
            }
        }

        return std::unexpected(chain::ChainError{
            .kind = chain::ChainError::Kind::TIMEOUT,
            .message = fmt::format("Transaction {} was not mined within {}s", tx_hash_hex,
                std::chrono::duration_cast<std::chrono::seconds>(timeout).count())
        });
    }

    chain::ChainResult<json> JsonRpcChainClient::getTransaction(const chain::Hash & tx_hash) const
    {
        const auto tx_res = rpc("eth_getTransactionByHash", json::array({chain::hashToHex(tx_hash)}));
        if(!tx_res)
        {
            return std::unexpected(tx_res.error());
        }

        if(tx_res->is_null())
        {
            return std::unexpected(chain::ChainError{
                .kind = chain::ChainError::Kind::RPC_ERROR,
                .message = fmt::format("Transaction {} not found", chain::hashToHex(tx_hash))
            });
        }
        return *tx_res;
    }

    chain::ChainResult<json> JsonRpcChainClient::rpc(const std::string & method, json params) const
    {
        if(_cfg.rpc_url.empty())
        {
            return std::unexpected(chain::ChainError{
                .kind = chain::ChainError::Kind::NODE_UNREACHABLE,
                .message = "rpc_url is empty"
            });
        }

        const json request{
            {"jsonrpc", "2.0"},
            {"id", _next_request_id.fetch_add(1, std::memory_order_relaxed)},
            {"method", method},
            {"params", std::move(params)}
        };

        spdlog::debug("RPC -> {}", method);

        const auto response_res = _runtime_options.transport(_cfg.rpc_url, request);
        if(!response_res)
        {
            return std::unexpected(response_res.error());
        }

        const json & response = *response_res;
        if(!response.is_object())
        {
            return _malformed(fmt::format("RPC '{}' response is not an object", method));
        }

        if(response.contains("error") && !response["error"].is_null())
        {
            return std::unexpected(chain::ChainError{
                .kind = chain::ChainError::Kind::RPC_ERROR,
                .message = fmt::format("RPC '{}' error: {}", method, _errorMessage(response["error"]))
            });
        }

        if(!response.contains("result"))
        {
            return _malformed(fmt::format("RPC '{}' response missing result field", method));
        }

        return response["result"];
    }

    chain::ChainResult<std::uint64_t> JsonRpcChainClient::rpcQuantity(const std::string & method, json params) const
    {
        const auto rpc_res = rpc(method, std::move(params));
        if(!rpc_res)
        {
            return std::unexpected(rpc_res.error());
        }

        if(!rpc_res->is_string())
        {
            return _malformed(fmt::format("{} returned non-string result", method));
        }

        const auto parsed = utils::parseQuantity(rpc_res->get<std::string>());
        if(!parsed)
        {
            return _malformed(fmt::format("Failed to parse {} quantity {}", method, rpc_res->get<std::string>()));
        }
        return *parsed;
    }
}
