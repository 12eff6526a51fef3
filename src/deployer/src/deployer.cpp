#include "deployer.hpp"

#include <limits>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "artifact.hpp"
#include "file.hpp"
#include "signer.hpp"
#include "transaction.hpp"
#include "utils.hpp"

namespace tkd::deployer
{
    namespace
    {
        FailureKind _classify(const chain::ChainError & error)
        {
            switch(error.kind)
            {
                case chain::ChainError::Kind::NODE_UNREACHABLE:
                case chain::ChainError::Kind::TIMEOUT:
                    return FailureKind::NODE_UNREACHABLE;
                default:
                    return FailureKind::RPC_ERROR;
            }
        }

        // view into the caller's buffer, the key is not copied
        std::string_view _trimmed(std::string_view value)
        {
            constexpr std::string_view WHITESPACE = " \t\r\n\f\v";
            const std::size_t first = value.find_first_not_of(WHITESPACE);
            if(first == std::string_view::npos)
            {
                return {};
            }
            const std::size_t last = value.find_last_not_of(WHITESPACE);
            return value.substr(first, last - first + 1);
        }

        std::string _joinTypes(const std::vector<std::string> & types)
        {
            std::string out = "(";
            for(std::size_t i = 0; i < types.size(); ++i)
            {
                if(i > 0)
                {
                    out += ",";
                }
                out += types[i];
            }
            out += ")";
            return out;
        }

        class Pipeline
        {
        public:
            Pipeline(const chain::IChainClient * client, const DeploymentSettings & settings, const DeploymentRequest & request)
                : _client(client), _settings(settings), _request(request)
            {
            }

            DeploymentResult run()
            {
                const std::string_view secret_key_hex = _settings.private_key_hex
                    ? _trimmed(*_settings.private_key_hex)
                    : std::string_view{};
                if(secret_key_hex.empty())
                {
                    return fail(FailureKind::CONFIGURATION_ERROR, "Private key not configured");
                }

                if(_settings.artifact_path.empty())
                {
                    return fail(FailureKind::CONFIGURATION_ERROR, "Contract artifact path not configured");
                }

                if(_request.name.empty() || _request.symbol.empty())
                {
                    return fail(FailureKind::INVALID_REQUEST, "Missing token name or symbol");
                }

                if(_client == nullptr || !_client->isConnected())
                {
                    return fail(FailureKind::CONFIGURATION_ERROR, "Backend not connected to network");
                }

                // cheap check before the parse
                if(!file::isReadableFile(_settings.artifact_path))
                {
                    return fail(FailureKind::ARTIFACT_NOT_FOUND, fmt::format(
                        "Contract artifact file not found at {}. Ensure contract is compiled and path is correct",
                        _settings.artifact_path.string()));
                }

                auto identity_res = signer::SigningIdentity::derive(secret_key_hex);
                if(!identity_res)
                {
                    return fail(FailureKind::INVALID_KEY, identity_res.error().message);
                }
                const signer::SigningIdentity identity = std::move(*identity_res);
                const chain::Address & sender = identity.address();
                advance(Stage::IDENTITY_READY);
                spdlog::info("Deploying from account: {}", chain::toChecksumAddress(sender));

                auto artifact_res = artifact::loadArtifact(_settings.artifact_path);
                if(!artifact_res)
                {
                    const FailureKind kind = artifact_res.error().kind == artifact::ArtifactError::Kind::NOT_FOUND
                        ? FailureKind::ARTIFACT_NOT_FOUND
                        : FailureKind::ARTIFACT_MALFORMED;
                    return fail(kind, artifact_res.error().message);
                }
                const artifact::ContractArtifact contract_artifact = std::move(*artifact_res);

                const std::vector<chain::abi::Value> constructor_args = constructorArguments(_request);

                const std::string artifact_signature = _joinTypes(contract_artifact.constructorInputTypes());
                const std::string expected_signature = chain::abi::signatureOf(constructor_args);
                if(artifact_signature != expected_signature)
                {
                    return fail(FailureKind::ARTIFACT_MALFORMED, fmt::format(
                        "Artifact constructor {} does not match the expected {}",
                        artifact_signature, expected_signature));
                }
                advance(Stage::ARTIFACT_READY);
                const chain::Bytes deploy_data = chain::deploymentData(contract_artifact, constructor_args);

                const auto nonce_res = _client->getNonce(sender);
                if(!nonce_res)
                {
                    return fail(_classify(nonce_res.error()), fmt::format("Failed to fetch account nonce: {}", nonce_res.error().message));
                }
                const std::uint64_t nonce = *nonce_res;
                advance(Stage::NONCE_READY);

                spdlog::info("Estimating gas...");
                const auto estimate_res = _client->estimateGas(sender, deploy_data);
                if(!estimate_res)
                {
                    return failGasEstimation(estimate_res.error());
                }
                const std::uint64_t gas_estimate = *estimate_res;
                spdlog::info("Gas estimate: {}", gas_estimate);

                if(gas_estimate > std::numeric_limits<std::uint64_t>::max() - _settings.gas_limit_buffer)
                {
                    return fail(FailureKind::GAS_ESTIMATION_FAILURE, fmt::format("Node returned an implausible gas estimate {}", gas_estimate));
                }
                advance(Stage::GAS_ESTIMATED);

                std::uint64_t gas_price = _settings.fallback_gas_price_wei;
                if(const auto gas_price_res = _client->getGasPrice())
                {
                    gas_price = *gas_price_res;
                }
                else
                {
                    spdlog::warn("Error fetching gas price, using fallback of {} gwei: {}",
                        utils::formatUnits(gas_price, 9), gas_price_res.error().message);
                }
                advance(Stage::PRICE_READY);

                const auto chain_id_res = _client->getChainId();
                if(!chain_id_res)
                {
                    return fail(_classify(chain_id_res.error()), fmt::format("Failed to fetch chain id: {}", chain_id_res.error().message));
                }

                const chain::UnsignedTransaction tx = chain::buildDeployTransaction(
                    contract_artifact,
                    sender,
                    constructor_args,
                    nonce,
                    gas_estimate + _settings.gas_limit_buffer,
                    gas_price,
                    *chain_id_res);
                advance(Stage::BUILT);
                spdlog::debug("Transaction built: nonce={}, gas={}, gasPrice={}, chainId={}", tx.nonce, tx.gas_limit, tx.gas_price, tx.chain_id);

                const auto signed_res = identity.sign(tx);
                if(!signed_res)
                {
                    return fail(FailureKind::SIGNING_ERROR, fmt::format("{}: {}", signed_res.error().kind, signed_res.error().message));
                }
                advance(Stage::SIGNED);

                const chain::Address predicted_address = chain::computeCreateAddress(sender, nonce);
                spdlog::info("Sending transaction, expected contract address {}", chain::toChecksumAddress(predicted_address));

                const auto submit_res = _client->submit(*signed_res);
                if(!submit_res)
                {
                    return fail(_classify(submit_res.error()), fmt::format("Failed to send transaction: {}", submit_res.error().message));
                }
                const chain::Hash tx_hash = *submit_res;
                advance(Stage::SUBMITTED);
                spdlog::info("Transaction sent. Hash: {}", chain::hashToHex(tx_hash));

                spdlog::info("Waiting for transaction to be mined...");
                const auto receipt_res = _client->waitForReceipt(tx_hash, std::chrono::duration_cast<std::chrono::milliseconds>(_settings.receipt_timeout));
                if(!receipt_res)
                {
                    if(receipt_res.error().kind == chain::ChainError::Kind::TIMEOUT)
                    {
                        return fail(FailureKind::SUBMISSION_TIMEOUT, fmt::format(
                            "Transaction {} was not mined within {}s. It may still be mined later",
                            chain::hashToHex(tx_hash), _settings.receipt_timeout.count()));
                    }
                    return fail(_classify(receipt_res.error()), fmt::format("Failed to fetch receipt for {}: {}",
                        chain::hashToHex(tx_hash), receipt_res.error().message));
                }

                if(receipt_res->status != chain::TransactionReceipt::Status::SUCCESS)
                {
                    logRevertDetails(tx_hash, *receipt_res);
                    return fail(FailureKind::ON_CHAIN_REVERT, fmt::format(
                        "Transaction {} failed during deployment. Check the block explorer", chain::hashToHex(tx_hash)));
                }

                if(!receipt_res->contract_address)
                {
                    return fail(FailureKind::RPC_ERROR, fmt::format("Receipt for {} is missing contractAddress", chain::hashToHex(tx_hash)));
                }

                if(*receipt_res->contract_address != predicted_address)
                {
                    spdlog::warn("Contract deployed at {} instead of the expected {}",
                        chain::toChecksumAddress(*receipt_res->contract_address), chain::toChecksumAddress(predicted_address));
                }

                advance(Stage::CONFIRMED);
                spdlog::info("Contract deployed at address: {}", chain::toChecksumAddress(*receipt_res->contract_address));

                return Success{
                    .contract_address = *receipt_res->contract_address,
                    .tx_hash = tx_hash,
                    .deployer = sender,
                    .block_number = receipt_res->block_number,
                    .gas_used = receipt_res->gas_used
                };
            }

        private:
            void advance(const Stage next)
            {
                spdlog::debug("Deployment stage {} -> {}", _stage, next);
                _stage = next;
            }

            Failure fail(const FailureKind kind, std::string reason)
            {
                spdlog::error("Deployment failed at {} ({}): {}", _stage, kind, reason);
                spdlog::debug("Deployment stage {} -> {}", _stage, Stage::FAILED);
                return Failure{
                    .kind = kind,
                    .stage = _stage,
                    .reason = std::move(reason)
                };
            }

            Failure failGasEstimation(const chain::ChainError & error)
            {
                spdlog::error("Gas estimation error: {}", error.message);

                // diagnostics only, must not replace the estimation error
                std::string price_context;
                if(const auto gas_price_res = _client->getGasPrice())
                {
                    price_context = fmt::format("Current gas price: {} gwei", utils::formatUnits(*gas_price_res, 9));
                    spdlog::info("{}", price_context);
                }
                else
                {
                    price_context = "Current gas price unavailable";
                    spdlog::warn("Could not retrieve current gas price after gas estimation error: {}", gas_price_res.error().message);
                }

                const std::string cause = error.message.empty() ? fmt::format("{}", error.kind) : error.message;
                return fail(FailureKind::GAS_ESTIMATION_FAILURE, fmt::format(
                    "Error estimating gas: {}. {}. Check account balance and constructor args", cause, price_context));
            }

            void logRevertDetails(const chain::Hash & tx_hash, const chain::TransactionReceipt & receipt) const
            {
                spdlog::error("Transaction {} reverted in block {} (gas used {})", chain::hashToHex(tx_hash), receipt.block_number, receipt.gas_used);
                spdlog::debug("Receipt: {}", receipt.raw.dump());

                const auto tx_res = _client->getTransaction(tx_hash);
                if(!tx_res)
                {
                    spdlog::warn("Could not retrieve transaction details for troubleshooting: {}", tx_res.error().message);
                    return;
                }
                spdlog::debug("Transaction: {}", tx_res->dump());
            }

            const chain::IChainClient * _client;
            const DeploymentSettings & _settings;
            const DeploymentRequest & _request;

            Stage _stage = Stage::INIT;
        };
    }

    std::vector<chain::abi::Value> constructorArguments(const DeploymentRequest & request)
    {
        return {
            request.name,
            request.symbol,
            request.migration_threshold_wei,
            request.fee_recipient
        };
    }

    DeploymentResult deployToken(
        const chain::IChainClient * client,
        const DeploymentSettings & settings,
        const DeploymentRequest & request)
    {
        Pipeline pipeline(client, settings, request);
        return pipeline.run();
    }
}
