#include "config.hpp"

#include <cstdlib>
#include <utility>

#include <spdlog/spdlog.h>

#include "utils.hpp"

namespace tkd::config
{
    namespace
    {
        std::optional<std::string> _lookupTrimmed(const EnvLookup & lookup, const std::string & name)
        {
            const auto value = lookup(name);
            if(!value)
            {
                return std::nullopt;
            }

            std::string trimmed = utils::trim(*value);
            if(trimmed.empty())
            {
                return std::nullopt;
            }
            return trimmed;
        }

        std::expected<void, ConfigError> _readNumber(const EnvLookup & lookup, const std::string & name, std::uint64_t & out)
        {
            const auto value = _lookupTrimmed(lookup, name);
            if(!value)
            {
                return {};
            }

            const auto parsed = utils::parseDecimal(*value);
            if(!parsed)
            {
                return std::unexpected(ConfigError{
                    .kind = ConfigError::Kind::INVALID_VALUE,
                    .message = fmt::format("{} must be a non-negative integer, got '{}'", name, *value)
                });
            }

            out = *parsed;
            return {};
        }
    }

    std::optional<std::string> systemEnvironment(const std::string & name)
    {
        const char* value = std::getenv(name.c_str());
        if(value == nullptr)
        {
            return std::nullopt;
        }
        return std::string(value);
    }

    std::expected<Config, ConfigError> loadFromEnvironment(Config base, const EnvLookup & lookup)
    {
        Config cfg = std::move(base);

        if(const auto rpc_url = _lookupTrimmed(lookup, "RPC_URL"))
        {
            cfg.rpc_url = *rpc_url;
        }
        else
        {
            spdlog::error("RPC_URL environment variable not set");
        }

        cfg.private_key_hex = _lookupTrimmed(lookup, "PRIVATE_KEY");
        if(!cfg.private_key_hex)
        {
            spdlog::warn("PRIVATE_KEY environment variable not set");
        }

        if(const auto artifact_path = _lookupTrimmed(lookup, "CONTRACT_ARTIFACT_PATH"))
        {
            cfg.artifact_path = *artifact_path;
        }
        else
        {
            spdlog::warn("CONTRACT_ARTIFACT_PATH environment variable not set");
        }

        const auto fee_recipient = _lookupTrimmed(lookup, "FEE_RECIPIENT_ADDRESS");
        if(!fee_recipient)
        {
            return std::unexpected(ConfigError{
                .kind = ConfigError::Kind::MISSING_VALUE,
                .message = "Fee recipient address not set (FEE_RECIPIENT_ADDRESS)"
            });
        }

        const auto fee_recipient_address = chain::parseAddress(*fee_recipient);
        if(!fee_recipient_address)
        {
            return std::unexpected(ConfigError{
                .kind = ConfigError::Kind::INVALID_VALUE,
                .message = fmt::format("FEE_RECIPIENT_ADDRESS is not a valid address: {}", *fee_recipient)
            });
        }
        cfg.fee_recipient = *fee_recipient_address;

        if(const auto threshold = _lookupTrimmed(lookup, "MIGRATION_THRESHOLD_WEI"))
        {
            const auto threshold_wei = chain::abi::parseUint256(*threshold);
            if(!threshold_wei)
            {
                return std::unexpected(ConfigError{
                    .kind = ConfigError::Kind::INVALID_VALUE,
                    .message = fmt::format("MIGRATION_THRESHOLD_WEI must be a non-negative integer below 2^256, got '{}'", *threshold)
                });
            }
            cfg.migration_threshold_wei = *threshold_wei;
        }

        for(const auto & [name, field] : {
            std::pair<const char*, std::uint64_t*>{"RECEIPT_TIMEOUT_SECONDS", &cfg.receipt_timeout_s},
            std::pair<const char*, std::uint64_t*>{"RECEIPT_POLL_INTERVAL_MS", &cfg.receipt_poll_interval_ms},
            std::pair<const char*, std::uint64_t*>{"FALLBACK_GAS_PRICE_WEI", &cfg.fallback_gas_price_wei},
            std::pair<const char*, std::uint64_t*>{"RPC_REQUEST_TIMEOUT_SECONDS", &cfg.rpc_request_timeout_s}})
        {
            if(const auto read_res = _readNumber(lookup, name, *field); !read_res)
            {
                return std::unexpected(read_res.error());
            }
        }

        if(const auto logs_path = _lookupTrimmed(lookup, "TKD_LOGS_PATH"))
        {
            cfg.logs_path = *logs_path;
        }

        return cfg;
    }
}
