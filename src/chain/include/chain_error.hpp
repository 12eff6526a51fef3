#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

namespace tkd::chain
{
    struct ChainError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            NODE_UNREACHABLE,
            TIMEOUT,
            RPC_ERROR,
            RPC_MALFORMED
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    template<class T>
    using ChainResult = std::expected<T, ChainError>;
}

template <>
struct fmt::formatter<tkd::chain::ChainError::Kind> : fmt::formatter<std::string_view>
{
    template<class FormatContext>
    auto format(const tkd::chain::ChainError::Kind & err, FormatContext & ctx) const
    {
        switch(err)
        {
            case tkd::chain::ChainError::Kind::NODE_UNREACHABLE:
                return formatter<std::string_view>::format("Node unreachable", ctx);
            case tkd::chain::ChainError::Kind::TIMEOUT:
                return formatter<std::string_view>::format("Timeout", ctx);
            case tkd::chain::ChainError::Kind::RPC_ERROR:
                return formatter<std::string_view>::format("RPC error", ctx);
            case tkd::chain::ChainError::Kind::RPC_MALFORMED:
                return formatter<std::string_view>::format("Malformed RPC response", ctx);
            default:
                return formatter<std::string_view>::format("Unknown", ctx);
        }
    }
};
