#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "address.hpp"
#include "utils.hpp"

namespace tkd::chain::abi
{
    using utils::Bytes;

    // big-endian 256-bit word
    using Uint256 = evmc::uint256be;

    // string -> `string`, Uint256 -> `uint256`, Address -> `address`
    using Value = std::variant<std::string, Uint256, Address>;

    Uint256 toUint256(std::uint64_t value);

    /**
     * Parses an unsigned decimal string into a 256-bit word.
     *
     * @return std::nullopt for an empty string, a non-digit character or a value above 2^256 - 1.
     */
    std::optional<Uint256> parseUint256(std::string_view decimal);

    template<class T>
    Bytes encodeAsArg(const T & val);

    template<>
    Bytes encodeAsArg<Address>(const Address & address);

    template<>
    Bytes encodeAsArg<std::uint64_t>(const std::uint64_t & value);

    template<>
    Bytes encodeAsArg<Uint256>(const Uint256 & value);

    // length word followed by the zero padded content
    template<>
    Bytes encodeAsArg<std::string>(const std::string & str);

    std::string typeName(const Value & value);

    /**
     * Canonical parameter list of `args`, e.g. "(string,uint256)".
     */
    std::string signatureOf(const std::vector<Value> & args);

    /**
     * Encodes a tuple of arguments the way a Solidity constructor or function expects them:
     * static values in the head, dynamic values as offsets into the tail.
     */
    Bytes encodeArguments(const std::vector<Value> & args);
}
