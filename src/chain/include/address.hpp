#pragma once

#include <optional>
#include <cstdint>
#include <string>
#include <string_view>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace tkd::chain
{
    using Address = evmc::address;
    using Hash = evmc::bytes32;

    /**
     * Parses a 20-byte hex address, with or without the 0x prefix.
     * Mixed-case input must carry a valid EIP-55 checksum.
     */
    std::optional<Address> parseAddress(std::string_view hex);

    std::optional<Hash> parseHash(std::string_view hex);

    std::string addressToHex(const Address & address);

    std::string hashToHex(const Hash & hash);

    /**
     * EIP-55 mixed-case checksum encoding.
     */
    std::string toChecksumAddress(const Address & address);

    bool isZeroAddress(const Address & address);

    /**
     * Address of a contract created by `sender` with the given account nonce,
     * keccak256(rlp([sender, nonce]))[12:].
     */
    Address computeCreateAddress(const Address & sender, std::uint64_t nonce);
}
