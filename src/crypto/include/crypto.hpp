#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace tkd::crypto
{
    evmc::bytes32 keccak256(const std::uint8_t* data, std::size_t size);

    evmc::bytes32 keccak256(const std::vector<std::uint8_t> & data);

    evmc::bytes32 keccak256(std::string_view text);
}
