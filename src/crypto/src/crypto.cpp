#include "crypto.hpp"

#include <cstring>

#include <ethash/keccak.hpp>

namespace tkd::crypto
{
    evmc::bytes32 keccak256(const std::uint8_t* data, const std::size_t size)
    {
        const ethash::hash256 hash = ethash::keccak256(data, size);

        evmc::bytes32 out{};
        std::memcpy(out.bytes, hash.bytes, sizeof(out.bytes));
        return out;
    }

    evmc::bytes32 keccak256(const std::vector<std::uint8_t> & data)
    {
        return keccak256(data.data(), data.size());
    }

    evmc::bytes32 keccak256(std::string_view text)
    {
        return keccak256(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }
}
