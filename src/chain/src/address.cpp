#include "address.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "crypto.hpp"
#include "rlp.hpp"
#include "utils.hpp"

namespace tkd::chain
{
    namespace
    {
        bool _hasMixedCase(std::string_view hex)
        {
            const bool has_lower = std::ranges::any_of(hex, [](unsigned char c) { return std::islower(c) != 0; });
            const bool has_upper = std::ranges::any_of(hex, [](unsigned char c) { return std::isupper(c) != 0; });
            return has_lower && has_upper;
        }
    }

    std::optional<Address> parseAddress(std::string_view hex)
    {
        const auto bytes_res = utils::hexToBytes(hex);
        if(!bytes_res || bytes_res->size() != sizeof(Address::bytes))
        {
            return std::nullopt;
        }

        Address address{};
        std::memcpy(address.bytes, bytes_res->data(), sizeof(address.bytes));

        const std::string_view digits = utils::stripHexPrefix(hex);
        if(_hasMixedCase(digits))
        {
            const std::string checksummed = toChecksumAddress(address);
            if(std::string_view(checksummed).substr(2) != digits)
            {
                return std::nullopt;
            }
        }

        return address;
    }

    std::optional<Hash> parseHash(std::string_view hex)
    {
        const auto bytes_res = utils::hexToBytes(hex);
        if(!bytes_res || bytes_res->size() != sizeof(Hash::bytes))
        {
            return std::nullopt;
        }

        Hash hash{};
        std::memcpy(hash.bytes, bytes_res->data(), sizeof(hash.bytes));
        return hash;
    }

    std::string addressToHex(const Address & address)
    {
        return utils::bytesToHex(address.bytes, sizeof(address.bytes), true);
    }

    std::string hashToHex(const Hash & hash)
    {
        return utils::bytesToHex(hash.bytes, sizeof(hash.bytes), true);
    }

    std::string toChecksumAddress(const Address & address)
    {
        const std::string lower = utils::bytesToHex(address.bytes, sizeof(address.bytes), false);
        const Hash digest = crypto::keccak256(lower);

        std::string out = "0x";
        out.reserve(2 + lower.size());
        for(std::size_t i = 0; i < lower.size(); ++i)
        {
            const std::uint8_t nibble = (i % 2 == 0)
                ? static_cast<std::uint8_t>(digest.bytes[i / 2] >> 4)
                : static_cast<std::uint8_t>(digest.bytes[i / 2] & 0x0F);

            const char c = lower[i];
            if(std::isalpha(static_cast<unsigned char>(c)) && nibble >= 8)
            {
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    bool isZeroAddress(const Address & address)
    {
        return std::ranges::all_of(address.bytes, [](std::uint8_t b) { return b == 0; });
    }

    Address computeCreateAddress(const Address & sender, const std::uint64_t nonce)
    {
        const utils::Bytes encoded = rlp::encodeList({
            rlp::encodeBytes(sender.bytes, sizeof(sender.bytes)),
            rlp::encodeUint64(nonce)
        });

        const Hash hash = crypto::keccak256(encoded);

        Address out{};
        std::memcpy(out.bytes, hash.bytes + 12, sizeof(out.bytes));
        return out;
    }
}
