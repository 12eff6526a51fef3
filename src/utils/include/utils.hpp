#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tkd::utils
{
    using Bytes = std::vector<std::uint8_t>;

    std::string_view stripHexPrefix(std::string_view value);

    /**
     * Decodes a hex string, with or without the 0x prefix.
     *
     * @return std::nullopt for an empty, odd-length or non-hex input.
     */
    std::optional<Bytes> hexToBytes(std::string_view value);

    std::string bytesToHex(const std::uint8_t* bytes, std::size_t size, bool with_prefix = true);
    std::string bytesToHex(const Bytes & bytes, bool with_prefix = true);

    /**
     * Parses a JSON-RPC QUANTITY ("0x1a") into a 64-bit value.
     */
    std::optional<std::uint64_t> parseQuantity(std::string_view value);
    std::string toQuantity(std::uint64_t value);

    std::optional<std::uint64_t> parseDecimal(std::string_view value);

    /**
     * Formats an integer amount of smallest units with the given number of decimals,
     * e.g. formatUnits(1500000000, 9) == "1.5".
     */
    std::string formatUnits(std::uint64_t amount, unsigned decimals);

    std::string trim(std::string_view value);

    std::string currentTimestamp();
}
