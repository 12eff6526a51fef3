#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "utils.hpp"

namespace tkd::chain::rlp
{
    using utils::Bytes;

    Bytes minimalBigEndian(std::uint64_t value);

    Bytes encodeBytes(const std::uint8_t* bytes, std::size_t size);
    Bytes encodeBytes(const Bytes & bytes);

    Bytes encodeUint64(std::uint64_t value);

    // big-endian integer of arbitrary width, leading zeros dropped
    Bytes encodeBigInteger(const std::uint8_t* bytes, std::size_t size);

    // items must already be RLP encoded
    Bytes encodeList(const std::vector<Bytes> & encoded_items);
}
