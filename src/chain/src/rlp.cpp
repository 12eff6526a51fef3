#include "rlp.hpp"

#include <algorithm>

namespace tkd::chain::rlp
{
    namespace
    {
        Bytes _trimLeadingZeros(const std::uint8_t* bytes, const std::size_t size)
        {
            std::size_t first = 0;
            while(first < size && bytes[first] == 0)
            {
                ++first;
            }

            if(first == size)
            {
                return {};
            }

            return Bytes(bytes + first, bytes + size);
        }

        Bytes _encodeHeader(const std::uint8_t short_offset, const std::uint8_t long_offset, const std::size_t payload_size)
        {
            if(payload_size <= 55)
            {
                return Bytes{static_cast<std::uint8_t>(short_offset + payload_size)};
            }

            const Bytes len_be = minimalBigEndian(static_cast<std::uint64_t>(payload_size));
            Bytes out;
            out.reserve(1 + len_be.size());
            out.push_back(static_cast<std::uint8_t>(long_offset + len_be.size()));
            out.insert(out.end(), len_be.begin(), len_be.end());
            return out;
        }
    }

    Bytes minimalBigEndian(std::uint64_t value)
    {
        if(value == 0)
        {
            return {};
        }

        Bytes out;
        while(value > 0)
        {
            out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
            value >>= 8;
        }

        std::ranges::reverse(out);
        return out;
    }

    Bytes encodeBytes(const std::uint8_t* bytes, const std::size_t size)
    {
        if(size == 1 && bytes[0] < 0x80)
        {
            return Bytes{bytes[0]};
        }

        Bytes out = _encodeHeader(0x80, 0xB7, size);
        out.reserve(out.size() + size);
        out.insert(out.end(), bytes, bytes + size);
        return out;
    }

    Bytes encodeBytes(const Bytes & bytes)
    {
        return encodeBytes(bytes.data(), bytes.size());
    }

    Bytes encodeUint64(const std::uint64_t value)
    {
        return encodeBytes(minimalBigEndian(value));
    }

    Bytes encodeBigInteger(const std::uint8_t* bytes, const std::size_t size)
    {
        return encodeBytes(_trimLeadingZeros(bytes, size));
    }

    Bytes encodeList(const std::vector<Bytes> & encoded_items)
    {
        std::size_t payload_size = 0;
        for(const Bytes & item : encoded_items)
        {
            payload_size += item.size();
        }

        Bytes out = _encodeHeader(0xC0, 0xF7, payload_size);
        out.reserve(out.size() + payload_size);
        for(const Bytes & item : encoded_items)
        {
            out.insert(out.end(), item.begin(), item.end());
        }
        return out;
    }
}
