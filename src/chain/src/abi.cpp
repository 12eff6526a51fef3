#include "abi.hpp"

#include <algorithm>
#include <type_traits>

namespace tkd::chain::abi
{
    namespace
    {
        constexpr std::size_t WORD_SIZE = 32;

        bool _isDynamic(const Value & value)
        {
            return std::holds_alternative<std::string>(value);
        }
    }

    template<>
    Bytes encodeAsArg<Address>(const Address & address)
    {
        Bytes encoded(WORD_SIZE, 0);
        std::copy(address.bytes, address.bytes + 20, encoded.begin() + 12); // right-aligned in the last 20 bytes
        return encoded;
    }

    template<>
    Bytes encodeAsArg<std::uint64_t>(const std::uint64_t & value)
    {
        Bytes encoded(WORD_SIZE, 0);
        for(std::size_t i = 0; i < 8; ++i)
        {
            encoded[WORD_SIZE - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return encoded;
    }

    template<>
    Bytes encodeAsArg<Uint256>(const Uint256 & value)
    {
        return Bytes(value.bytes, value.bytes + sizeof(value.bytes));
    }

    template<>
    Bytes encodeAsArg<std::string>(const std::string & str)
    {
        Bytes encoded = encodeAsArg<std::uint64_t>(static_cast<std::uint64_t>(str.size()));
        encoded.insert(encoded.end(), str.begin(), str.end());

        const std::size_t pad = (WORD_SIZE - (str.size() % WORD_SIZE)) % WORD_SIZE;
        encoded.insert(encoded.end(), pad, 0);
        return encoded;
    }

    std::string typeName(const Value & value)
    {
        return std::visit([]<class T>(const T &) -> std::string
        {
            if constexpr(std::is_same_v<T, std::string>)
            {
                return "string";
            }
            else if constexpr(std::is_same_v<T, Uint256>)
            {
                return "uint256";
            }
            else
            {
                return "address";
            }
        }, value);
    }

    std::string signatureOf(const std::vector<Value> & args)
    {
        std::string out = "(";
        for(std::size_t i = 0; i < args.size(); ++i)
        {
            if(i > 0)
            {
                out += ",";
            }
            out += typeName(args[i]);
        }
        out += ")";
        return out;
    }

    Uint256 toUint256(const std::uint64_t value)
    {
        Uint256 out{};
        for(std::size_t i = 0; i < 8; ++i)
        {
            out.bytes[WORD_SIZE - 1 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return out;
    }

    std::optional<Uint256> parseUint256(std::string_view decimal)
    {
        if(decimal.empty())
        {
            return std::nullopt;
        }

        Uint256 out{};
        for(const char c : decimal)
        {
            if(c < '0' || c > '9')
            {
                return std::nullopt;
            }

            // out = out * 10 + digit
            unsigned carry = static_cast<unsigned>(c - '0');
            for(std::size_t i = WORD_SIZE; i-- > 0;)
            {
                const unsigned acc = static_cast<unsigned>(out.bytes[i]) * 10u + carry;
                out.bytes[i] = static_cast<std::uint8_t>(acc & 0xFFu);
                carry = acc >> 8;
            }

            if(carry != 0)
            {
                return std::nullopt;
            }
        }
        return out;
    }

    Bytes encodeArguments(const std::vector<Value> & args)
    {
        Bytes head;
        Bytes tail;
        head.reserve(args.size() * WORD_SIZE);

        const std::size_t head_size = args.size() * WORD_SIZE;

        for(const Value & arg : args)
        {
            if(_isDynamic(arg))
            {
                const Bytes offset_word = encodeAsArg<std::uint64_t>(static_cast<std::uint64_t>(head_size + tail.size()));
                head.insert(head.end(), offset_word.begin(), offset_word.end());

                const Bytes tail_part = encodeAsArg(std::get<std::string>(arg));
                tail.insert(tail.end(), tail_part.begin(), tail_part.end());
                continue;
            }

            const Bytes word = std::visit([]<class T>(const T & v) -> Bytes
            {
                if constexpr(std::is_same_v<T, std::string>)
                {
                    return {};
                }
                else
                {
                    return encodeAsArg<T>(v);
                }
            }, arg);
            head.insert(head.end(), word.begin(), word.end());
        }

        head.insert(head.end(), tail.begin(), tail.end());
        return head;
    }
}
