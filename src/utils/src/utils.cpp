#include "utils.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <ctime>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>

namespace tkd::utils
{
    namespace
    {
        int _hexValue(const char c)
        {
            if(c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if(c >= 'a' && c <= 'f')
            {
                return 10 + (c - 'a');
            }
            if(c >= 'A' && c <= 'F')
            {
                return 10 + (c - 'A');
            }
            return -1;
        }
    }

    std::string_view stripHexPrefix(std::string_view value)
    {
        if(value.starts_with("0x") || value.starts_with("0X"))
        {
            value.remove_prefix(2);
        }
        return value;
    }

    std::optional<Bytes> hexToBytes(std::string_view value)
    {
        const std::string_view hex = stripHexPrefix(value);
        if(hex.empty() || (hex.size() % 2) != 0)
        {
            return std::nullopt;
        }

        Bytes out;
        out.reserve(hex.size() / 2);

        for(std::size_t i = 0; i < hex.size(); i += 2)
        {
            const int hi = _hexValue(hex[i]);
            const int lo = _hexValue(hex[i + 1]);
            if(hi < 0 || lo < 0)
            {
                return std::nullopt;
            }

            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }

        return out;
    }

    std::string bytesToHex(const std::uint8_t* bytes, const std::size_t size, const bool with_prefix)
    {
        static constexpr char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(size * 2 + (with_prefix ? 2 : 0));
        if(with_prefix)
        {
            out += "0x";
        }

        for(std::size_t i = 0; i < size; ++i)
        {
            const std::uint8_t b = bytes[i];
            out.push_back(HEX[(b >> 4) & 0x0F]);
            out.push_back(HEX[b & 0x0F]);
        }

        return out;
    }

    std::string bytesToHex(const Bytes & bytes, const bool with_prefix)
    {
        return bytesToHex(bytes.data(), bytes.size(), with_prefix);
    }

    std::optional<std::uint64_t> parseQuantity(std::string_view value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        const std::string_view stripped = stripHexPrefix(value);
        if(stripped.empty())
        {
            return 0;
        }

        if(stripped.size() > 16)
        {
            return std::nullopt;
        }

        std::uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(stripped.data(), stripped.data() + stripped.size(), out, 16);
        if(ec != std::errc{} || ptr != stripped.data() + stripped.size())
        {
            return std::nullopt;
        }
        return out;
    }

    std::string toQuantity(const std::uint64_t value)
    {
        return fmt::format("0x{:x}", value);
    }

    std::optional<std::uint64_t> parseDecimal(std::string_view value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        std::uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out, 10);
        if(ec != std::errc{} || ptr != value.data() + value.size())
        {
            return std::nullopt;
        }
        return out;
    }

    std::string formatUnits(const std::uint64_t amount, const unsigned decimals)
    {
        std::string digits = std::to_string(amount);
        if(decimals == 0)
        {
            return digits;
        }

        if(digits.size() <= decimals)
        {
            digits.insert(0, decimals - digits.size() + 1, '0');
        }

        std::string whole = digits.substr(0, digits.size() - decimals);
        std::string fraction = digits.substr(digits.size() - decimals);

        while(!fraction.empty() && fraction.back() == '0')
        {
            fraction.pop_back();
        }

        if(fraction.empty())
        {
            return whole;
        }
        return whole + "." + fraction;
    }

    std::string trim(std::string_view value)
    {
        const auto is_space = [](const unsigned char c) { return std::isspace(c) != 0; };

        while(!value.empty() && is_space(static_cast<unsigned char>(value.front())))
        {
            value.remove_prefix(1);
        }
        while(!value.empty() && is_space(static_cast<unsigned char>(value.back())))
        {
            value.remove_suffix(1);
        }
        return std::string(value);
    }

    std::string currentTimestamp()
    {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        return fmt::format("{:%F-%H_%M_%S}", fmt::localtime(now));
    }
}
