#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "address.hpp"
#include "transaction.hpp"

namespace tkd::signer
{
    struct KeyError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            INVALID_KEY
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    struct SigningError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            CONTEXT_ERROR,
            INVALID_TRANSACTION,
            SIGNATURE_FAILED
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    /**
     * Secp256k1 account derived from a secret key.
     * The key is wiped when the identity is destroyed or moved from, and is never exposed.
     */
    class SigningIdentity
    {
    public:
        static std::expected<SigningIdentity, KeyError> derive(std::string_view secret_key_hex);

        ~SigningIdentity();

        SigningIdentity(const SigningIdentity&) = delete;
        SigningIdentity& operator=(const SigningIdentity&) = delete;

        SigningIdentity(SigningIdentity && other) noexcept;
        SigningIdentity& operator=(SigningIdentity && other) noexcept;

        const chain::Address & address() const noexcept;

        /**
         * Deterministic (RFC 6979) EIP-155 signature over the canonical encoding of `tx`.
         */
        std::expected<chain::SignedTransaction, SigningError> sign(const chain::UnsignedTransaction & tx) const;

    private:
        SigningIdentity(const std::array<std::uint8_t, 32> & secret_key, const chain::Address & address);

        std::array<std::uint8_t, 32> _secret_key{};
        chain::Address _address{};
    };

    /**
     * Recovers the signer of `signed_tx` and compares it against `expected_signer`.
     */
    bool verifySignedTransaction(const chain::SignedTransaction & signed_tx, const chain::Address & expected_signer);
}

template <>
struct fmt::formatter<tkd::signer::SigningError::Kind> : fmt::formatter<std::string_view>
{
    template<class FormatContext>
    auto format(const tkd::signer::SigningError::Kind & err, FormatContext & ctx) const
    {
        switch(err)
        {
            case tkd::signer::SigningError::Kind::CONTEXT_ERROR:
                return formatter<std::string_view>::format("Context error", ctx);
            case tkd::signer::SigningError::Kind::INVALID_TRANSACTION:
                return formatter<std::string_view>::format("Invalid transaction", ctx);
            case tkd::signer::SigningError::Kind::SIGNATURE_FAILED:
                return formatter<std::string_view>::format("Signature failed", ctx);
            default:
                return formatter<std::string_view>::format("Unknown", ctx);
        }
    }
};
