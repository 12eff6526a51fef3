#include "signer.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <utility>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include "crypto.hpp"
#include "utils.hpp"

namespace tkd::signer
{
    namespace
    {
        struct ContextDeleter
        {
            void operator()(secp256k1_context* ctx) const noexcept
            {
                secp256k1_context_destroy(ctx);
            }
        };

        using Context = std::unique_ptr<secp256k1_context, ContextDeleter>;

        Context _createContext()
        {
            return Context(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY));
        }

        void _secureZero(std::uint8_t* data, const std::size_t size) noexcept
        {
            volatile std::uint8_t* p = data;
            for(std::size_t i = 0; i < size; ++i)
            {
                p[i] = 0;
            }
        }

        template<std::size_t N>
        void _secureZero(std::array<std::uint8_t, N> & data) noexcept
        {
            _secureZero(data.data(), data.size());
        }

        std::optional<chain::Address> _addressFromPubkey(const secp256k1_context* ctx, const secp256k1_pubkey & pubkey)
        {
            std::array<std::uint8_t, 65> serialized_pubkey{};
            std::size_t pubkey_size = serialized_pubkey.size();
            if(secp256k1_ec_pubkey_serialize(
                ctx,
                serialized_pubkey.data(),
                &pubkey_size,
                &pubkey,
                SECP256K1_EC_UNCOMPRESSED) != 1)
            {
                return std::nullopt;
            }

            const auto hash = crypto::keccak256(serialized_pubkey.data() + 1, pubkey_size - 1);
            chain::Address out{};
            std::memcpy(out.bytes, hash.bytes + 12, sizeof(out.bytes));
            return out;
        }
    }

    std::expected<SigningIdentity, KeyError> SigningIdentity::derive(std::string_view secret_key_hex)
    {
        auto bytes_res = utils::hexToBytes(secret_key_hex);
        if(!bytes_res || bytes_res->size() != 32)
        {
            if(bytes_res)
            {
                _secureZero(bytes_res->data(), bytes_res->size());
            }
            return std::unexpected(KeyError{
                .kind = KeyError::Kind::INVALID_KEY,
                .message = "Secret key must be a 32-byte hex value"
            });
        }

        std::array<std::uint8_t, 32> secret_key{};
        std::copy(bytes_res->begin(), bytes_res->end(), secret_key.begin());
        _secureZero(bytes_res->data(), bytes_res->size());

        const Context ctx = _createContext();
        if(ctx == nullptr)
        {
            _secureZero(secret_key);
            return std::unexpected(KeyError{
                .kind = KeyError::Kind::UNKNOWN,
                .message = "Failed to create secp256k1 context"
            });
        }

        secp256k1_pubkey pubkey{};
        if(secp256k1_ec_seckey_verify(ctx.get(), secret_key.data()) != 1 ||
            secp256k1_ec_pubkey_create(ctx.get(), &pubkey, secret_key.data()) != 1)
        {
            _secureZero(secret_key);
            return std::unexpected(KeyError{
                .kind = KeyError::Kind::INVALID_KEY,
                .message = "Secret key is not a valid secp256k1 scalar"
            });
        }

        const auto address_res = _addressFromPubkey(ctx.get(), pubkey);
        if(!address_res)
        {
            _secureZero(secret_key);
            return std::unexpected(KeyError{
                .kind = KeyError::Kind::INVALID_KEY,
                .message = "Failed to serialize public key"
            });
        }

        SigningIdentity identity(secret_key, *address_res);
        _secureZero(secret_key);
        return identity;
    }

    SigningIdentity::SigningIdentity(const std::array<std::uint8_t, 32> & secret_key, const chain::Address & address)
        : _secret_key(secret_key), _address(address)
    {
    }

    SigningIdentity::~SigningIdentity()
    {
        _secureZero(_secret_key);
    }

    SigningIdentity::SigningIdentity(SigningIdentity && other) noexcept
        : _secret_key(other._secret_key), _address(other._address)
    {
        _secureZero(other._secret_key);
        other._address = chain::Address{};
    }

    SigningIdentity& SigningIdentity::operator=(SigningIdentity && other) noexcept
    {
        if(this != &other)
        {
            _secret_key = other._secret_key;
            _address = other._address;
            _secureZero(other._secret_key);
            other._address = chain::Address{};
        }
        return *this;
    }

    const chain::Address & SigningIdentity::address() const noexcept
    {
        return _address;
    }

    std::expected<chain::SignedTransaction, SigningError> SigningIdentity::sign(const chain::UnsignedTransaction & tx) const
    {
        if(tx.from != _address)
        {
            return std::unexpected(SigningError{
                .kind = SigningError::Kind::INVALID_TRANSACTION,
                .message = fmt::format("Transaction sender {} does not match the signing account", chain::addressToHex(tx.from))
            });
        }

        if(tx.chain_id == 0 || tx.chain_id > (std::numeric_limits<std::uint64_t>::max() - 36) / 2)
        {
            return std::unexpected(SigningError{
                .kind = SigningError::Kind::INVALID_TRANSACTION,
                .message = fmt::format("Unsupported chain id {}", tx.chain_id)
            });
        }

        if(tx.gas_limit == 0 || tx.data.empty())
        {
            return std::unexpected(SigningError{
                .kind = SigningError::Kind::INVALID_TRANSACTION,
                .message = "Transaction has no gas limit or no payload"
            });
        }

        const chain::Hash sig_hash = chain::signingHash(tx);

        const Context ctx = _createContext();
        if(ctx == nullptr)
        {
            return std::unexpected(SigningError{
                .kind = SigningError::Kind::CONTEXT_ERROR,
                .message = "Failed to create secp256k1 context"
            });
        }

        secp256k1_ecdsa_recoverable_signature signature{};
        if(secp256k1_ecdsa_sign_recoverable(
            ctx.get(),
            &signature,
            sig_hash.bytes,
            _secret_key.data(),
            nullptr,
            nullptr) != 1)
        {
            return std::unexpected(SigningError{
                .kind = SigningError::Kind::SIGNATURE_FAILED,
                .message = "Failed to sign transaction"
            });
        }

        std::array<std::uint8_t, 64> compact_signature{};
        int recid = 0;
        secp256k1_ecdsa_recoverable_signature_serialize_compact(
            ctx.get(), compact_signature.data(), &recid, &signature);

        chain::SignedTransaction out;
        out.transaction = tx;
        out.v = static_cast<std::uint64_t>(recid) + tx.chain_id * 2 + 35;
        std::memcpy(out.r.bytes, compact_signature.data(), 32);
        std::memcpy(out.s.bytes, compact_signature.data() + 32, 32);
        out.raw_bytes = chain::encodeSigned(tx, out.v, out.r, out.s);
        out.hash = crypto::keccak256(out.raw_bytes);
        return out;
    }

    bool verifySignedTransaction(const chain::SignedTransaction & signed_tx, const chain::Address & expected_signer)
    {
        const chain::UnsignedTransaction & tx = signed_tx.transaction;
        if(signed_tx.v < tx.chain_id * 2 + 35)
        {
            return false;
        }

        const std::uint64_t recid = signed_tx.v - (tx.chain_id * 2 + 35);
        if(recid > 1)
        {
            return false;
        }

        if(chain::encodeSigned(tx, signed_tx.v, signed_tx.r, signed_tx.s) != signed_tx.raw_bytes)
        {
            return false;
        }

        const Context ctx = _createContext();
        if(ctx == nullptr)
        {
            return false;
        }

        std::array<std::uint8_t, 64> compact_signature{};
        std::memcpy(compact_signature.data(), signed_tx.r.bytes, 32);
        std::memcpy(compact_signature.data() + 32, signed_tx.s.bytes, 32);

        secp256k1_ecdsa_recoverable_signature signature{};
        if(secp256k1_ecdsa_recoverable_signature_parse_compact(
            ctx.get(), &signature, compact_signature.data(), static_cast<int>(recid)) != 1)
        {
            return false;
        }

        const chain::Hash sig_hash = chain::signingHash(tx);

        secp256k1_pubkey pubkey{};
        if(secp256k1_ecdsa_recover(ctx.get(), &pubkey, &signature, sig_hash.bytes) != 1)
        {
            return false;
        }

        const auto recovered = _addressFromPubkey(ctx.get(), pubkey);
        return recovered && *recovered == expected_signer;
    }
}
