#include "transaction.hpp"

#include "crypto.hpp"
#include "rlp.hpp"

namespace tkd::chain
{
    namespace
    {
        std::vector<Bytes> _commonFields(const UnsignedTransaction & tx)
        {
            const Bytes empty_to{};

            return {
                rlp::encodeUint64(tx.nonce),
                rlp::encodeUint64(tx.gas_price),
                rlp::encodeUint64(tx.gas_limit),
                rlp::encodeBytes(empty_to),
                rlp::encodeUint64(tx.value),
                rlp::encodeBytes(tx.data)
            };
        }
    }

    Bytes encodeForSigning(const UnsignedTransaction & tx)
    {
        std::vector<Bytes> fields = _commonFields(tx);
        fields.push_back(rlp::encodeUint64(tx.chain_id));
        fields.push_back(rlp::encodeUint64(0));
        fields.push_back(rlp::encodeUint64(0));
        return rlp::encodeList(fields);
    }

    Hash signingHash(const UnsignedTransaction & tx)
    {
        return crypto::keccak256(encodeForSigning(tx));
    }

    Bytes encodeSigned(const UnsignedTransaction & tx, const std::uint64_t v, const Hash & r, const Hash & s)
    {
        std::vector<Bytes> fields = _commonFields(tx);
        fields.push_back(rlp::encodeUint64(v));
        fields.push_back(rlp::encodeBigInteger(r.bytes, sizeof(r.bytes)));
        fields.push_back(rlp::encodeBigInteger(s.bytes, sizeof(s.bytes)));
        return rlp::encodeList(fields);
    }

    Bytes deploymentData(const artifact::ContractArtifact & artifact, const std::vector<abi::Value> & constructor_args)
    {
        Bytes data = artifact.bytecode;
        const Bytes encoded_args = abi::encodeArguments(constructor_args);
        data.insert(data.end(), encoded_args.begin(), encoded_args.end());
        return data;
    }

    UnsignedTransaction buildDeployTransaction(
        const artifact::ContractArtifact & artifact,
        const Address & from,
        const std::vector<abi::Value> & constructor_args,
        const std::uint64_t nonce,
        const std::uint64_t gas_limit,
        const std::uint64_t gas_price,
        const std::uint64_t chain_id)
    {
        UnsignedTransaction tx;
        tx.from = from;
        tx.nonce = nonce;
        tx.gas_limit = gas_limit;
        tx.gas_price = gas_price;
        tx.chain_id = chain_id;
        tx.value = 0;
        tx.data = deploymentData(artifact, constructor_args);
        return tx;
    }
}
