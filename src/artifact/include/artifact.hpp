#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace tkd::artifact
{
    struct ArtifactError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            NOT_FOUND,
            MALFORMED
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    /**
     * Compiled contract: ABI plus creation bytecode.
     */
    struct ContractArtifact
    {
        nlohmann::json abi;
        std::vector<std::uint8_t> bytecode;

        std::string contract_name;

        /**
         * Ordered input types of the constructor, e.g. {"string", "uint256"}.
         * Empty if the ABI declares no constructor.
         */
        std::vector<std::string> constructorInputTypes() const;
    };

    /**
     * Reads a Hardhat / Truffle style artifact (`"bytecode": "0x..."`) or a Foundry style one
     * (`"bytecode": {"object": "0x..."}`). Never throws.
     */
    std::expected<ContractArtifact, ArtifactError> loadArtifact(const std::filesystem::path & path);

    std::expected<ContractArtifact, ArtifactError> parseArtifact(std::string_view content);
}

template <>
struct fmt::formatter<tkd::artifact::ArtifactError::Kind> : fmt::formatter<std::string_view>
{
    template<class FormatContext>
    auto format(const tkd::artifact::ArtifactError::Kind & err, FormatContext & ctx) const
    {
        switch(err)
        {
            case tkd::artifact::ArtifactError::Kind::NOT_FOUND:
                return formatter<std::string_view>::format("Artifact not found", ctx);
            case tkd::artifact::ArtifactError::Kind::MALFORMED:
                return formatter<std::string_view>::format("Malformed artifact", ctx);
            default:
                return formatter<std::string_view>::format("Unknown", ctx);
        }
    }
};
