#include "artifact.hpp"

#include <spdlog/spdlog.h>

#include "file.hpp"
#include "utils.hpp"

namespace tkd::artifact
{
    using json = nlohmann::json;

    namespace
    {
        std::unexpected<ArtifactError> _malformed(std::string message)
        {
            return std::unexpected(ArtifactError{
                .kind = ArtifactError::Kind::MALFORMED,
                .message = std::move(message)
            });
        }

        std::string _stringField(const json & object, const char* key)
        {
            if(!object.is_object() || !object.contains(key) || !object[key].is_string())
            {
                return {};
            }
            return object[key].get<std::string>();
        }

        const json * _findBytecodeField(const json & document)
        {
            if(!document.contains("bytecode"))
            {
                return nullptr;
            }

            const json & bytecode = document["bytecode"];
            if(bytecode.is_string())
            {
                return &bytecode;
            }

            if(bytecode.is_object() && bytecode.contains("object") && bytecode["object"].is_string())
            {
                return &bytecode["object"];
            }

            return nullptr;
        }
    }

    std::vector<std::string> ContractArtifact::constructorInputTypes() const
    {
        std::vector<std::string> types;
        if(!abi.is_array())
        {
            return types;
        }

        for(const json & entry : abi)
        {
            if(_stringField(entry, "type") != "constructor")
            {
                continue;
            }

            if(!entry.contains("inputs") || !entry["inputs"].is_array())
            {
                break;
            }

            for(const json & input : entry["inputs"])
            {
                types.push_back(_stringField(input, "type"));
            }
            break;
        }
        return types;
    }

    std::expected<ContractArtifact, ArtifactError> parseArtifact(std::string_view content)
    {
        const json document = json::parse(content, nullptr, false);
        if(document.is_discarded() || !document.is_object())
        {
            return _malformed("Artifact is not a valid JSON object");
        }

        if(!document.contains("abi") || !document["abi"].is_array())
        {
            return _malformed("Artifact is missing the abi array");
        }

        if(document["abi"].empty())
        {
            return _malformed("Artifact abi is empty");
        }

        const json * bytecode_field = _findBytecodeField(document);
        if(bytecode_field == nullptr)
        {
            return _malformed("Artifact is missing the bytecode field");
        }

        const std::string bytecode_hex = bytecode_field->get<std::string>();
        if(utils::stripHexPrefix(bytecode_hex).empty())
        {
            return _malformed("Artifact bytecode is empty");
        }

        auto bytecode_res = utils::hexToBytes(bytecode_hex);
        if(!bytecode_res)
        {
            // unlinked library placeholders (__$...$__) also end up here
            return _malformed("Artifact bytecode is not a valid hex string");
        }

        ContractArtifact artifact;
        artifact.abi = document["abi"];
        artifact.bytecode = std::move(*bytecode_res);
        artifact.contract_name = _stringField(document, "contractName");
        return artifact;
    }

    std::expected<ContractArtifact, ArtifactError> loadArtifact(const std::filesystem::path & path)
    {
        if(!file::isReadableFile(path))
        {
            return std::unexpected(ArtifactError{
                .kind = ArtifactError::Kind::NOT_FOUND,
                .message = fmt::format("Contract artifact file not found at {}", path.string())
            });
        }

        const auto content = file::loadTextFile(path);
        if(!content)
        {
            return std::unexpected(ArtifactError{
                .kind = ArtifactError::Kind::NOT_FOUND,
                .message = fmt::format("Contract artifact file at {} could not be read", path.string())
            });
        }

        auto artifact_res = parseArtifact(*content);
        if(!artifact_res)
        {
            spdlog::error("Failed to parse artifact {}: {}", path.string(), artifact_res.error().message);
            artifact_res.error().message = fmt::format("{} ({})", artifact_res.error().message, path.string());
            return artifact_res;
        }

        spdlog::debug("Loaded artifact {} ({} bytes of bytecode)", path.string(), artifact_res->bytecode.size());
        return artifact_res;
    }
}
