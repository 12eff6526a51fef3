#include "result.hpp"

namespace tkd::deployer
{
    bool isSuccess(const DeploymentResult & result)
    {
        return std::holds_alternative<Success>(result);
    }

    nlohmann::json toJson(const DeploymentResult & result)
    {
        if(const auto * success = std::get_if<Success>(&result))
        {
            return nlohmann::json{
                {"contractAddress", chain::toChecksumAddress(success->contract_address)}
            };
        }

        const auto & failure = std::get<Failure>(result);
        return nlohmann::json{
            {"error", failure.reason.empty() ? std::string("Deployment failed") : failure.reason}
        };
    }
}
