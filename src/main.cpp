#include "token_deployer.hpp"

static void _configureLogger(const std::filesystem::path& logs_path)
{
    std::error_code ec;
    std::filesystem::create_directories(logs_path, ec);

    // Create sinks
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    console_sink->set_pattern("[%T] [%^%l%$] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};

    if(!ec)
    {
        const std::string log_name = tkd::utils::currentTimestamp() + "-TokenDeployer.log";
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            (logs_path / log_name).string(), true);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);

    if(ec)
    {
        spdlog::warn("Cannot create logs directory {}: {}", logs_path.string(), ec.message());
    }
}

static std::string _helpMessage()
{
    return
        "Usage: tkd-deployer --name <token name> --symbol <token symbol>\n"
        "\n"
        "Options:\n"
        "  -h, --help        Display help message and exit\n"
        "  --version         Display version and exit\n"
        "  --name <value>    Token name passed to the contract constructor\n"
        "  --symbol <value>  Token symbol passed to the contract constructor\n"
        "\n"
        "Environment:\n"
        "  RPC_URL, PRIVATE_KEY, CONTRACT_ARTIFACT_PATH, FEE_RECIPIENT_ADDRESS,\n"
        "  MIGRATION_THRESHOLD_WEI, RECEIPT_TIMEOUT_SECONDS, RECEIPT_POLL_INTERVAL_MS,\n"
        "  FALLBACK_GAS_PRICE_WEI, RPC_REQUEST_TIMEOUT_SECONDS, TKD_LOGS_PATH\n";
}

int main(int argc, char* argv[])
{
    tkd::config::Config base_cfg;
    base_cfg.bin_path = std::filesystem::path(argv[0]).parent_path();
    base_cfg.logs_path = base_cfg.bin_path.parent_path() / "logs";

    if(const auto logs_path = tkd::config::systemEnvironment("TKD_LOGS_PATH"))
    {
        base_cfg.logs_path = *logs_path;
    }

    const bool terminal_configured = tkd::native::configureTerminal();
    _configureLogger(base_cfg.logs_path);

    if(!terminal_configured)
    {
        spdlog::warn("Terminal configuration was not fully applied");
    }

    std::string token_name;
    std::string token_symbol;

    for(int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if(arg == "-h" || arg == "--help")
        {
            spdlog::info(_helpMessage());
            return 0;
        }
        if(arg == "--version")
        {
            spdlog::info("Version: {}.{}.{}", tkd::MAJOR_VERSION, tkd::MINOR_VERSION, tkd::PATCH_VERSION);
            return 0;
        }
        if((arg == "--name" || arg == "--symbol") && i + 1 < argc)
        {
            (arg == "--name" ? token_name : token_symbol) = argv[++i];
            continue;
        }

        spdlog::error("Unknown or incomplete argument: {}", arg);
        spdlog::info(_helpMessage());
        return 2;
    }

    spdlog::debug("Version: {}.{}.{}", tkd::MAJOR_VERSION, tkd::MINOR_VERSION, tkd::PATCH_VERSION);

    if(token_name.empty() || token_symbol.empty())
    {
        spdlog::error("Missing token name or symbol");
        std::printf("%s\n", nlohmann::json{{"error", "Missing token name or symbol"}}.dump().c_str());
        return 2;
    }

    const auto cfg_res = tkd::config::loadFromEnvironment(base_cfg);
    if(!cfg_res)
    {
        spdlog::error("Backend configuration error: {} ({})", cfg_res.error().message, cfg_res.error().kind);
        std::printf("%s\n", nlohmann::json{{"error", "Backend configuration error: " + cfg_res.error().message}}.dump().c_str());
        return 2;
    }
    const tkd::config::Config & cfg = *cfg_res;

    std::unique_ptr<tkd::rpc::JsonRpcChainClient> client;
    if(!cfg.rpc_url.empty())
    {
        client = std::make_unique<tkd::rpc::JsonRpcChainClient>(tkd::rpc::ClientConfig{
            .rpc_url = cfg.rpc_url,
            .request_timeout_s = cfg.rpc_request_timeout_s,
            .receipt_poll_interval_ms = cfg.receipt_poll_interval_ms
        });

        if(client->isConnected())
        {
            spdlog::info("Successfully connected to network: {}", cfg.rpc_url);
        }
        else
        {
            spdlog::warn("Could not connect to RPC URL: {}", cfg.rpc_url);
        }
    }

    tkd::deployer::DeploymentSettings settings;
    settings.private_key_hex = cfg.private_key_hex;
    settings.artifact_path = cfg.artifact_path;
    settings.fallback_gas_price_wei = cfg.fallback_gas_price_wei;
    settings.receipt_timeout = std::chrono::seconds(cfg.receipt_timeout_s);

    const tkd::deployer::DeploymentRequest request{
        .name = token_name,
        .symbol = token_symbol,
        .fee_recipient = cfg.fee_recipient,
        .migration_threshold_wei = cfg.migration_threshold_wei
    };

    spdlog::info("Deploying token: {} ({})", request.name, request.symbol);

    const tkd::deployer::DeploymentResult result = tkd::deployer::deployToken(client.get(), settings, request);

    std::printf("%s\n", tkd::deployer::toJson(result).dump().c_str());

    spdlog::debug("Program finished");
    return tkd::deployer::isSuccess(result) ? 0 : 1;
}
