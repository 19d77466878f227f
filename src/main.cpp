/**
 * @file main.cpp
 * @brief Entry point for the interactive futures testnet bot
 *
 * 1. Resolves configuration (YAML file, then environment)
 * 2. Creates the console + file logger
 * 3. Rejects missing or placeholder credentials before any network activity
 * 4. Builds the Binance client and verifies connectivity and key permissions
 * 5. Runs the interactive menu until Exit or end of input
 */

#include "core/errors.h"
#include "engine/cli_config.h"
#include "engine/interactive_shell.h"
#include "engine/trading_bot.h"
#include "exchange/binance_client.h"
#include "utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>

int main() {
    using namespace tradebot;

    BotConfig config;
    try {
        config = cli::load_config();
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    auto logger = cli::initialize_logging(config.log_file);
    if (!logger) {
        std::cerr << "Failed to initialize logging system" << std::endl;
        return 1;
    }

    try {
        cli::validate_config(config);
    } catch (const ConfigurationError& e) {
        cli::print_setup_guidance(std::cout);
        logger->error("{}. Exiting.", e.what());
        spdlog::shutdown();
        return 1;
    }

    logger->info("Configuration: testnet={}, key={}, log={}",
                 config.credentials.use_testnet,
                 utils::mask_secret(config.credentials.api_key),
                 config.log_file);

    int rc = 0;
    try {
        nethttp::HttpClientOptions http_options;
        http_options.timeout_ms = config.http_timeout_ms;
        http_options.connect_timeout_ms = config.http_connect_timeout_ms;

        BinanceClientOptions client_options;
        client_options.recv_window_ms = config.recv_window_ms;
        client_options.base_url = config.base_url;

        auto client = std::make_unique<BinanceClient>(
            config.credentials,
            client_options,
            std::make_shared<nethttp::HttpClient>(http_options),
            logger);

        TradingBot bot(std::move(client), logger);
        InteractiveShell shell(bot, std::cin, std::cout, logger);
        rc = shell.run();
    } catch (const ConnectivityError& e) {
        logger->error("Error during bot initialization: {}", e.what());
        cli::print_connectivity_guidance(std::cout, e.what());
        rc = 1;
    }

    logger->flush();
    spdlog::shutdown();
    return rc;
}
