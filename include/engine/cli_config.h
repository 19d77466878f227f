#pragma once

#include "core/auth/credentials_resolver.h"
#include <iosfwd>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace tradebot {

/**
 * @struct BotConfig
 * @brief Everything the bot needs before the first network call
 */
struct BotConfig {
    auth::Credentials credentials;
    std::string log_file{"trading_bot.log"};
    std::string base_url;             // empty = derived from credentials.use_testnet
    long recv_window_ms{5000};
    long http_timeout_ms{0};          // 0 = libcurl default
    long http_connect_timeout_ms{0};  // 0 = libcurl default
};

namespace cli {

inline constexpr const char* kExchange = "binance";
inline constexpr const char* kDefaultConfigFile = "tradebot.yaml";

/**
 * @brief Overlay values from a YAML config file onto base
 * @throws ConfigurationError if the file cannot be read or parsed
 */
BotConfig load_config_file(const std::string& path, BotConfig base);

/**
 * @brief Resolve configuration: defaults, then YAML file, then environment
 *
 * The file is taken from TRADEBOT_CONFIG, else default_file when present.
 * @throws ConfigurationError on an unreadable or inaccessible file
 */
BotConfig load_config(const std::string& default_file = kDefaultConfigFile);

/**
 * @brief Check credentials are present and not placeholders
 * @throws ConfigurationError
 */
void validate_config(const BotConfig& config);

/**
 * @brief Steps for obtaining and supplying testnet API keys
 */
void print_setup_guidance(std::ostream& out);

/**
 * @brief Checklist printed when the initial connectivity check fails
 */
void print_connectivity_guidance(std::ostream& out, const std::string& error);

/**
 * @brief Create the console + append-only file logger
 * @param log_file Path of the persistent log
 * @return Logger handle, or nullptr if the sinks could not be created
 */
std::shared_ptr<spdlog::logger> initialize_logging(const std::string& log_file);

} // namespace cli
} // namespace tradebot
