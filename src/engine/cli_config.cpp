#include "engine/cli_config.h"
#include "core/errors.h"
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <vector>

namespace tradebot {
namespace cli {

namespace {

template <typename T>
void read_optional(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

} // namespace

BotConfig load_config_file(const std::string& path, BotConfig base) {
    BotConfig config = std::move(base);
    try {
        YAML::Node root = YAML::LoadFile(path);
        if (!root.IsMap()) {
            throw ConfigurationError("Config file " + path + " must contain a mapping");
        }
        read_optional(root, "api_key", config.credentials.api_key);
        read_optional(root, "api_secret", config.credentials.api_secret);
        read_optional(root, "testnet", config.credentials.use_testnet);
        read_optional(root, "log_file", config.log_file);
        read_optional(root, "base_url", config.base_url);
        read_optional(root, "recv_window_ms", config.recv_window_ms);
        read_optional(root, "http_timeout_ms", config.http_timeout_ms);
        read_optional(root, "http_connect_timeout_ms", config.http_connect_timeout_ms);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load config file " + path + ": " + e.what());
    }
    return config;
}

BotConfig load_config(const std::string& default_file) {
    BotConfig config;

    std::string path;
    if (const char* v = std::getenv("TRADEBOT_CONFIG"); v && *v) {
        path = v;
    } else {
        std::error_code ec;
        const bool present = std::filesystem::exists(default_file, ec);
        if (ec) {
            throw ConfigurationError("Cannot access config file " + default_file + ": " + ec.message());
        }
        if (present) path = default_file;
    }
    if (!path.empty()) {
        config = load_config_file(path, std::move(config));
    }

    // Environment wins over the file.
    config.credentials = auth::resolve_credentials(kExchange, std::move(config.credentials));
    if (const char* v = std::getenv("TRADEBOT_LOG_FILE"); v && *v) {
        config.log_file = v;
    }
    return config;
}

void validate_config(const BotConfig& config) {
    auth::validate_credentials(config.credentials);
    if (config.log_file.empty()) {
        throw ConfigurationError("log_file must not be empty");
    }
    if (config.recv_window_ms <= 0 || config.recv_window_ms > 60000) {
        throw ConfigurationError("recv_window_ms must be in (0, 60000], got " + std::to_string(config.recv_window_ms));
    }
    if (config.http_timeout_ms < 0 || config.http_connect_timeout_ms < 0) {
        throw ConfigurationError("HTTP timeouts must not be negative");
    }
}

void print_setup_guidance(std::ostream& out) {
    const std::string rule(50, '=');
    out << rule << "\n"
        << "ERROR: Binance API credentials are not configured\n"
        << "\nSTEPS TO FIX:\n"
        << "1. Go to: https://testnet.binancefuture.com/\n"
        << "2. Login and go to API Key Management\n"
        << "3. Generate NEW API Key with 'Enable Futures' CHECKED\n"
        << "4. If setting IP restrictions, whitelist your current IP\n"
        << "5. Export TRADEBOT_BINANCE_API_KEY and TRADEBOT_BINANCE_API_SECRET,\n"
        << "   or set api_key/api_secret in " << kDefaultConfigFile << " (or the file named by TRADEBOT_CONFIG)\n"
        << rule << std::endl;
}

void print_connectivity_guidance(std::ostream& out, const std::string& error) {
    const std::string rule(50, '=');
    out << "\n" << rule << "\n"
        << "Failed to initialize bot. Please check:\n"
        << "1. API key has 'Enable Futures' permission\n"
        << "2. Your IP is whitelisted (if you set restrictions)\n"
        << "3. You're using keys from testnet.binancefuture.com\n"
        << rule << "\n\n"
        << "Error: " << error << std::endl;
}

std::shared_ptr<spdlog::logger> initialize_logging(const std::string& log_file) {
    try {
        const std::filesystem::path log_path(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& ex) {
        std::cerr << "Failed to create log directory: " << ex.what() << std::endl;
        return nullptr;
    }

    try {
        // Console on stderr so log lines do not interleave with the menu on stdout
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);

        // Rotating file sink appends to an existing log
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, 1024*1024*5, 3);
        file_sink->set_level(spdlog::level::debug);

        std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("tradebot", sinks.begin(), sinks.end());

        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e - %n - %l - %v");
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::info);

        return logger;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return nullptr;
    }
}

} // namespace cli
} // namespace tradebot
