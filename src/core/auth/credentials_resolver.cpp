/**
 * @file credentials_resolver.cpp
 */

#include "core/auth/credentials_resolver.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <array>
#include <cstdlib>

namespace tradebot::auth {

namespace {
inline std::string getenv_string(const std::string& key) {
    if (const char* v = std::getenv(key.c_str())) return std::string(v);
    return {};
}

constexpr std::array<std::string_view, 5> kPlaceholders = {
    "your_new_api_key_here",
    "your_new_api_secret_here",
    "your_api_key",
    "your_secret_key",
    "your_api_secret",
};
} // namespace

bool parse_bool_env(const char* key, bool def_value) {
    const char* v = std::getenv(key);
    if (!v) return def_value;
    return utils::parse_bool(v).value_or(def_value);
}

Credentials resolve_credentials(const std::string& exchange, Credentials base) {
    Credentials out = std::move(base);
    const std::string prefix = "TRADEBOT_" + utils::to_upper_ascii(exchange);

    const std::string key_testnet = prefix + "_USE_TESTNET";
    out.use_testnet = parse_bool_env(key_testnet.c_str(), out.use_testnet);

    if (auto v = getenv_string(prefix + "_API_KEY"); !v.empty()) {
        out.api_key = std::move(v);
    }
    if (auto v = getenv_string(prefix + "_API_SECRET"); !v.empty()) {
        out.api_secret = std::move(v);
    }
    return out;
}

bool is_placeholder(std::string_view value) {
    const std::string lower = utils::to_lower_ascii(value);
    for (auto p : kPlaceholders) {
        if (lower.find(p) != std::string::npos) return true;
    }
    return false;
}

void validate_credentials(const Credentials& creds) {
    if (creds.api_key.empty() || creds.api_secret.empty()) {
        throw ConfigurationError("API key and secret are not set");
    }
    if (is_placeholder(creds.api_key) || is_placeholder(creds.api_secret)) {
        throw ConfigurationError("API key or secret still holds a placeholder value");
    }
}

} // namespace tradebot::auth
