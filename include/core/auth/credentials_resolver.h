/**
 * @file credentials_resolver.h
 * @brief Central resolver for exchange credentials.
 */

#pragma once

#include <string>
#include <string_view>

namespace tradebot::auth {

struct Credentials {
    std::string api_key;
    std::string api_secret;
    bool use_testnet{true};
};

// Parse common truthy/falsey strings from env.
bool parse_bool_env(const char* key, bool def_value);

// Resolve credentials for the given exchange. Environment values
// (TRADEBOT_<EXCHANGE>_API_KEY, _API_SECRET, _USE_TESTNET) override the
// ones already present in base.
Credentials resolve_credentials(const std::string& exchange, Credentials base);

// True when value still holds a template placeholder instead of a real secret.
bool is_placeholder(std::string_view value);

// Throws ConfigurationError if key or secret is empty or a placeholder.
void validate_credentials(const Credentials& creds);

} // namespace tradebot::auth
