/**
 * @file auth_provider.h
 * @brief Auth provider interface and Binance HMAC-SHA256 implementation.
 */

#pragma once

#include "core/net/http_client.h"
#include <cstdint>
#include <string>
#include <vector>

namespace tradebot::auth {

class IAuthProvider {
public:
    virtual ~IAuthProvider() = default;
    // Append the venue's authentication parameters to a url-encoded query.
    virtual std::string sign_query(const std::string& query,
                                   const std::string& api_secret,
                                   uint64_t timestamp_ms,
                                   long recv_window_ms) const = 0;
    // Headers that identify the API key on every request.
    virtual std::vector<nethttp::Header> build_headers(const std::string& api_key) const = 0;
};

class BinanceAuthProvider final : public IAuthProvider {
public:
    std::string sign_query(const std::string& query,
                           const std::string& api_secret,
                           uint64_t timestamp_ms,
                           long recv_window_ms) const override;
    std::vector<nethttp::Header> build_headers(const std::string& api_key) const override;
};

// Lowercase hex HMAC-SHA256 of data keyed by key.
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

} // namespace tradebot::auth
