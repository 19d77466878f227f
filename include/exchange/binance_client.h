/**
 * @file binance_client.h
 * @brief Binance USDT-M futures REST client
 */

#pragma once

#include "exchange/exchange_client.h"
#include "core/auth/auth_provider.h"
#include "core/auth/credentials_resolver.h"
#include "core/net/http_client.h"
#include <cstdint>
#include <memory>
#include <string>
#include <spdlog/logger.h>

namespace tradebot {

struct BinanceClientOptions {
    long recv_window_ms{5000};
    std::string base_url;   // overrides the testnet/mainnet default when non-empty
};

class BinanceClient final : public ExchangeClient {
public:
    static constexpr const char* kTestnetRestBase = "https://testnet.binancefuture.com";
    static constexpr const char* kMainnetRestBase = "https://fapi.binance.com";

    BinanceClient(auth::Credentials credentials,
                  BinanceClientOptions options,
                  std::shared_ptr<nethttp::HttpClient> http,
                  std::shared_ptr<spdlog::logger> logger);
    ~BinanceClient() override = default;

    std::string get_exchange_name() const override { return "binance"; }
    std::string base_url() const override { return rest_base_; }
    bool is_testnet() const { return credentials_.use_testnet; }

    std::string get_server_time() override;
    std::string get_account_info() override;
    std::string create_order(const OrderRequest& request) override;
    std::string get_order(const std::string& symbol, int64_t order_id) override;
    std::string cancel_order(const std::string& symbol, int64_t order_id) override;
    std::string get_account_balance() override;

    // Url-encoded parameters for POST /fapi/v1/order, without auth fields.
    static std::string build_order_query(const OrderRequest& request);

private:
    void configure_endpoints(bool testnet);
    uint64_t timestamp_ms() const;

    // Sends a REST request. If signed_req, appends timestamp/recvWindow/signature.
    // For POST the query travels as x-www-form-urlencoded body; for GET/DELETE it
    // is appended to the URL. Returns the body of a successful response, throws
    // ExchangeError or TransportError otherwise.
    std::string rest_request(const std::string& method,
                             const std::string& path,
                             const std::string& query,
                             bool signed_req);

    const auth::Credentials credentials_;
    BinanceClientOptions options_;
    std::shared_ptr<nethttp::HttpClient> http_;
    std::shared_ptr<spdlog::logger> logger_;
    std::unique_ptr<auth::IAuthProvider> auth_;
    std::string rest_base_;
};

} // namespace tradebot
