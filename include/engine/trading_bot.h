/**
 * @file trading_bot.h
 * @brief Facade over an ExchangeClient exposing the six bot operations
 *
 * Construction verifies reachability (server time) and key permissions
 * (account info) and throws ConnectivityError on failure. After that every
 * operation returns an OrderResult and never throws for exchange, validation
 * or transport failures.
 */

#pragma once

#include "engine/order_result.h"
#include "exchange/exchange_client.h"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/logger.h>

namespace tradebot {

class TradingBot {
public:
    /**
     * @param client Exchange capability, already configured with credentials
     * @param logger Sink for request/response logging
     * @throws ConnectivityError if the exchange is unreachable or the key lacks permission
     */
    TradingBot(std::unique_ptr<ExchangeClient> client, std::shared_ptr<spdlog::logger> logger);

    TradingBot(const TradingBot&) = delete;
    TradingBot& operator=(const TradingBot&) = delete;

    OrderResult place_market_order(const std::string& symbol, OrderSide side, double quantity);

    /// Time-in-force is always GTC.
    OrderResult place_limit_order(const std::string& symbol, OrderSide side,
                                  double quantity, double price);

    /// Sent as a futures STOP order: limit_price becomes price, stop_price the trigger. GTC.
    OrderResult place_stop_limit_order(const std::string& symbol, OrderSide side,
                                       double quantity, double stop_price, double limit_price);

    OrderResult get_order_status(const std::string& symbol, int64_t order_id);
    OrderResult cancel_order(const std::string& symbol, int64_t order_id);
    OrderResult get_account_balance();

private:
    void verify_connection();

    // Runs call(), logging the response on success. ExchangeError,
    // ValidationError and TransportError become a failed OrderResult.
    template <typename Call>
    OrderResult guarded(std::string_view action, std::string_view done, Call&& call);

    std::unique_ptr<ExchangeClient> client_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tradebot
