/**
 * @file exchange_client.h
 * @brief Abstract base class for exchange client implementations
 *
 * Direct exchange REST interface used by the trading bot facade.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tradebot {

/**
 * @enum OrderSide
 * @brief Side of the order
 */
enum class OrderSide {
    BUY,
    SELL
};

/**
 * @enum OrderType
 * @brief Futures order type as sent to the exchange
 */
enum class OrderType {
    MARKET,     // Immediate execution
    LIMIT,      // Resting limit order
    STOP        // Stop-limit: becomes a limit order at stop_price
};

inline std::string to_string(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline std::string to_string(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MARKET";
        case OrderType::LIMIT: return "LIMIT";
        case OrderType::STOP: return "STOP";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse "buy"/"sell" in any case
 */
std::optional<OrderSide> parse_side(std::string_view raw);

/**
 * @struct OrderRequest
 * @brief Order request consumed once by ExchangeClient::create_order
 */
struct OrderRequest {
    std::string symbol;
    OrderSide side{OrderSide::BUY};
    OrderType type{OrderType::MARKET};
    double quantity{0.0};
    std::optional<double> price;        // LIMIT and STOP
    std::optional<double> stop_price;   // STOP only
    std::optional<std::string> time_in_force;  // GTC for LIMIT and STOP
};

/**
 * @class ExchangeClient
 * @brief Abstract exchange REST capability
 *
 * Every call returns the exchange's JSON response body verbatim. Failures are
 * reported by throwing ExchangeError (structured exchange rejection) or
 * TransportError (network failure, unparseable response).
 */
class ExchangeClient {
public:
    ExchangeClient() = default;
    virtual ~ExchangeClient() = default;

    ExchangeClient(const ExchangeClient&) = delete;
    ExchangeClient& operator=(const ExchangeClient&) = delete;

    virtual std::string get_exchange_name() const = 0;

    /**
     * @brief Base URL requests are sent to
     */
    virtual std::string base_url() const = 0;

    /**
     * @brief Exchange server time, e.g. {"serverTime": 1700000000000}
     */
    virtual std::string get_server_time() = 0;

    /**
     * @brief Account information; requires a key with futures permission
     */
    virtual std::string get_account_info() = 0;

    /**
     * @brief Submit a new order
     * @param request Order parameters
     * @return Exchange order payload
     */
    virtual std::string create_order(const OrderRequest& request) = 0;

    /**
     * @brief Query an order by exchange-assigned id
     */
    virtual std::string get_order(const std::string& symbol, int64_t order_id) = 0;

    /**
     * @brief Cancel an order by exchange-assigned id
     */
    virtual std::string cancel_order(const std::string& symbol, int64_t order_id) = 0;

    /**
     * @brief Per-asset futures balances
     */
    virtual std::string get_account_balance() = 0;
};

} // namespace tradebot
