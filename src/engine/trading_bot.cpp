/**
 * @file trading_bot.cpp
 */

#include "engine/trading_bot.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <rapidjson/document.h>
#include <cmath>

namespace tradebot {

namespace {

constexpr const char* kGoodTilCanceled = "GTC";

// Decimal places BinanceClient sends for quantities and prices.
constexpr int kWirePrecision = 8;

// Symbols travel unescaped inside the signed query.
std::string normalize_symbol(const std::string& symbol) {
    std::string s = utils::to_upper_ascii(utils::trim(symbol));
    if (s.empty()) {
        throw ValidationError("symbol must not be empty");
    }
    for (char c : s) {
        if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
            throw ValidationError("symbol must contain only letters and digits, got '" + s + "'");
        }
    }
    return s;
}

// The value must stay positive and unchanged once formatted for the wire.
void require_positive(const char* field, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ValidationError(std::string(field) + " must be greater than zero, got " + utils::format_decimal(value));
    }
    const std::string wire = utils::format_decimal(value, kWirePrecision);
    if (wire == "0") {
        throw ValidationError(std::string(field) + " rounds to zero at " +
                              std::to_string(kWirePrecision) + " decimal places");
    }
    if (utils::parse_double(wire) != value) {
        throw ValidationError(std::string(field) + " has more than " + std::to_string(kWirePrecision) +
                              " decimal places, would be sent as " + wire);
    }
}

OrderResult make_failure(ErrorKind kind, const char* what) {
    std::string message(what);
    if (message.empty()) message = to_string(kind) + " error";
    return OrderResult::failure(kind, std::move(message));
}

} // namespace

TradingBot::TradingBot(std::unique_ptr<ExchangeClient> client, std::shared_ptr<spdlog::logger> logger)
    : client_(std::move(client)), logger_(std::move(logger)) {
    if (!client_) {
        throw ConnectivityError("no exchange client configured");
    }
    logger_->info("Bot initialized. Exchange: {}, base URL: {}", client_->get_exchange_name(), client_->base_url());
    verify_connection();
}

void TradingBot::verify_connection() {
    try {
        const std::string time_body = client_->get_server_time();
        rapidjson::Document d;
        d.Parse(time_body.c_str());
        if (!d.HasParseError() && d.IsObject() && d.HasMember("serverTime") && d["serverTime"].IsInt64()) {
            logger_->info("Connection verified. Server time: {}", d["serverTime"].GetInt64());
        } else {
            logger_->info("Connection verified. Server time response: {}", time_body);
        }

        try {
            client_->get_account_info();
            logger_->info("API key has correct futures permissions");
        } catch (const ExchangeError& e) {
            if (e.code() == kPermissionDeniedCode) {
                logger_->error("API key doesn't have futures permissions or IP not whitelisted");
                logger_->error("Please create a new API key with 'Enable Futures' checked");
                throw ConnectivityError(std::string("API key doesn't have futures permissions or IP not whitelisted: ") + e.what());
            }
            throw;
        }
    } catch (const ExchangeError& e) {
        logger_->error("Error verifying connection: {}", e.what());
        throw ConnectivityError(std::string("Error verifying connection: ") + e.what());
    } catch (const TransportError& e) {
        logger_->error("Network error verifying connection: {}", e.what());
        throw ConnectivityError(std::string("Network error verifying connection: ") + e.what());
    }
}

template <typename Call>
OrderResult TradingBot::guarded(std::string_view action, std::string_view done, Call&& call) {
    try {
        std::string payload = call();
        logger_->info("Successfully {}. Response: {}", done, payload);
        return OrderResult::success(std::move(payload));
    } catch (const ExchangeError& e) {
        logger_->error("Binance API Error {}: {}", action, e.what());
        return make_failure(ErrorKind::EXCHANGE, e.what());
    } catch (const ValidationError& e) {
        logger_->error("Order validation error {}: {}", action, e.what());
        return make_failure(ErrorKind::VALIDATION, e.what());
    } catch (const TransportError& e) {
        logger_->error("Transport error {}: {}", action, e.what());
        return make_failure(ErrorKind::TRANSPORT, e.what());
    }
}

OrderResult TradingBot::place_market_order(const std::string& symbol, OrderSide side, double quantity) {
    logger_->info("Placing MARKET order: {{symbol: {}, side: {}, quantity: {}}}",
                  symbol, to_string(side), utils::format_decimal(quantity));
    return guarded("placing MARKET order", "placed MARKET order", [&]() {
        OrderRequest req;
        req.symbol = normalize_symbol(symbol);
        req.side = side;
        req.type = OrderType::MARKET;
        require_positive("quantity", quantity);
        req.quantity = quantity;
        return client_->create_order(req);
    });
}

OrderResult TradingBot::place_limit_order(const std::string& symbol, OrderSide side,
                                          double quantity, double price) {
    logger_->info("Placing LIMIT order: {{symbol: {}, side: {}, quantity: {}, price: {}}}",
                  symbol, to_string(side), utils::format_decimal(quantity), utils::format_decimal(price));
    return guarded("placing LIMIT order", "placed LIMIT order", [&]() {
        OrderRequest req;
        req.symbol = normalize_symbol(symbol);
        req.side = side;
        req.type = OrderType::LIMIT;
        require_positive("quantity", quantity);
        require_positive("price", price);
        req.quantity = quantity;
        req.price = price;
        req.time_in_force = kGoodTilCanceled;
        return client_->create_order(req);
    });
}

OrderResult TradingBot::place_stop_limit_order(const std::string& symbol, OrderSide side,
                                               double quantity, double stop_price, double limit_price) {
    logger_->info("Placing STOP_LIMIT order: {{symbol: {}, side: {}, quantity: {}, stop_price: {}, limit_price: {}}}",
                  symbol, to_string(side), utils::format_decimal(quantity),
                  utils::format_decimal(stop_price), utils::format_decimal(limit_price));
    return guarded("placing STOP_LIMIT order", "placed STOP_LIMIT order", [&]() {
        OrderRequest req;
        req.symbol = normalize_symbol(symbol);
        req.side = side;
        req.type = OrderType::STOP;
        require_positive("quantity", quantity);
        require_positive("stop price", stop_price);
        require_positive("limit price", limit_price);
        req.quantity = quantity;
        req.price = limit_price;
        req.stop_price = stop_price;
        req.time_in_force = kGoodTilCanceled;
        return client_->create_order(req);
    });
}

OrderResult TradingBot::get_order_status(const std::string& symbol, int64_t order_id) {
    logger_->info("Getting order status for Order ID {} on {}", order_id, symbol);
    return guarded("getting order status", "fetched order status", [&]() {
        return client_->get_order(normalize_symbol(symbol), order_id);
    });
}

OrderResult TradingBot::cancel_order(const std::string& symbol, int64_t order_id) {
    logger_->info("Cancelling Order ID {} on {}", order_id, symbol);
    return guarded("cancelling order", "cancelled order", [&]() {
        return client_->cancel_order(normalize_symbol(symbol), order_id);
    });
}

OrderResult TradingBot::get_account_balance() {
    logger_->info("Getting account balance...");
    return guarded("getting account balance", "fetched account balance", [&]() {
        return client_->get_account_balance();
    });
}

} // namespace tradebot
