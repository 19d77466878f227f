/**
 * @file fake_exchange_client.h
 * @brief In-memory ExchangeClient and logger helpers for unit tests
 */

#pragma once

#include "core/errors.h"
#include "exchange/exchange_client.h"
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace tradebot::testing {

class FakeExchangeClient : public ExchangeClient {
public:
    std::string server_time_body = R"({"serverTime":1700000000000})";
    std::string account_body = R"({"canTrade":true,"totalWalletBalance":"15000.00"})";
    std::string order_body = R"({"orderId":4242,"symbol":"BTCUSDT","status":"NEW","side":"BUY","type":"MARKET","origQty":"0.010"})";
    std::string cancel_body = R"({"orderId":4242,"symbol":"BTCUSDT","status":"CANCELED"})";
    std::string balance_body = R"([{"asset":"USDT","balance":"15000.00","availableBalance":"14950.00"}])";

    // Invoked at the start of every call; throw from it to simulate failures.
    std::function<void()> on_server_time;
    std::function<void()> on_account_info;
    std::function<void()> on_operation;

    std::vector<OrderRequest> created_orders;
    std::vector<std::pair<std::string, int64_t>> queried_orders;
    std::vector<std::pair<std::string, int64_t>> cancelled_orders;
    int balance_calls = 0;

    std::string get_exchange_name() const override { return "fake"; }
    std::string base_url() const override { return "https://fake.invalid"; }

    std::string get_server_time() override {
        if (on_server_time) on_server_time();
        return server_time_body;
    }
    std::string get_account_info() override {
        if (on_account_info) on_account_info();
        return account_body;
    }
    std::string create_order(const OrderRequest& request) override {
        created_orders.push_back(request);
        if (on_operation) on_operation();
        return order_body;
    }
    std::string get_order(const std::string& symbol, int64_t order_id) override {
        queried_orders.emplace_back(symbol, order_id);
        if (on_operation) on_operation();
        return order_body;
    }
    std::string cancel_order(const std::string& symbol, int64_t order_id) override {
        cancelled_orders.emplace_back(symbol, order_id);
        if (on_operation) on_operation();
        return cancel_body;
    }
    std::string get_account_balance() override {
        ++balance_calls;
        if (on_operation) on_operation();
        return balance_body;
    }

    int operation_calls() const {
        return static_cast<int>(created_orders.size() + queried_orders.size() + cancelled_orders.size()) + balance_calls;
    }
};

inline std::shared_ptr<spdlog::logger> make_null_logger() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

inline std::shared_ptr<spdlog::logger> make_capture_logger(std::ostringstream& out) {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto logger = std::make_shared<spdlog::logger>("test", sink);
    logger->set_pattern("%l - %v");
    logger->set_level(spdlog::level::trace);
    return logger;
}

} // namespace tradebot::testing
