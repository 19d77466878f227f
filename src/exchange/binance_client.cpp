/**
 * @file binance_client.cpp
 * @brief Binance USDT-M futures REST client
 */

#include "exchange/binance_client.h"
#include "core/errors.h"
#include "utils/string_utils.h"
#include <spdlog/spdlog.h>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <chrono>
#include <sstream>

namespace tradebot {

BinanceClient::BinanceClient(auth::Credentials credentials,
                             BinanceClientOptions options,
                             std::shared_ptr<nethttp::HttpClient> http,
                             std::shared_ptr<spdlog::logger> logger)
    : credentials_(std::move(credentials)),
      options_(std::move(options)),
      http_(http ? std::move(http) : std::make_shared<nethttp::HttpClient>()),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      auth_(std::make_unique<auth::BinanceAuthProvider>()) {
    configure_endpoints(credentials_.use_testnet);
    logger_->debug("[BinanceClient] Initialized (testnet: {}, base: {}, key: {})",
                   credentials_.use_testnet, rest_base_, utils::mask_secret(credentials_.api_key));
}

std::string BinanceClient::get_server_time() {
    return rest_request("GET", "/fapi/v1/time", "", false);
}

std::string BinanceClient::get_account_info() {
    return rest_request("GET", "/fapi/v2/account", "", true);
}

std::string BinanceClient::create_order(const OrderRequest& request) {
    return rest_request("POST", "/fapi/v1/order", build_order_query(request), true);
}

std::string BinanceClient::get_order(const std::string& symbol, int64_t order_id) {
    std::ostringstream q;
    q << "symbol=" << symbol << "&orderId=" << order_id;
    return rest_request("GET", "/fapi/v1/order", q.str(), true);
}

std::string BinanceClient::cancel_order(const std::string& symbol, int64_t order_id) {
    std::ostringstream q;
    q << "symbol=" << symbol << "&orderId=" << order_id;
    return rest_request("DELETE", "/fapi/v1/order", q.str(), true);
}

std::string BinanceClient::get_account_balance() {
    return rest_request("GET", "/fapi/v2/balance", "", true);
}

std::string BinanceClient::build_order_query(const OrderRequest& request) {
    std::ostringstream q;
    q << "symbol=" << request.symbol;
    q << "&side=" << to_string(request.side);
    q << "&type=" << to_string(request.type);
    if (request.time_in_force.has_value() && request.type != OrderType::MARKET) {
        q << "&timeInForce=" << *request.time_in_force;
    }
    q << "&quantity=" << utils::format_decimal(request.quantity);
    if (request.price.has_value() && request.type != OrderType::MARKET) {
        q << "&price=" << utils::format_decimal(*request.price);
    }
    if (request.stop_price.has_value() && request.type == OrderType::STOP) {
        q << "&stopPrice=" << utils::format_decimal(*request.stop_price);
    }
    return q.str();
}

// ==== Private helpers ========================================================

void BinanceClient::configure_endpoints(bool testnet) {
    if (!options_.base_url.empty()) {
        rest_base_ = options_.base_url;
        while (!rest_base_.empty() && rest_base_.back() == '/') rest_base_.pop_back();
    } else if (testnet) {
        rest_base_ = kTestnetRestBase;   // UM Futures testnet
    } else {
        rest_base_ = kMainnetRestBase;   // UM Futures mainnet
    }
}

uint64_t BinanceClient::timestamp_ms() const {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string BinanceClient::rest_request(const std::string& method,
                                        const std::string& path,
                                        const std::string& query,
                                        bool signed_req) {
    std::string url = rest_base_ + path;
    std::string full_query = query;
    auto headers = auth_->build_headers(credentials_.api_key);

    if (signed_req) {
        full_query = auth_->sign_query(query, credentials_.api_secret, timestamp_ms(), options_.recv_window_ms);
    }

    std::string body;
    if (method == "POST") {
        body = full_query;
        headers.push_back({"Content-Type", "application/x-www-form-urlencoded"});
    } else if (!full_query.empty()) {
        url += "?" + full_query;
    }

    logger_->debug("[BinanceClient] {} {}{}", method, rest_base_, path);
    const nethttp::HttpResponse response = http_->request(method, url, headers, body);
    const bool ok_status = response.status >= 200 && response.status < 300;

    rapidjson::Document d;
    d.Parse(response.body.c_str());
    if (d.HasParseError()) {
        std::string snippet = response.body.substr(0, 240);
        for (auto& ch : snippet) { if (ch == '\n' || ch == '\r') ch = ' '; }
        logger_->warn("[BinanceClient] HTTP {} on {}{} unparseable body='{}'", response.status, rest_base_, path, snippet);
        if (ok_status) {
            throw TransportError(std::string("Malformed response from ") + path + ": " +
                                 rapidjson::GetParseError_En(d.GetParseError()));
        }
        throw TransportError("HTTP " + std::to_string(response.status) + " from " + path + ": " + snippet);
    }

    if (d.IsObject() && d.HasMember("code") && d["code"].IsInt() &&
        (!ok_status || d["code"].GetInt() < 0)) {
        const int code = d["code"].GetInt();
        std::string msg = d.HasMember("msg") && d["msg"].IsString() ? d["msg"].GetString() : "error";
        logger_->warn("[BinanceClient] HTTP {} on {}{} code={} msg='{}'", response.status, rest_base_, path, code, msg);
        throw ExchangeError(code, msg, response.status);
    }
    if (!ok_status) {
        throw TransportError("HTTP " + std::to_string(response.status) + " from " + path);
    }
    return response.body;
}

} // namespace tradebot
