/**
 * @file test_binance_client.cpp
 * @brief Unit tests for BinanceClient request building and response handling
 */

#include <gtest/gtest.h>
#include "exchange/binance_client.h"
#include "core/auth/auth_provider.h"
#include "core/errors.h"
#include "../mocks/fake_exchange_client.h"
#include <memory>
#include <regex>
#include <string>
#include <vector>

using namespace tradebot;
using tradebot::testing::make_null_logger;

// ============================================================================
// RECORDING HTTP CLIENT
// ============================================================================

class RecordingHttpClient : public nethttp::HttpClient {
public:
    struct Call {
        std::string method;
        std::string url;
        std::vector<nethttp::Header> headers;
        std::string body;
    };

    nethttp::HttpResponse next{200, R"({"orderId":42,"status":"NEW"})"};
    mutable std::vector<Call> calls;

    nethttp::HttpResponse request(const std::string& method,
                                  const std::string& url,
                                  const std::vector<nethttp::Header>& headers,
                                  const std::string& body) const override {
        calls.push_back({method, url, headers, body});
        return next;
    }

    std::string header(size_t i, const std::string& name) const {
        for (const auto& h : calls.at(i).headers) {
            if (h.name == name) return h.value;
        }
        return {};
    }
};

class BinanceClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http_ = std::make_shared<RecordingHttpClient>();
    }

    std::unique_ptr<BinanceClient> make_client(bool testnet = true, std::string base_url = {}) {
        auth::Credentials creds{"test-api-key", "test-api-secret", testnet};
        BinanceClientOptions options;
        options.base_url = std::move(base_url);
        return std::make_unique<BinanceClient>(creds, options, http_, make_null_logger());
    }

    std::shared_ptr<RecordingHttpClient> http_;
};

// ============================================================================
// ENDPOINTS
// ============================================================================

TEST_F(BinanceClientTest, BaseUrlFollowsNetwork) {
    EXPECT_EQ(make_client(true)->base_url(), "https://testnet.binancefuture.com");
    EXPECT_EQ(make_client(false)->base_url(), "https://fapi.binance.com");
    EXPECT_EQ(make_client(true, "http://localhost:8080/")->base_url(), "http://localhost:8080");
    EXPECT_TRUE(make_client(true)->is_testnet());
}

TEST_F(BinanceClientTest, ServerTimeIsUnsigned) {
    http_->next = {200, R"({"serverTime":1700000000000})"};
    auto client = make_client();
    EXPECT_EQ(client->get_server_time(), R"({"serverTime":1700000000000})");
    ASSERT_EQ(http_->calls.size(), 1u);
    EXPECT_EQ(http_->calls[0].method, "GET");
    EXPECT_EQ(http_->calls[0].url, "https://testnet.binancefuture.com/fapi/v1/time");
}

TEST_F(BinanceClientTest, CreateOrderPostsSignedForm) {
    auto client = make_client();
    OrderRequest req;
    req.symbol = "BTCUSDT";
    req.side = OrderSide::BUY;
    req.type = OrderType::MARKET;
    req.quantity = 0.01;
    client->create_order(req);

    ASSERT_EQ(http_->calls.size(), 1u);
    const auto& call = http_->calls[0];
    EXPECT_EQ(call.method, "POST");
    EXPECT_EQ(call.url, "https://testnet.binancefuture.com/fapi/v1/order");
    EXPECT_EQ(http_->header(0, "X-MBX-APIKEY"), "test-api-key");
    EXPECT_EQ(http_->header(0, "Content-Type"), "application/x-www-form-urlencoded");
    EXPECT_TRUE(std::regex_match(call.body, std::regex(
        "symbol=BTCUSDT&side=BUY&type=MARKET&quantity=0\\.01"
        "&timestamp=[0-9]+&recvWindow=5000&signature=[0-9a-f]{64}")))
        << call.body;
}

TEST_F(BinanceClientTest, SignatureCoversEverythingBeforeIt) {
    auto client = make_client();
    client->get_account_balance();
    const std::string& url = http_->calls.at(0).url;
    const auto q = url.find('?');
    const auto sig = url.find("&signature=");
    ASSERT_NE(q, std::string::npos);
    ASSERT_NE(sig, std::string::npos);
    const std::string signed_part = url.substr(q + 1, sig - q - 1);
    EXPECT_EQ(url.substr(sig + 11), auth::hmac_sha256_hex("test-api-secret", signed_part));
    EXPECT_EQ(url.substr(0, q), "https://testnet.binancefuture.com/fapi/v2/balance");
}

TEST_F(BinanceClientTest, OrderQueryForLimitAndStop) {
    OrderRequest limit;
    limit.symbol = "ETHUSDT";
    limit.side = OrderSide::SELL;
    limit.type = OrderType::LIMIT;
    limit.quantity = 1.5;
    limit.price = 3500.25;
    limit.time_in_force = "GTC";
    EXPECT_EQ(BinanceClient::build_order_query(limit),
              "symbol=ETHUSDT&side=SELL&type=LIMIT&timeInForce=GTC&quantity=1.5&price=3500.25");

    OrderRequest stop = limit;
    stop.type = OrderType::STOP;
    stop.price = 59900.0;
    stop.stop_price = 60000.0;
    EXPECT_EQ(BinanceClient::build_order_query(stop),
              "symbol=ETHUSDT&side=SELL&type=STOP&timeInForce=GTC&quantity=1.5&price=59900&stopPrice=60000");
}

TEST_F(BinanceClientTest, OrderLookupAndCancelCarrySymbolAndId) {
    auto client = make_client();
    client->get_order("BTCUSDT", 42);
    client->cancel_order("BTCUSDT", 42);
    ASSERT_EQ(http_->calls.size(), 2u);
    EXPECT_EQ(http_->calls[0].method, "GET");
    EXPECT_EQ(http_->calls[1].method, "DELETE");
    for (const auto& call : http_->calls) {
        EXPECT_EQ(call.url.rfind("https://testnet.binancefuture.com/fapi/v1/order?symbol=BTCUSDT&orderId=42&timestamp=", 0), 0u)
            << call.url;
        EXPECT_TRUE(call.body.empty());
    }
}

// ============================================================================
// RESPONSES
// ============================================================================

TEST_F(BinanceClientTest, SuccessBodyIsReturnedVerbatim) {
    http_->next = {200, "{ \"orderId\" : 42 ,\"price\":\"0.00\" }"};
    EXPECT_EQ(make_client()->get_order("BTCUSDT", 42), "{ \"orderId\" : 42 ,\"price\":\"0.00\" }");
}

TEST_F(BinanceClientTest, ApiErrorBecomesExchangeError) {
    http_->next = {401, R"({"code":-2015,"msg":"Invalid API-key, IP, or permissions for action."})"};
    auto client = make_client();
    try {
        client->get_account_info();
        FAIL() << "expected ExchangeError";
    } catch (const ExchangeError& e) {
        EXPECT_EQ(e.code(), kPermissionDeniedCode);
        EXPECT_EQ(e.http_status(), 401);
        EXPECT_EQ(e.exchange_message(), "Invalid API-key, IP, or permissions for action.");
        EXPECT_STREQ(e.what(), "APIError(code=-2015): Invalid API-key, IP, or permissions for action.");
    }
}

TEST_F(BinanceClientTest, NegativeCodeInOkResponseIsAnError) {
    http_->next = {200, R"({"code":-1121,"msg":"Invalid symbol."})"};
    EXPECT_THROW(make_client()->get_order("NOPE", 1), ExchangeError);
}

TEST_F(BinanceClientTest, CancelReplyWithSuccessCodeIsNotAnError) {
    http_->next = {200, R"({"code":200,"msg":"The operation of cancel all open order is done."})"};
    EXPECT_NO_THROW(make_client()->cancel_order("BTCUSDT", 1));
}

TEST_F(BinanceClientTest, UnparseableBodyIsTransportError) {
    auto client = make_client();
    http_->next = {200, "<html>ok</html>"};
    EXPECT_THROW(client->get_account_balance(), TransportError);
    http_->next = {502, "<html>Bad Gateway</html>"};
    try {
        client->get_account_balance();
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("HTTP 502"), std::string::npos);
    }
}

TEST_F(BinanceClientTest, ErrorStatusWithoutCodeIsTransportError) {
    http_->next = {503, R"({"status":"unavailable"})"};
    EXPECT_THROW(make_client()->get_server_time(), TransportError);
}

// ============================================================================
// SIGNING
// ============================================================================

TEST(HmacSha256Test, KnownVectors) {
    EXPECT_EQ(auth::hmac_sha256_hex("Jefe", "what do ya want for nothing?"),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    EXPECT_EQ(auth::hmac_sha256_hex(
                  "NhqPtmdSJYdKjVHjA7PZj4Mge3R5YNiP1e3UZjInClVN65XAbvqqM6A7H5fATj0j",
                  "symbol=LTCBTC&side=BUY&type=LIMIT&timeInForce=GTC&quantity=1&price=0.1"
                  "&recvWindow=5000&timestamp=1499827319559"),
              "c8db56825ae71d6d79447849e617115f4a920fa2acdcab2b053c4b2838bd6b71");
}

TEST(BinanceAuthProviderTest, AppendsTimestampWindowAndSignature) {
    auth::BinanceAuthProvider provider;
    const std::string signed_query = provider.sign_query("symbol=BTCUSDT", "secret", 1700000000000ULL, 5000);
    const std::string prefix = "symbol=BTCUSDT&timestamp=1700000000000&recvWindow=5000";
    ASSERT_EQ(signed_query.rfind(prefix, 0), 0u);
    EXPECT_EQ(signed_query, prefix + "&signature=" + auth::hmac_sha256_hex("secret", prefix));

    EXPECT_EQ(provider.sign_query("", "secret", 1, 10).rfind("timestamp=1&recvWindow=10&signature=", 0), 0u);
}
