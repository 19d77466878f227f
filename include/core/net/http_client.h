/**
 * @file http_client.h
 * @brief Simple HTTP client wrapper using libcurl for REST requests.
 */

#pragma once

#include <string>
#include <vector>

namespace tradebot::nethttp {

struct Header { std::string name; std::string value; };

struct HttpResponse {
    long status{0};
    std::string body;
};

struct HttpClientOptions {
    long timeout_ms{0};          // 0 = libcurl default
    long connect_timeout_ms{0};  // 0 = libcurl default
    std::string user_agent{"tradebot/1.0"};
};

class HttpClient {
public:
    HttpClient() = default;
    explicit HttpClient(HttpClientOptions options);
    virtual ~HttpClient() = default;

    // Perform an HTTP request. Any HTTP status is returned to the caller;
    // throws TransportError only when no response was received.
    virtual HttpResponse request(const std::string& method,
                                 const std::string& url,     // full URL incl. query
                                 const std::vector<Header>& headers,
                                 const std::string& body) const;

private:
    HttpClientOptions options_;
};

} // namespace tradebot::nethttp
