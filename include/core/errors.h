/**
 * @file errors.h
 * @brief Exception hierarchy for configuration, connectivity and order operations
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tradebot {

/**
 * @class Error
 * @brief Common base for all tradebot exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Credentials missing/placeholder or config file unusable. Fatal.
 */
class ConfigurationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Initial reachability or permission check failed. Fatal.
 */
class ConnectivityError : public Error {
public:
    using Error::Error;
};

/**
 * @class ExchangeError
 * @brief The exchange answered with a structured {code, msg} error payload
 */
class ExchangeError : public Error {
public:
    ExchangeError(int code, const std::string& message, long http_status = 0)
        : Error("APIError(code=" + std::to_string(code) + "): " + message),
          code_(code), http_status_(http_status), exchange_message_(message) {}

    int code() const noexcept { return code_; }
    long http_status() const noexcept { return http_status_; }
    const std::string& exchange_message() const noexcept { return exchange_message_; }

private:
    int code_;
    long http_status_;
    std::string exchange_message_;
};

/**
 * @brief Order parameters rejected before reaching the exchange
 */
class ValidationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Network failure or a response that could not be understood
 */
class TransportError : public Error {
public:
    using Error::Error;
};

// Binance: "Invalid API-key, IP, or permissions for action"
inline constexpr int kPermissionDeniedCode = -2015;

} // namespace tradebot
