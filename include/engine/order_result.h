/**
 * @file order_result.h
 * @brief Exchange payload XOR error message returned by every bot operation
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

namespace tradebot {

enum class ErrorKind {
    EXCHANGE,     // exchange rejected the request with {code, msg}
    VALIDATION,   // order parameters rejected locally
    TRANSPORT     // network failure or malformed response
};

inline std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EXCHANGE: return "exchange";
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::TRANSPORT: return "transport";
        default: return "unknown";
    }
}

struct ErrorResult {
    ErrorKind kind;
    std::string message;
};

class OrderResult {
public:
    static OrderResult success(std::string payload) {
        return OrderResult(std::move(payload));
    }
    static OrderResult failure(ErrorKind kind, std::string message) {
        return OrderResult(ErrorResult{kind, std::move(message)});
    }

    bool ok() const noexcept { return std::holds_alternative<std::string>(value_); }

    // Raw exchange JSON. Only valid when ok().
    const std::string& payload() const { return std::get<std::string>(value_); }

    // Only valid when !ok().
    const ErrorResult& error() const { return std::get<ErrorResult>(value_); }

    // Payload for success, {"error": "<message>"} for failure.
    std::string to_json() const;

private:
    explicit OrderResult(std::string payload) : value_(std::move(payload)) {}
    explicit OrderResult(ErrorResult error) : value_(std::move(error)) {}

    std::variant<std::string, ErrorResult> value_;
};

} // namespace tradebot
