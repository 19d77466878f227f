/**
 * @file exchange_client.cpp
 * @brief Shared helpers for exchange client implementations
 */

#include "exchange/exchange_client.h"
#include "utils/string_utils.h"

namespace tradebot {

std::optional<OrderSide> parse_side(std::string_view raw) {
    const std::string s = utils::to_upper_ascii(utils::trim(raw));
    if (s == "BUY") return OrderSide::BUY;
    if (s == "SELL") return OrderSide::SELL;
    return std::nullopt;
}

} // namespace tradebot
