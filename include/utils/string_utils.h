#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <cstdint>

namespace tradebot {
namespace utils {

/**
 * @brief Convert string to lowercase ASCII
 */
std::string to_lower_ascii(std::string_view input);

/**
 * @brief Convert string to uppercase ASCII
 */
std::string to_upper_ascii(std::string_view input);

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(std::string_view input);

/**
 * @brief Trim trailing zeros from decimal string
 */
std::string trim_trailing_zeros(std::string value);

/**
 * @brief Format decimal number to string with trimming
 * @param value Numeric value to format
 * @param precision Decimal precision (default: 8)
 */
std::string format_decimal(double value, int precision = 8);

/**
 * @brief Parse a whole string as a finite double (surrounding whitespace allowed)
 */
std::optional<double> parse_double(std::string_view input);

/**
 * @brief Parse a whole string as a signed 64-bit integer (surrounding whitespace allowed)
 */
std::optional<int64_t> parse_int64(std::string_view input);

/**
 * @brief Parse truthy/falsey strings ("1", "true", "yes", "on" and their negatives)
 */
std::optional<bool> parse_bool(std::string_view input);

/**
 * @brief Mask a secret for logging: first and last four characters only
 */
std::string mask_secret(std::string_view secret);

} // namespace utils
} // namespace tradebot
