#pragma once

#include <string>
#include <string_view>

namespace tradebot {
namespace utils {

/**
 * @brief Re-indent a JSON document with two spaces per level
 * @return The indented document, or the input unchanged if it is not valid JSON
 */
std::string pretty_json(std::string_view raw);

} // namespace utils
} // namespace tradebot
