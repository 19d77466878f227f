#include "utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace tradebot {
namespace utils {

std::string to_lower_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string to_upper_ascii(std::string_view input) {
    std::string out(input.begin(), input.end());
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return out;
}

std::string trim(std::string_view input) {
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(input.begin(), input.end(), is_space);
    auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (begin >= end) return {};
    return std::string(begin, end);
}

std::string trim_trailing_zeros(std::string value) {
    if (auto pos = value.find('.'); pos != std::string::npos) {
        auto last = value.find_last_not_of('0');
        if (last != std::string::npos) {
            value.erase(last + 1);
        }
        if (!value.empty() && value.back() == '.') {
            value.pop_back();
        }
    }
    if (value.empty()) {
        return std::string{"0"};
    }
    return value;
}

std::string format_decimal(double value, int precision) {
    if (!std::isfinite(value)) {
        return std::string{"0"};
    }
    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    oss << std::setprecision(precision) << value;
    return trim_trailing_zeros(oss.str());
}

std::optional<double> parse_double(std::string_view input) {
    const std::string s = trim(input);
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<int64_t> parse_int64(std::string_view input) {
    const std::string s = trim(input);
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

std::optional<bool> parse_bool(std::string_view input) {
    const std::string s = to_lower_ascii(trim(input));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

std::string mask_secret(std::string_view secret) {
    if (secret.size() <= 8) return std::string(secret.size(), '*');
    return std::string(secret.substr(0, 4)) + "..." + std::string(secret.substr(secret.size() - 4));
}

} // namespace utils
} // namespace tradebot
