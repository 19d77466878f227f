/**
 * @file interactive_shell.h
 * @brief Menu-driven front end reading choices and fields from a stream
 */

#pragma once

#include "engine/trading_bot.h"
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

namespace tradebot {

enum class MenuChoice {
    MARKET_ORDER = 1,
    LIMIT_ORDER,
    STOP_LIMIT_ORDER,
    ORDER_STATUS,
    CANCEL_ORDER,
    ACCOUNT_BALANCE,
    EXIT
};

/**
 * @brief Map a menu line ("1".."7", surrounding whitespace ignored) to a choice
 */
std::optional<MenuChoice> parse_menu_choice(const std::string& line);

/**
 * @class InteractiveShell
 * @brief ShowMenu -> CollectArgs -> Dispatch -> ShowResult loop until Exit or end of input
 *
 * Fields are re-prompted until they coerce to their declared type; nothing is
 * dispatched to the bot until every field of the selected operation is valid.
 */
class InteractiveShell {
public:
    InteractiveShell(TradingBot& bot,
                     std::istream& in,
                     std::ostream& out,
                     std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Run until the user selects Exit or input ends
     * @return Process exit status (0)
     */
    int run();

private:
    enum class State {
        SHOW_MENU,
        COLLECT_ARGS,
        DISPATCH,
        SHOW_RESULT,
        EXIT
    };

    struct Arguments {
        std::string symbol;
        OrderSide side{OrderSide::BUY};
        double quantity{0.0};
        double price{0.0};
        double stop_price{0.0};
        int64_t order_id{0};
    };

    void print_menu();
    std::optional<std::string> read_line(const std::string& prompt);

    // Re-prompts until parse succeeds; nullopt only at end of input.
    template <typename T>
    std::optional<T> prompt_typed(const std::string& prompt,
                                  const std::string& type_name,
                                  const std::function<std::optional<T>(const std::string&)>& parse);

    // False if input ended before all fields were read.
    bool collect_args(MenuChoice choice, Arguments& args);
    OrderResult dispatch(MenuChoice choice, const Arguments& args);
    void show_result(MenuChoice choice, const OrderResult& result);

    TradingBot& bot_;
    std::istream& in_;
    std::ostream& out_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace tradebot
