/**
 * @file interactive_shell.cpp
 */

#include "engine/interactive_shell.h"
#include "utils/json_utils.h"
#include "utils/string_utils.h"
#include <exception>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace tradebot {

namespace {
const std::string kRule(50, '=');
} // namespace

std::optional<MenuChoice> parse_menu_choice(const std::string& line) {
    const std::string s = utils::trim(line);
    if (s.size() != 1 || s[0] < '1' || s[0] > '7') return std::nullopt;
    return static_cast<MenuChoice>(s[0] - '0');
}

InteractiveShell::InteractiveShell(TradingBot& bot,
                                   std::istream& in,
                                   std::ostream& out,
                                   std::shared_ptr<spdlog::logger> logger)
    : bot_(bot), in_(in), out_(out), logger_(std::move(logger)) {}

int InteractiveShell::run() {
    State state = State::SHOW_MENU;
    MenuChoice choice = MenuChoice::EXIT;
    Arguments args;
    std::optional<OrderResult> result;

    while (state != State::EXIT) {
        switch (state) {
            case State::SHOW_MENU: {
                print_menu();
                auto line = read_line("Enter your choice (1-7): ");
                if (!line) {
                    logger_->info("Input closed, shutting down");
                    state = State::EXIT;
                    break;
                }
                auto parsed = parse_menu_choice(*line);
                if (!parsed) {
                    out_ << "Invalid choice. Please select 1-7\n";
                    break;
                }
                choice = *parsed;
                if (choice == MenuChoice::EXIT) {
                    out_ << "Exiting bot...\n";
                    logger_->info("Bot shutdown by user");
                    state = State::EXIT;
                    break;
                }
                args = Arguments{};
                state = State::COLLECT_ARGS;
                break;
            }
            case State::COLLECT_ARGS:
                if (!collect_args(choice, args)) {
                    logger_->info("Input closed while collecting order fields, shutting down");
                    state = State::EXIT;
                    break;
                }
                state = State::DISPATCH;
                break;
            case State::DISPATCH:
                try {
                    result = dispatch(choice, args);
                    state = State::SHOW_RESULT;
                } catch (const std::exception& e) {
                    out_ << "An unexpected error occurred in the main loop: " << e.what() << "\n";
                    logger_->warn("Unexpected error in main loop: {}", e.what());
                    state = State::SHOW_MENU;
                }
                break;
            case State::SHOW_RESULT:
                show_result(choice, *result);
                result.reset();
                state = State::SHOW_MENU;
                break;
            case State::EXIT:
                break;
        }
    }
    out_.flush();
    return 0;
}

void InteractiveShell::print_menu() {
    out_ << "\n" << kRule << "\n"
         << "BINANCE FUTURES TESTNET TRADING BOT\n"
         << kRule << "\n"
         << "1. Place Market Order\n"
         << "2. Place Limit Order\n"
         << "3. Place Stop-Limit Order\n"
         << "4. Check Order Status\n"
         << "5. Cancel Order\n"
         << "6. Check Account Balance\n"
         << "7. Exit\n"
         << kRule << "\n";
}

std::optional<std::string> InteractiveShell::read_line(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

template <typename T>
std::optional<T> InteractiveShell::prompt_typed(const std::string& prompt,
                                                const std::string& type_name,
                                                const std::function<std::optional<T>(const std::string&)>& parse) {
    while (true) {
        auto line = read_line(prompt);
        if (!line) return std::nullopt;
        if (auto value = parse(*line)) return value;
        out_ << "Invalid input. Please enter a valid " << type_name << ".\n";
    }
}

bool InteractiveShell::collect_args(MenuChoice choice, Arguments& args) {
    const std::function<std::optional<std::string>(const std::string&)> as_string =
        [](const std::string& s) { return std::optional<std::string>(utils::trim(s)); };
    const std::function<std::optional<OrderSide>(const std::string&)> as_side =
        [](const std::string& s) { return parse_side(s); };
    const std::function<std::optional<double>(const std::string&)> as_float =
        [](const std::string& s) { return utils::parse_double(s); };
    const std::function<std::optional<int64_t>(const std::string&)> as_int =
        [](const std::string& s) { return utils::parse_int64(s); };

    if (choice == MenuChoice::ACCOUNT_BALANCE) return true;

    auto symbol = prompt_typed("Enter symbol (e.g., BTCUSDT): ", "string", as_string);
    if (!symbol) return false;
    args.symbol = *symbol;

    if (choice == MenuChoice::ORDER_STATUS || choice == MenuChoice::CANCEL_ORDER) {
        auto order_id = prompt_typed("Enter order ID: ", "int", as_int);
        if (!order_id) return false;
        args.order_id = *order_id;
        return true;
    }

    auto side = prompt_typed("Enter side (BUY or SELL): ", "side (BUY or SELL)", as_side);
    if (!side) return false;
    args.side = *side;

    auto quantity = prompt_typed("Enter quantity: ", "float", as_float);
    if (!quantity) return false;
    args.quantity = *quantity;

    if (choice == MenuChoice::STOP_LIMIT_ORDER) {
        auto stop_price = prompt_typed("Enter stop price: ", "float", as_float);
        if (!stop_price) return false;
        args.stop_price = *stop_price;
    }
    if (choice == MenuChoice::LIMIT_ORDER || choice == MenuChoice::STOP_LIMIT_ORDER) {
        auto price = prompt_typed("Enter limit price: ", "float", as_float);
        if (!price) return false;
        args.price = *price;
    }
    return true;
}

OrderResult InteractiveShell::dispatch(MenuChoice choice, const Arguments& args) {
    switch (choice) {
        case MenuChoice::MARKET_ORDER:
            return bot_.place_market_order(args.symbol, args.side, args.quantity);
        case MenuChoice::LIMIT_ORDER:
            return bot_.place_limit_order(args.symbol, args.side, args.quantity, args.price);
        case MenuChoice::STOP_LIMIT_ORDER:
            return bot_.place_stop_limit_order(args.symbol, args.side, args.quantity, args.stop_price, args.price);
        case MenuChoice::ORDER_STATUS:
            return bot_.get_order_status(args.symbol, args.order_id);
        case MenuChoice::CANCEL_ORDER:
            return bot_.cancel_order(args.symbol, args.order_id);
        case MenuChoice::ACCOUNT_BALANCE:
            return bot_.get_account_balance();
        case MenuChoice::EXIT:
            break;
    }
    throw std::logic_error("no bot operation for menu choice " + std::to_string(static_cast<int>(choice)));
}

void InteractiveShell::show_result(MenuChoice choice, const OrderResult& result) {
    const char* label = choice == MenuChoice::ACCOUNT_BALANCE ? "Account Balance" : "Result";
    out_ << "\n" << label << ": " << utils::pretty_json(result.to_json()) << "\n";
}

} // namespace tradebot
