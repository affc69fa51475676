#pragma once

#include "taxlots/calendar.hpp"
#include "taxlots/decimal.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace taxlots {

enum class TradeSide { Buy, Sell };

struct Trade {
    long long id = 0;
    Timestamp timestamp{};
    TradeSide side = TradeSide::Buy;
    std::string symbol;
    int64_t quantity = 0;     // whole shares, always positive
    Decimal unit_price;       // trade currency

    [[nodiscard]] CalendarDate date() const { return CalendarDate::from_time_point(timestamp); }
};

// Throws InvalidRecord for an empty symbol or a non-positive quantity.
Trade make_trade(long long id,
                 Timestamp timestamp,
                 TradeSide side,
                 std::string symbol,
                 int64_t quantity,
                 Decimal unit_price);

// Part of a buy lot that funded a sale.
struct LotFragment {
    long long buy_id = 0;
    std::string symbol;
    int64_t quantity = 0;
    Decimal unit_price;
    Timestamp timestamp{};

    [[nodiscard]] CalendarDate date() const { return CalendarDate::from_time_point(timestamp); }
};

struct SaleMatch {
    Trade sale;
    std::vector<LotFragment> sold_buyings;

    [[nodiscard]] int64_t amount() const { return sale.quantity; }
};

enum class MoneyCategory { Dividend, Withholding };

struct MoneyEvent {
    CalendarDate date;
    std::string symbol;
    std::string description;
    Decimal amount;           // signed, trade currency
    MoneyCategory category = MoneyCategory::Dividend;
};

// Throws InvalidRecord for an empty symbol.
MoneyEvent make_money_event(CalendarDate date,
                            std::string symbol,
                            std::string description,
                            Decimal amount,
                            MoneyCategory category);

const char* to_string(TradeSide side);
const char* to_string(MoneyCategory category);

} // namespace taxlots
