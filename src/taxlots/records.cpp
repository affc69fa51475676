#include "taxlots/records.hpp"
#include "taxlots/errors.hpp"

#include <utility>

namespace taxlots {

Trade make_trade(long long id,
                 Timestamp timestamp,
                 TradeSide side,
                 std::string symbol,
                 int64_t quantity,
                 Decimal unit_price) {
    if (symbol.empty()) {
        throw InvalidRecord("Trade without symbol", format_timestamp(timestamp));
    }
    if (quantity <= 0) {
        throw InvalidRecord("Trade quantity must be positive",
                            symbol + " " + format_timestamp(timestamp) + " qty=" + std::to_string(quantity));
    }

    Trade trade;
    trade.id = id;
    trade.timestamp = timestamp;
    trade.side = side;
    trade.symbol = std::move(symbol);
    trade.quantity = quantity;
    trade.unit_price = std::move(unit_price);
    return trade;
}

MoneyEvent make_money_event(CalendarDate date,
                            std::string symbol,
                            std::string description,
                            Decimal amount,
                            MoneyCategory category) {
    if (symbol.empty()) {
        throw InvalidRecord(std::string(to_string(category)) + " without symbol",
                            date.to_iso() + " " + description);
    }

    MoneyEvent event;
    event.date = date;
    event.symbol = std::move(symbol);
    event.description = std::move(description);
    event.amount = std::move(amount);
    event.category = category;
    return event;
}

const char* to_string(TradeSide side) {
    return side == TradeSide::Buy ? "buy" : "sell";
}

const char* to_string(MoneyCategory category) {
    return category == MoneyCategory::Dividend ? "Dividend" : "Withholding";
}

} // namespace taxlots
