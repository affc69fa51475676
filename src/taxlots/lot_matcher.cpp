#include "taxlots/lot_matcher.hpp"
#include "taxlots/errors.hpp"

#include <algorithm>
#include <deque>
#include <string>
#include <unordered_map>
#include <utility>

namespace taxlots {

MatchResult match_lots(const std::vector<Trade>& trades) {
    // Working copies of every buy lot, plus a FIFO queue of lot indices per symbol.
    std::vector<Trade> lots;
    std::unordered_map<std::string, std::deque<std::size_t>> open_lots;
    std::vector<const Trade*> sales;

    for (const auto& trade : trades) {
        if (trade.side == TradeSide::Buy) {
            open_lots[trade.symbol].push_back(lots.size());
            lots.push_back(trade);
        } else {
            sales.push_back(&trade);
        }
    }

    MatchResult result;
    result.sales.reserve(sales.size());

    for (const Trade* sale : sales) {
        SaleMatch match;
        match.sale = *sale;

        int64_t remaining = sale->quantity;
        auto queue = open_lots.find(sale->symbol);
        while (remaining > 0 && queue != open_lots.end() && !queue->second.empty()) {
            Trade& lot = lots[queue->second.front()];
            const int64_t take = std::min(remaining, lot.quantity);

            LotFragment fragment;
            fragment.buy_id = lot.id;
            fragment.symbol = lot.symbol;
            fragment.quantity = take;
            fragment.unit_price = lot.unit_price;
            fragment.timestamp = lot.timestamp;
            match.sold_buyings.push_back(std::move(fragment));

            lot.quantity -= take;
            remaining -= take;

            if (lot.quantity == 0) {
                queue->second.pop_front();
            }
        }

        if (remaining > 0) {
            throw InsufficientLots(sale->symbol, remaining, sale->timestamp);
        }

        result.sales.push_back(std::move(match));
    }

    for (const auto& lot : lots) {
        if (lot.quantity > 0) {
            result.remaining_buys.push_back(lot);
        }
    }

    return result;
}

} // namespace taxlots
