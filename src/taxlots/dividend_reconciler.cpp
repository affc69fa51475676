#include "taxlots/dividend_reconciler.hpp"

#include <iostream>
#include <map>
#include <string>
#include <utility>

namespace taxlots {

namespace {

using EventKey = std::pair<std::string, long>;

EventKey key_of(const MoneyEvent& event) {
    return {event.symbol, event.date.days_since_epoch()};
}

} // namespace

Decimal DividendRecord::withheld() const {
    Decimal total;
    for (const auto& w : withholdings) {
        total += w.amount;
    }
    return total.abs();
}

ReconciliationResult reconcile_dividends(const std::vector<MoneyEvent>& dividends,
                                         const std::vector<MoneyEvent>& withholdings) {
    ReconciliationResult result;
    result.records.reserve(dividends.size());

    std::map<EventKey, std::size_t> first_record;
    for (const auto& dividend : dividends) {
        first_record.emplace(key_of(dividend), result.records.size());
        result.records.push_back(DividendRecord{dividend, {}});
    }

    for (const auto& withholding : withholdings) {
        const auto it = first_record.find(key_of(withholding));
        if (it == first_record.end()) {
            std::cerr << "[Dividends] WARNING: withholding without matching dividend: "
                      << withholding.symbol << " on " << withholding.date.to_iso()
                      << " amount " << withholding.amount << std::endl;
            result.orphan_withholdings.push_back(withholding);
            continue;
        }
        result.records[it->second].withholdings.push_back(withholding);
    }

    return result;
}

} // namespace taxlots
