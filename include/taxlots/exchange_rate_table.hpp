#pragma once

#include "taxlots/calendar.hpp"
#include "taxlots/decimal.hpp"

#include <cstddef>
#include <vector>

namespace taxlots {

struct RateSample {
    CalendarDate date;
    Decimal rate;
};

// Daily conversion rates from trade currency into reporting currency.
// Built once from a sparse feed and read-only afterwards; every day between
// the first and last sample resolves to the latest published rate.
class ExchangeRateTable {
public:
    ExchangeRateTable() = default;

    // Samples must be in date order. A repeated date replaces the earlier rate,
    // a date going backwards throws InvalidRecord.
    static ExchangeRateTable build(const std::vector<RateSample>& samples);

    // Throws RateNotFound outside [first_date(), last_date()] or when empty.
    [[nodiscard]] const Decimal& rate_for(CalendarDate date) const;
    [[nodiscard]] const Decimal& rate_for(Timestamp tp) const;

    [[nodiscard]] bool empty() const { return rates_.empty(); }
    [[nodiscard]] std::size_t size() const { return rates_.size(); }
    [[nodiscard]] CalendarDate first_date() const { return first_; }
    [[nodiscard]] CalendarDate last_date() const { return first_ + static_cast<long>(rates_.size()) - 1; }

    bool operator==(const ExchangeRateTable& other) const;
    bool operator!=(const ExchangeRateTable& other) const { return !(*this == other); }

private:
    CalendarDate first_;
    std::vector<Decimal> rates_;   // rates_[i] is the rate on first_ + i
};

} // namespace taxlots
