#include "taxlots/exchange_rate_table.hpp"
#include "taxlots/errors.hpp"

namespace taxlots {

ExchangeRateTable ExchangeRateTable::build(const std::vector<RateSample>& samples) {
    ExchangeRateTable table;
    if (samples.empty()) {
        return table;
    }

    table.first_ = samples.front().date;
    table.rates_.push_back(samples.front().rate);

    for (std::size_t i = 1; i < samples.size(); ++i) {
        const RateSample& sample = samples[i];
        const CalendarDate last = table.last_date();

        if (sample.date < last) {
            throw InvalidRecord("Exchange rate samples out of order",
                                sample.date.to_iso() + " follows " + last.to_iso());
        }
        if (sample.date == last) {
            table.rates_.back() = sample.rate;
            continue;
        }

        // Carry the previous rate through days without a published rate.
        const Decimal previous = table.rates_.back();
        for (long gap = sample.date - last; gap > 1; --gap) {
            table.rates_.push_back(previous);
        }
        table.rates_.push_back(sample.rate);
    }

    return table;
}

const Decimal& ExchangeRateTable::rate_for(CalendarDate date) const {
    if (rates_.empty() || date < first_ || date > last_date()) {
        throw RateNotFound(date);
    }
    return rates_[static_cast<std::size_t>(date - first_)];
}

const Decimal& ExchangeRateTable::rate_for(Timestamp tp) const {
    return rate_for(CalendarDate::from_time_point(tp));
}

bool ExchangeRateTable::operator==(const ExchangeRateTable& other) const {
    if (rates_.empty() || other.rates_.empty()) {
        return rates_.empty() && other.rates_.empty();
    }
    return first_ == other.first_ && rates_ == other.rates_;
}

} // namespace taxlots
