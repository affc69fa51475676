#include "taxlots/errors.hpp"

#include <utility>

namespace taxlots {

InsufficientLots::InsufficientLots(const std::string& symbol, int64_t shortfall, Timestamp sale_time)
    : std::runtime_error("Not enough buy lots to fulfill sale of " + symbol + " at " +
                         format_timestamp(sale_time) + ": short by " + std::to_string(shortfall)),
      symbol_(symbol),
      shortfall_(shortfall),
      sale_time_(sale_time) {
}

RateNotFound::RateNotFound(CalendarDate date)
    : std::runtime_error("No exchange rate for " + date.to_iso()),
      date_(date) {
}

InvalidRecord::InvalidRecord(const std::string& message, std::string context)
    : std::runtime_error(context.empty() ? message : message + " (" + context + ")"),
      context_(std::move(context)) {
}

} // namespace taxlots
