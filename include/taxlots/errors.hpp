#pragma once

#include "taxlots/calendar.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace taxlots {

// A sale could not be covered by the same-symbol buy lots that were available.
class InsufficientLots : public std::runtime_error {
public:
    InsufficientLots(const std::string& symbol, int64_t shortfall, Timestamp sale_time);

    [[nodiscard]] const std::string& symbol() const noexcept { return symbol_; }
    [[nodiscard]] int64_t shortfall() const noexcept { return shortfall_; }
    [[nodiscard]] Timestamp sale_time() const noexcept { return sale_time_; }

private:
    std::string symbol_;
    int64_t shortfall_;
    Timestamp sale_time_;
};

// Requested date lies outside the coverage of an exchange rate table.
class RateNotFound : public std::runtime_error {
public:
    explicit RateNotFound(CalendarDate date);

    [[nodiscard]] CalendarDate date() const noexcept { return date_; }

private:
    CalendarDate date_;
};

// Upstream record rejected at the ingestion boundary.
class InvalidRecord : public std::runtime_error {
public:
    InvalidRecord(const std::string& message, std::string context = {});

    [[nodiscard]] const std::string& context() const noexcept { return context_; }

private:
    std::string context_;
};

} // namespace taxlots
