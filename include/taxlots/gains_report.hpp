#pragma once

#include "taxlots/dividend_reconciler.hpp"
#include "taxlots/exchange_rate_table.hpp"
#include "taxlots/lot_matcher.hpp"

#include <optional>
#include <vector>

namespace taxlots {

// One money leg converted at the rate of its own date.
struct ConvertedAmount {
    CalendarDate date;
    Decimal amount;      // trade currency
    Decimal rate;
    Decimal converted;   // reporting currency, unrounded
};

struct FragmentCost {
    LotFragment fragment;
    ConvertedAmount cost;
};

struct SaleGain {
    SaleMatch match;
    ConvertedAmount proceeds;
    std::vector<FragmentCost> costs;
    Decimal cost_basis;             // trade currency
    Decimal cost_basis_converted;   // reporting currency

    [[nodiscard]] Decimal profit() const { return proceeds.amount - cost_basis; }
    [[nodiscard]] Decimal profit_converted() const { return proceeds.converted - cost_basis_converted; }
};

struct DividendIncome {
    DividendRecord record;
    Decimal rate;
    Decimal gross_converted;
    Decimal withheld_converted;
};

struct ReportTotals {
    Decimal proceeds;
    Decimal proceeds_converted;
    Decimal cost_basis;
    Decimal cost_basis_converted;
    Decimal dividends;
    Decimal dividends_converted;
    Decimal withheld;
    Decimal withheld_converted;

    [[nodiscard]] Decimal profit() const { return proceeds - cost_basis; }
    [[nodiscard]] Decimal profit_converted() const { return proceeds_converted - cost_basis_converted; }
};

struct TaxReport {
    std::vector<Trade> trades;
    std::vector<SaleGain> sales;
    std::vector<Trade> remaining_buys;   // at the end of tax_year when set
    std::vector<DividendIncome> dividends;
    std::vector<MoneyEvent> orphan_withholdings;
    ReportTotals totals;
    std::optional<int> tax_year;
};

// Throws RateNotFound if the table does not cover `date`.
ConvertedAmount convert(CalendarDate date, const Decimal& amount, const ExchangeRateTable& rates);

// Proceeds at the sale-date rate, each fragment at its own buy-date rate.
SaleGain compute_sale_gain(const SaleMatch& match, const ExchangeRateTable& rates);

DividendIncome compute_dividend_income(const DividendRecord& record, const ExchangeRateTable& rates);

// Runs matching and reconciliation over the full history and converts the
// results. With `tax_year` set, only sales and dividends dated in that year
// are converted and reported, and remaining_buys holds the lots open at the
// end of that year. Matching still sees every trade.
TaxReport build_tax_report(const std::vector<Trade>& trades,
                           const std::vector<MoneyEvent>& dividends,
                           const std::vector<MoneyEvent>& withholdings,
                           const ExchangeRateTable& rates,
                           std::optional<int> tax_year = std::nullopt);

} // namespace taxlots
