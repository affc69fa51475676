#include "taxlots/gains_report.hpp"

#include <map>
#include <utility>

namespace taxlots {

namespace {

bool in_year(CalendarDate date, const std::optional<int>& year) {
    return !year || date.year() == *year;
}

// Buy lots still open on 31 December of `year`: buys dated up to that year,
// reduced by fragments of sales dated up to that year. Lots are keyed by id.
std::vector<Trade> lots_held_at_year_end(const std::vector<Trade>& trades,
                                         const std::vector<SaleMatch>& sales,
                                         int year) {
    std::map<long long, int64_t> consumed;
    for (const auto& match : sales) {
        if (match.sale.date().year() > year) {
            continue;
        }
        for (const auto& fragment : match.sold_buyings) {
            consumed[fragment.buy_id] += fragment.quantity;
        }
    }

    std::vector<Trade> held;
    for (const auto& trade : trades) {
        if (trade.side != TradeSide::Buy || trade.date().year() > year) {
            continue;
        }
        const auto it = consumed.find(trade.id);
        const int64_t used = it == consumed.end() ? 0 : it->second;
        if (trade.quantity > used) {
            Trade lot = trade;
            lot.quantity -= used;
            held.push_back(std::move(lot));
        }
    }
    return held;
}

} // namespace

ConvertedAmount convert(CalendarDate date, const Decimal& amount, const ExchangeRateTable& rates) {
    ConvertedAmount result;
    result.date = date;
    result.amount = amount;
    result.rate = rates.rate_for(date);
    result.converted = amount * result.rate;
    return result;
}

SaleGain compute_sale_gain(const SaleMatch& match, const ExchangeRateTable& rates) {
    SaleGain gain;
    gain.match = match;
    gain.proceeds = convert(match.sale.date(), match.sale.unit_price * match.amount(), rates);

    gain.costs.reserve(match.sold_buyings.size());
    for (const auto& fragment : match.sold_buyings) {
        FragmentCost cost;
        cost.fragment = fragment;
        cost.cost = convert(fragment.date(), fragment.unit_price * fragment.quantity, rates);

        gain.cost_basis += cost.cost.amount;
        gain.cost_basis_converted += cost.cost.converted;
        gain.costs.push_back(std::move(cost));
    }

    return gain;
}

DividendIncome compute_dividend_income(const DividendRecord& record, const ExchangeRateTable& rates) {
    DividendIncome income;
    income.record = record;
    income.rate = rates.rate_for(record.dividend.date);
    income.gross_converted = record.gross() * income.rate;
    income.withheld_converted = record.withheld() * income.rate;
    return income;
}

TaxReport build_tax_report(const std::vector<Trade>& trades,
                           const std::vector<MoneyEvent>& dividends,
                           const std::vector<MoneyEvent>& withholdings,
                           const ExchangeRateTable& rates,
                           std::optional<int> tax_year) {
    TaxReport report;
    report.trades = trades;
    report.tax_year = tax_year;

    MatchResult matched = match_lots(trades);
    if (tax_year) {
        report.remaining_buys = lots_held_at_year_end(trades, matched.sales, *tax_year);
    } else {
        report.remaining_buys = std::move(matched.remaining_buys);
    }

    for (const auto& match : matched.sales) {
        if (!in_year(match.sale.date(), tax_year)) {
            continue;
        }
        SaleGain gain = compute_sale_gain(match, rates);
        report.totals.proceeds += gain.proceeds.amount;
        report.totals.proceeds_converted += gain.proceeds.converted;
        report.totals.cost_basis += gain.cost_basis;
        report.totals.cost_basis_converted += gain.cost_basis_converted;
        report.sales.push_back(std::move(gain));
    }

    ReconciliationResult reconciled = reconcile_dividends(dividends, withholdings);
    for (const auto& record : reconciled.records) {
        if (!in_year(record.dividend.date, tax_year)) {
            continue;
        }
        DividendIncome income = compute_dividend_income(record, rates);
        report.totals.dividends += record.gross();
        report.totals.dividends_converted += income.gross_converted;
        report.totals.withheld += record.withheld();
        report.totals.withheld_converted += income.withheld_converted;
        report.dividends.push_back(std::move(income));
    }

    for (auto& orphan : reconciled.orphan_withholdings) {
        if (in_year(orphan.date, tax_year)) {
            report.orphan_withholdings.push_back(std::move(orphan));
        }
    }

    return report;
}

} // namespace taxlots
