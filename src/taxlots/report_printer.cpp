#include "taxlots/report_printer.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace taxlots {

std::string format_money(const Decimal& amount) {
    if (amount.sign() < 0) {
        return "-$" + amount.abs().to_fixed(2);
    }
    return "$" + amount.to_fixed(2);
}

std::string format_converted(const Decimal& amount, const std::string& currency) {
    return amount.to_fixed(2) + " " + currency;
}

ReportPrinter::ReportPrinter(std::string reporting_currency, std::ostream& out, bool color)
    : reporting_currency_(std::move(reporting_currency)),
      out_(out),
      color_(color) {
}

std::string ReportPrinter::describe(const Trade& trade) const {
    std::ostringstream oss;
    oss << trade.date().to_iso() << ' ' << to_string(trade.side) << ' ' << trade.quantity << ' '
        << trade.symbol << ' ' << format_money(trade.unit_price);
    return oss.str();
}

std::string ReportPrinter::describe(const LotFragment& fragment) const {
    std::ostringstream oss;
    oss << fragment.date().to_iso() << " buy " << fragment.quantity << ' ' << fragment.symbol << ' '
        << format_money(fragment.unit_price) << " (lot #" << fragment.buy_id << ")";
    return oss.str();
}

std::string ReportPrinter::describe_leg(int64_t quantity, const Decimal& price, const ConvertedAmount& leg) const {
    std::ostringstream oss;
    oss << format_converted(leg.converted, reporting_currency_)
        << " (" << quantity << " * " << price << " * " << leg.rate << ")";
    return oss.str();
}

std::string ReportPrinter::signed_color(const Decimal& value) const {
    if (!color_) {
        return "";
    }
    return value.sign() < 0 ? RED : GREEN;
}

void ReportPrinter::render(const TaxReport& report) {
    print_header(report);
    print_trades(report.trades);
    print_sales(report.sales);
    print_remaining(report.remaining_buys);
    print_dividends(report.dividends);
    print_orphans(report.orphan_withholdings);
    print_totals(report.totals);
}

void ReportPrinter::print_header(const TaxReport& report) {
    out_ << style(BOLD) << style(CYAN) << "TAX REPORT";
    if (report.tax_year) {
        out_ << " " << *report.tax_year;
    }
    out_ << " (reporting currency " << reporting_currency_ << ")" << style(RESET) << "\n\n";
}

void ReportPrinter::print_trades(const std::vector<Trade>& trades) {
    out_ << style(BOLD) << "All trades:" << style(RESET) << "\n";
    for (const auto& trade : trades) {
        out_ << "    " << describe(trade) << "\n";
    }
    out_ << "\n";
}

void ReportPrinter::print_sales(const std::vector<SaleGain>& sales) {
    out_ << style(BOLD) << "Sales (" << sales.size() << "):" << style(RESET) << "\n";
    for (const auto& gain : sales) {
        const Trade& sale = gain.match.sale;
        out_ << sale.date().to_iso() << ": " << sale.symbol << ' ' << sale.quantity << 'x'
             << format_money(sale.unit_price) << "\n";
        out_ << "    Income: " << format_money(gain.proceeds.amount) << " // "
             << describe_leg(sale.quantity, sale.unit_price, gain.proceeds) << "\n";
        out_ << "    What was sold:\n";
        for (const auto& cost : gain.costs) {
            out_ << "        * " << describe(cost.fragment) << " // "
                 << describe_leg(cost.fragment.quantity, cost.fragment.unit_price, cost.cost) << "\n";
        }
        out_ << "    Profit: " << signed_color(gain.profit()) << format_money(gain.profit()) << " // "
             << format_converted(gain.profit_converted(), reporting_currency_) << style(RESET)
             << " (" << gain.proceeds.converted.to_fixed(2) << " - " << gain.cost_basis_converted.to_fixed(2)
             << ")\n\n";
    }
    out_ << "\n";
}

void ReportPrinter::print_remaining(const std::vector<Trade>& remaining) {
    out_ << style(BOLD) << "Buyings left:" << style(RESET) << "\n";
    if (remaining.empty()) {
        out_ << style(GRAY) << "    (none)" << style(RESET) << "\n";
    }
    for (const auto& lot : remaining) {
        out_ << "    " << describe(lot) << "\n";
    }
    out_ << "\n";
}

void ReportPrinter::print_dividends(const std::vector<DividendIncome>& dividends) {
    out_ << style(BOLD) << "Dividends (" << dividends.size() << "):" << style(RESET) << "\n";
    for (const auto& income : dividends) {
        const DividendRecord& record = income.record;
        out_ << "    Dividends from " << record.dividend.symbol << " on " << record.dividend.date.to_dmy()
             << ", sum: " << format_money(record.gross())
             << ", withheld: " << format_money(record.withheld())
             << ", net: " << format_money(record.net()) << "\n";
        out_ << "        In " << reporting_currency_ << " at " << income.rate << ": "
             << format_converted(income.gross_converted, reporting_currency_) << ", withheld "
             << format_converted(income.withheld_converted, reporting_currency_) << "\n";
        out_ << "        Withholdings:\n";
        if (record.withholdings.empty()) {
            out_ << style(GRAY) << "            (none)" << style(RESET) << "\n";
        }
        for (const auto& w : record.withholdings) {
            out_ << "            " << w.date.to_dmy() << ' ' << w.symbol << ' ' << format_money(w.amount) << "\n";
        }
        out_ << "\n";
    }
}

void ReportPrinter::print_orphans(const std::vector<MoneyEvent>& orphans) {
    if (orphans.empty()) {
        return;
    }
    out_ << style(BOLD) << style(YELLOW) << "Withholdings without dividend (" << orphans.size() << "):"
         << style(RESET) << "\n";
    for (const auto& w : orphans) {
        out_ << "    " << w.date.to_dmy() << ' ' << w.symbol << ' ' << format_money(w.amount)
             << "  " << style(GRAY) << w.description << style(RESET) << "\n";
    }
    out_ << "\n";
}

void ReportPrinter::print_totals(const ReportTotals& totals) {
    constexpr int kLabelWidth = 18;
    out_ << style(BOLD) << "Totals:" << style(RESET) << "\n";
    out_ << "    " << std::setw(kLabelWidth) << std::left << "Proceeds"
         << format_money(totals.proceeds) << " // " << format_converted(totals.proceeds_converted, reporting_currency_) << "\n";
    out_ << "    " << std::setw(kLabelWidth) << std::left << "Cost basis"
         << format_money(totals.cost_basis) << " // " << format_converted(totals.cost_basis_converted, reporting_currency_) << "\n";
    out_ << "    " << std::setw(kLabelWidth) << std::left << "Profit"
         << signed_color(totals.profit_converted())
         << format_money(totals.profit()) << " // " << format_converted(totals.profit_converted(), reporting_currency_)
         << style(RESET) << "\n";
    out_ << "    " << std::setw(kLabelWidth) << std::left << "Dividends"
         << format_money(totals.dividends) << " // " << format_converted(totals.dividends_converted, reporting_currency_) << "\n";
    out_ << "    " << std::setw(kLabelWidth) << std::left << "Withheld"
         << format_money(totals.withheld) << " // " << format_converted(totals.withheld_converted, reporting_currency_) << "\n";
    out_ << std::right;
}

} // namespace taxlots
