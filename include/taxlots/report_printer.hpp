#pragma once

#include "taxlots/gains_report.hpp"

#include <iostream>
#include <string>

namespace taxlots {

// "$12.34" / "-$12.34"
std::string format_money(const Decimal& amount);

// "1234.56 RUB"
std::string format_converted(const Decimal& amount, const std::string& currency);

// Terminal rendering of a tax report.
class ReportPrinter {
public:
    explicit ReportPrinter(std::string reporting_currency, std::ostream& out = std::cout, bool color = true);
    ~ReportPrinter() = default;

    ReportPrinter(const ReportPrinter&) = delete;
    ReportPrinter& operator=(const ReportPrinter&) = delete;
    ReportPrinter(ReportPrinter&&) = delete;
    ReportPrinter& operator=(ReportPrinter&&) = delete;

    void render(const TaxReport& report);

private:
    std::string reporting_currency_;
    std::ostream& out_;
    bool color_;

    std::string describe(const Trade& trade) const;
    std::string describe(const LotFragment& fragment) const;
    std::string describe_leg(int64_t quantity, const Decimal& price, const ConvertedAmount& leg) const;
    std::string signed_color(const Decimal& value) const;
    const char* style(const char* code) const { return color_ ? code : ""; }

    static constexpr const char* RESET = "\033[0m";
    static constexpr const char* BOLD = "\033[1m";
    static constexpr const char* RED = "\033[31m";
    static constexpr const char* GREEN = "\033[32m";
    static constexpr const char* YELLOW = "\033[33m";
    static constexpr const char* CYAN = "\033[36m";
    static constexpr const char* GRAY = "\033[90m";

    void print_header(const TaxReport& report);
    void print_trades(const std::vector<Trade>& trades);
    void print_sales(const std::vector<SaleGain>& sales);
    void print_remaining(const std::vector<Trade>& remaining);
    void print_dividends(const std::vector<DividendIncome>& dividends);
    void print_orphans(const std::vector<MoneyEvent>& orphans);
    void print_totals(const ReportTotals& totals);
};

} // namespace taxlots
