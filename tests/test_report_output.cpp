#include "taxlots/report_export.hpp"
#include "taxlots/report_printer.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using taxlots::CalendarDate;
using taxlots::Decimal;
using taxlots::MoneyCategory;
using taxlots::TradeSide;

namespace {

taxlots::Trade trade(long long id, const char* when, TradeSide side, int64_t qty, const char* price) {
    return taxlots::make_trade(id, taxlots::parse_timestamp(when), side, "VOO", qty, Decimal::parse(price));
}

taxlots::MoneyEvent event(const char* iso, const char* amount, MoneyCategory category) {
    return taxlots::make_money_event(CalendarDate::parse_iso(iso), "VOO", "VOO(US9229083632) Cash Dividend",
                                     Decimal::parse(amount), category);
}

taxlots::TaxReport sample_report(std::optional<int> tax_year = std::nullopt) {
    const std::vector<taxlots::Trade> trades = {
        trade(1, "2018-11-08, 09:33:38", TradeSide::Buy, 5, "257.72"),
        trade(2, "2018-11-30, 10:01:02", TradeSide::Buy, 15, "252.33"),
        trade(3, "2019-01-15, 15:45:00", TradeSide::Sell, 7, "240.10"),
        trade(4, "2019-02-01, 11:20:10", TradeSide::Sell, 8, "249.00"),
    };
    const auto rates = taxlots::ExchangeRateTable::build({
        {CalendarDate::from_ymd(2018, 11, 1), Decimal::parse("65.00")},
        {CalendarDate::from_ymd(2018, 11, 30), Decimal::parse("66.50")},
        {CalendarDate::from_ymd(2019, 1, 15), Decimal::parse("67.00")},
        {CalendarDate::from_ymd(2019, 2, 1), Decimal::parse("66.00")},
    });
    return taxlots::build_tax_report(
        trades,
        {event("2019-01-15", "50", MoneyCategory::Dividend)},
        {event("2019-01-15", "-7", MoneyCategory::Withholding),
         event("2019-01-15", "-3", MoneyCategory::Withholding),
         event("2019-01-20", "-1.5", MoneyCategory::Withholding)},
        rates, tax_year);
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Money formatting", "[output]") {
    CHECK(taxlots::format_money(Decimal::parse("12.345")) == "$12.34");
    CHECK(taxlots::format_money(Decimal::parse("12.355")) == "$12.36");
    CHECK(taxlots::format_money(Decimal::parse("-112.56")) == "-$112.56");
    CHECK(taxlots::format_money(Decimal(0)) == "$0.00");
    CHECK(taxlots::format_converted(Decimal::parse("81113.63306"), "RUB") == "81113.63 RUB");
}

TEST_CASE("Printer lists sales with their fragments", "[output]") {
    std::ostringstream out;
    taxlots::ReportPrinter printer("RUB", out, false);
    printer.render(sample_report());
    const std::string text = out.str();

    CHECK_FALSE(contains(text, "\033["));
    CHECK(contains(text, "All trades:\n    2018-11-08 buy 5 VOO $257.72\n"));
    CHECK(contains(text, "Sales (2):\n2019-01-15: VOO 7x$240.10\n"));
    CHECK(contains(text, "    Income: $1680.70 // 112606.90 RUB (7 * 240.1 * 67)\n"));
    CHECK(contains(text, "        * 2018-11-08 buy 5 VOO $257.72 (lot #1) // 83759.00 RUB (5 * 257.72 * 65)\n"));
    CHECK(contains(text, "        * 2018-11-30 buy 2 VOO $252.33 (lot #2) // 33559.89 RUB (2 * 252.33 * 66.5)\n"));
    CHECK(contains(text, "    Profit: -$112.56 // -4711.99 RUB (112606.90 - 117318.89)\n"));
    CHECK(contains(text, "Buyings left:\n    2018-11-30 buy 5 VOO $252.33\n"));
}

TEST_CASE("Printer shows dividends, orphans and totals", "[output]") {
    std::ostringstream out;
    taxlots::ReportPrinter printer("RUB", out, false);
    printer.render(sample_report());
    const std::string text = out.str();

    CHECK(contains(text, "Dividends (1):\n"));
    CHECK(contains(text, "    Dividends from VOO on 15.01.2019, sum: $50.00, withheld: $10.00, net: $40.00\n"));
    CHECK(contains(text, "        In RUB at 67: 3350.00 RUB, withheld 670.00 RUB\n"));
    CHECK(contains(text, "Withholdings without dividend (1):\n    20.01.2019 VOO -$1.50"));
    CHECK(contains(text, "Totals:\n"));
    CHECK(contains(text, "$3672.70 // 244078.90 RUB\n"));
    CHECK(contains(text, "-$139.20 // -7479.55 RUB\n"));
}

TEST_CASE("Printer header names the tax year", "[output]") {
    std::ostringstream out;
    taxlots::ReportPrinter printer("RUB", out, false);
    printer.render(sample_report(2018));
    const std::string text = out.str();

    CHECK(contains(text, "TAX REPORT 2018 (reporting currency RUB)"));
    CHECK(contains(text, "Sales (0):\n"));
    CHECK(contains(text, "Dividends (0):\n"));
    CHECK_FALSE(contains(text, "Withholdings without dividend"));
}

TEST_CASE("Colored output wraps headings in escape codes", "[output]") {
    std::ostringstream out;
    taxlots::ReportPrinter printer("RUB", out, true);
    printer.render(sample_report());
    CHECK(contains(out.str(), "\033[1mAll trades:\033[0m"));
}

TEST_CASE("JSON export keeps exact amounts", "[output]") {
    const auto json = taxlots::report_to_json(sample_report(), "USD", "RUB");

    CHECK(json["tradeCurrency"] == "USD");
    CHECK(json["reportingCurrency"] == "RUB");
    CHECK(json["taxYear"].is_null());

    REQUIRE(json["sales"].size() == 2);
    const auto& sale = json["sales"][0];
    CHECK(sale["id"] == 3);
    CHECK(sale["proceeds"]["converted"] == "112606.9");
    CHECK(sale["profitConverted"] == "-4711.99");
    REQUIRE(sale["soldBuyings"].size() == 2);
    CHECK(sale["soldBuyings"][1]["buyId"] == 2);
    CHECK(sale["soldBuyings"][1]["quantity"] == 2);
    CHECK(sale["soldBuyings"][1]["cost"]["rate"] == "66.5");

    REQUIRE(json["remainingBuys"].size() == 1);
    CHECK(json["remainingBuys"][0]["quantity"] == 5);

    REQUIRE(json["dividends"].size() == 1);
    CHECK(json["dividends"][0]["withheld"] == "10");
    CHECK(json["dividends"][0]["net"] == "40");
    CHECK(json["dividends"][0]["withholdings"].size() == 2);
    CHECK(json["orphanWithholdings"].size() == 1);

    CHECK(json["totals"]["proceedsConverted"] == "244078.9");
    CHECK(json["totals"]["withheldConverted"] == "670");
}

TEST_CASE("JSON export writes the file", "[output]") {
    const auto dir = std::filesystem::temp_directory_path() / "taxlots_export_test";
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "report.json";

    taxlots::export_report_json(sample_report(2019), "USD", "RUB", path);

    std::ifstream input(path);
    REQUIRE(input.good());
    const auto json = nlohmann::json::parse(input);
    CHECK(json["taxYear"] == 2019);
    CHECK(json["sales"].size() == 2);

    std::filesystem::remove_all(dir);
}
