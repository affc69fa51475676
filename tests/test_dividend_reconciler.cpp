#include "taxlots/dividend_reconciler.hpp"
#include "taxlots/errors.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using taxlots::CalendarDate;
using taxlots::Decimal;
using taxlots::MoneyCategory;
using taxlots::MoneyEvent;

namespace {

MoneyEvent dividend(const char* iso, const char* symbol, const char* amount) {
    return taxlots::make_money_event(CalendarDate::parse_iso(iso), symbol,
                                     std::string(symbol) + " Cash Dividend",
                                     Decimal::parse(amount), MoneyCategory::Dividend);
}

MoneyEvent withholding(const char* iso, const char* symbol, const char* amount) {
    return taxlots::make_money_event(CalendarDate::parse_iso(iso), symbol,
                                     std::string(symbol) + " US Tax",
                                     Decimal::parse(amount), MoneyCategory::Withholding);
}

} // namespace

TEST_CASE("Withholdings on the same day are summed into the dividend", "[dividends]") {
    const auto result = taxlots::reconcile_dividends(
        {dividend("2019-03-27", "VOO", "50")},
        {withholding("2019-03-27", "VOO", "-7"), withholding("2019-03-27", "VOO", "-3")});

    REQUIRE(result.records.size() == 1);
    const auto& record = result.records[0];
    CHECK(record.withholdings.size() == 2);
    CHECK(record.gross() == Decimal(50));
    CHECK(record.withheld() == Decimal(10));
    CHECK(record.net() == Decimal(40));
    CHECK(result.orphan_withholdings.empty());
}

TEST_CASE("Dividend without withholding keeps its full amount", "[dividends]") {
    const auto result = taxlots::reconcile_dividends({dividend("2019-06-25", "BND", "12.34")}, {});
    REQUIRE(result.records.size() == 1);
    CHECK(result.records[0].withholdings.empty());
    CHECK(result.records[0].withheld().is_zero());
    CHECK(result.records[0].net() == Decimal::parse("12.34"));
}

TEST_CASE("Withholdings only join on exact symbol and date", "[dividends]") {
    const auto result = taxlots::reconcile_dividends(
        {dividend("2019-03-27", "VOO", "50"), dividend("2019-03-27", "VXUS", "20")},
        {
            withholding("2019-03-27", "VXUS", "-2"),
            withholding("2019-03-28", "VOO", "-5"),
            withholding("2019-03-27", "BND", "-1"),
        });

    REQUIRE(result.records.size() == 2);
    CHECK(result.records[0].withholdings.empty());
    REQUIRE(result.records[1].withholdings.size() == 1);
    CHECK(result.records[1].net() == Decimal(18));

    REQUIRE(result.orphan_withholdings.size() == 2);
    CHECK(result.orphan_withholdings[0].symbol == "VOO");
    CHECK(result.orphan_withholdings[0].date.to_iso() == "2019-03-28");
    CHECK(result.orphan_withholdings[1].symbol == "BND");
}

TEST_CASE("Withholdings attach to the first of duplicate dividends", "[dividends]") {
    const auto result = taxlots::reconcile_dividends(
        {dividend("2019-12-24", "VOO", "30"), dividend("2019-12-24", "VOO", "5")},
        {withholding("2019-12-24", "VOO", "-3")});

    REQUIRE(result.records.size() == 2);
    CHECK(result.records[0].withholdings.size() == 1);
    CHECK(result.records[0].net() == Decimal(27));
    CHECK(result.records[1].withholdings.empty());
    CHECK(result.records[1].net() == Decimal(5));
}

TEST_CASE("Every withholding lands exactly once", "[dividends]") {
    const std::vector<MoneyEvent> withholdings = {
        withholding("2019-03-27", "VOO", "-1"),
        withholding("2019-03-27", "VOO", "-2"),
        withholding("2019-06-26", "VOO", "-3"),
        withholding("2019-06-27", "BND", "-4"),
    };
    const auto result = taxlots::reconcile_dividends(
        {dividend("2019-03-27", "VOO", "10"), dividend("2019-06-26", "VOO", "11")}, withholdings);

    Decimal total;
    std::size_t count = result.orphan_withholdings.size();
    for (const auto& record : result.records) {
        count += record.withholdings.size();
        total += record.withheld();
    }
    for (const auto& orphan : result.orphan_withholdings) {
        total -= orphan.amount;
    }
    CHECK(count == withholdings.size());
    CHECK(total == Decimal(10));
}

TEST_CASE("Money events require a symbol", "[dividends]") {
    CHECK_THROWS_AS(taxlots::make_money_event(CalendarDate::from_ymd(2019, 1, 1), "", "", Decimal(1),
                                              MoneyCategory::Dividend),
                    taxlots::InvalidRecord);
}

TEST_CASE("Withheld amount is the magnitude of charges net of refunds", "[dividends]") {
    const auto partial_refund = taxlots::reconcile_dividends(
        {dividend("2019-09-30", "VOO", "40")},
        {withholding("2019-09-30", "VOO", "-6"), withholding("2019-09-30", "VOO", "2")});
    REQUIRE(partial_refund.records.size() == 1);
    CHECK(partial_refund.records[0].withheld() == Decimal(4));
    CHECK(partial_refund.records[0].net() == Decimal(36));

    const auto over_refund = taxlots::reconcile_dividends(
        {dividend("2019-12-20", "VOO", "40")},
        {withholding("2019-12-20", "VOO", "-3"), withholding("2019-12-20", "VOO", "5")});
    REQUIRE(over_refund.records.size() == 1);
    CHECK(over_refund.records[0].withheld() == Decimal(2));
    CHECK(over_refund.records[0].net() == Decimal(38));
}
