#include "taxlots/report_export.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace taxlots {

namespace {

nlohmann::json trade_to_json(const Trade& trade) {
    nlohmann::json json;
    json["id"] = trade.id;
    json["time"] = format_timestamp(trade.timestamp);
    json["side"] = to_string(trade.side);
    json["symbol"] = trade.symbol;
    json["quantity"] = trade.quantity;
    json["price"] = trade.unit_price.to_string();
    return json;
}

nlohmann::json leg_to_json(const ConvertedAmount& leg) {
    nlohmann::json json;
    json["date"] = leg.date.to_iso();
    json["amount"] = leg.amount.to_string();
    json["rate"] = leg.rate.to_string();
    json["converted"] = leg.converted.to_string();
    return json;
}

nlohmann::json money_event_to_json(const MoneyEvent& event) {
    nlohmann::json json;
    json["date"] = event.date.to_iso();
    json["symbol"] = event.symbol;
    json["description"] = event.description;
    json["amount"] = event.amount.to_string();
    return json;
}

} // namespace

nlohmann::json report_to_json(const TaxReport& report,
                              const std::string& trade_currency,
                              const std::string& reporting_currency) {
    nlohmann::json json;
    json["tradeCurrency"] = trade_currency;
    json["reportingCurrency"] = reporting_currency;
    json["taxYear"] = report.tax_year ? nlohmann::json(*report.tax_year) : nlohmann::json(nullptr);

    json["sales"] = nlohmann::json::array();
    for (const auto& gain : report.sales) {
        nlohmann::json sale = trade_to_json(gain.match.sale);
        sale["proceeds"] = leg_to_json(gain.proceeds);
        sale["costBasis"] = gain.cost_basis.to_string();
        sale["costBasisConverted"] = gain.cost_basis_converted.to_string();
        sale["profit"] = gain.profit().to_string();
        sale["profitConverted"] = gain.profit_converted().to_string();

        sale["soldBuyings"] = nlohmann::json::array();
        for (const auto& cost : gain.costs) {
            nlohmann::json fragment;
            fragment["buyId"] = cost.fragment.buy_id;
            fragment["time"] = format_timestamp(cost.fragment.timestamp);
            fragment["quantity"] = cost.fragment.quantity;
            fragment["price"] = cost.fragment.unit_price.to_string();
            fragment["cost"] = leg_to_json(cost.cost);
            sale["soldBuyings"].push_back(std::move(fragment));
        }
        json["sales"].push_back(std::move(sale));
    }

    json["remainingBuys"] = nlohmann::json::array();
    for (const auto& lot : report.remaining_buys) {
        json["remainingBuys"].push_back(trade_to_json(lot));
    }

    json["dividends"] = nlohmann::json::array();
    for (const auto& income : report.dividends) {
        nlohmann::json dividend = money_event_to_json(income.record.dividend);
        dividend["withheld"] = income.record.withheld().to_string();
        dividend["net"] = income.record.net().to_string();
        dividend["rate"] = income.rate.to_string();
        dividend["grossConverted"] = income.gross_converted.to_string();
        dividend["withheldConverted"] = income.withheld_converted.to_string();
        dividend["withholdings"] = nlohmann::json::array();
        for (const auto& w : income.record.withholdings) {
            dividend["withholdings"].push_back(money_event_to_json(w));
        }
        json["dividends"].push_back(std::move(dividend));
    }

    json["orphanWithholdings"] = nlohmann::json::array();
    for (const auto& w : report.orphan_withholdings) {
        json["orphanWithholdings"].push_back(money_event_to_json(w));
    }

    const ReportTotals& t = report.totals;
    json["totals"] = {
        {"proceeds", t.proceeds.to_string()},
        {"proceedsConverted", t.proceeds_converted.to_string()},
        {"costBasis", t.cost_basis.to_string()},
        {"costBasisConverted", t.cost_basis_converted.to_string()},
        {"profit", t.profit().to_string()},
        {"profitConverted", t.profit_converted().to_string()},
        {"dividends", t.dividends.to_string()},
        {"dividendsConverted", t.dividends_converted.to_string()},
        {"withheld", t.withheld.to_string()},
        {"withheldConverted", t.withheld_converted.to_string()},
    };

    return json;
}

void export_report_json(const TaxReport& report,
                        const std::string& trade_currency,
                        const std::string& reporting_currency,
                        const std::filesystem::path& path) {
    const auto dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }

    std::ofstream output(path);
    if (!output.good()) {
        throw std::runtime_error("Failed to write report to " + path.string());
    }
    output << report_to_json(report, trade_currency, reporting_currency).dump(2) << '\n';
    std::cout << "[Report] Exported " << report.sales.size() << " sales and " << report.dividends.size()
              << " dividends to " << path.string() << std::endl;
}

} // namespace taxlots
