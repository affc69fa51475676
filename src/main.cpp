#include "ibkr/rate_feed.hpp"
#include "ibkr/report_config.hpp"
#include "ibkr/statement_loader.hpp"
#include "taxlots/errors.hpp"
#include "taxlots/exchange_rate_table.hpp"
#include "taxlots/gains_report.hpp"
#include "taxlots/report_export.hpp"
#include "taxlots/report_printer.hpp"

#include <unistd.h>

#include <exception>
#include <iostream>
#include <string>

namespace {

int run(const std::string& config_path) {
    ibkr::load_env_file(".env");

    auto config = ibkr::load_report_config(config_path);
    ibkr::apply_env_overrides(config);

    std::cout << "[Config] statements=" << config.reports_dir
              << " rates=" << config.rates_path
              << " currencies=" << config.trade_currency << "->" << config.reporting_currency;
    if (config.tax_year) {
        std::cout << " year=" << *config.tax_year;
    }
    std::cout << std::endl;

    const auto statement = ibkr::load_statement_directory(config.reports_dir, config.split_adjustments);
    const auto rates = taxlots::ExchangeRateTable::build(ibkr::load_rate_feed(config.rates_path));

    const auto report = taxlots::build_tax_report(
        statement.trades, statement.dividends, statement.withholdings, rates, config.tax_year);

    taxlots::ReportPrinter printer{config.reporting_currency, std::cout, isatty(STDOUT_FILENO) != 0};
    printer.render(report);

    if (!config.export_path.empty()) {
        taxlots::export_report_json(report, config.trade_currency, config.reporting_currency, config.export_path);
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "taxlots.json";

    try {
        return run(config_path);
    } catch (const taxlots::InsufficientLots& ex) {
        std::cerr << "[Error] " << ex.what() << "\n"
                  << "        symbol=" << ex.symbol() << " shortfall=" << ex.shortfall()
                  << " sale=" << taxlots::format_timestamp(ex.sale_time()) << "\n"
                  << "        Check for missing statements or transfer-in records." << std::endl;
    } catch (const taxlots::RateNotFound& ex) {
        std::cerr << "[Error] " << ex.what() << "\n"
                  << "        Extend the rate feed to cover " << ex.date().to_dmy() << "." << std::endl;
    } catch (const taxlots::InvalidRecord& ex) {
        std::cerr << "[Error] Invalid record: " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Error] " << ex.what() << std::endl;
    }
    return 1;
}
