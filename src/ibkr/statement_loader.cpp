#include "ibkr/statement_loader.hpp"
#include "ibkr/util.hpp"
#include "taxlots/errors.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ibkr {

namespace {

// Fractional digits kept for split-adjusted prices.
constexpr unsigned kSplitPriceDigits = 10;

// Execution rows; ClosedLot and similar rows restate lots already covered by them.
bool is_execution_row(const ReportRow& row) {
    const auto it = row.find("DataDiscriminator");
    if (it == row.end()) {
        return true;
    }
    const std::string kind = trim(it->second);
    return kind == "Order" || kind == "Trade";
}

taxlots::Decimal parse_decimal_field(const ReportRow& row, const std::string& column) {
    const std::string value = trim(field(row, column));
    try {
        return taxlots::Decimal::parse(value);
    } catch (const std::invalid_argument&) {
        throw taxlots::InvalidRecord("Unparseable " + column, value);
    }
}

void apply_splits(taxlots::Trade& trade, const std::vector<SplitAdjustment>& splits) {
    for (const auto& split : splits) {
        if (split.symbol != trade.symbol || !(trade.date() < split.before)) {
            continue;
        }
        if (split.ratio <= 0) {
            throw taxlots::InvalidRecord("Split ratio must be positive", split.symbol);
        }
        trade.quantity *= split.ratio;
        trade.unit_price = trade.unit_price.divide(split.ratio, kSplitPriceDigits);
    }
}

} // namespace

std::optional<taxlots::Trade> trade_from_row(const ReportRow& row, const std::vector<SplitAdjustment>& splits) {
    const std::string& category = field(row, "Asset Category");
    if (!is_execution_row(row) || (!category.empty() && category != "Stocks")) {
        return std::nullopt;
    }

    const std::string symbol = trim(field(row, "Symbol"));
    const auto timestamp = taxlots::parse_timestamp(trim(field(row, "Date/Time")));
    const int64_t signed_quantity = parse_quantity(field(row, "Quantity"));
    const auto price = parse_decimal_field(row, "T. Price");

    const auto side = signed_quantity < 0 ? taxlots::TradeSide::Sell : taxlots::TradeSide::Buy;
    const int64_t quantity = signed_quantity < 0 ? -signed_quantity : signed_quantity;

    auto trade = taxlots::make_trade(0, timestamp, side, symbol, quantity, price);
    apply_splits(trade, splits);
    return trade;
}

taxlots::MoneyEvent money_event_from_row(const ReportRow& row, taxlots::MoneyCategory category) {
    const std::string description = trim(field(row, "Description"));
    const std::string symbol = trim(description.substr(0, description.find('(')));
    const auto date = taxlots::CalendarDate::parse_iso(trim(field(row, "Date")));
    const auto amount = parse_decimal_field(row, "Amount");
    return taxlots::make_money_event(date, symbol, description, amount, category);
}

void append_statement(const ActivityReport& report,
                      const std::vector<SplitAdjustment>& splits,
                      Statement& statement) {
    if (const auto trades = report.find("Trades"); trades != report.end()) {
        for (const auto& row : trades->second.rows) {
            auto trade = trade_from_row(row, splits);
            if (!trade) {
                std::cout << "[Statement] Skipping " << field(row, "DataDiscriminator") << ' '
                          << field(row, "Asset Category") << " row of " << field(row, "Symbol") << std::endl;
                continue;
            }
            statement.trades.push_back(std::move(*trade));
        }
    }

    if (const auto dividends = report.find("Dividends"); dividends != report.end()) {
        for (const auto& row : dividends->second.rows) {
            statement.dividends.push_back(money_event_from_row(row, taxlots::MoneyCategory::Dividend));
        }
    }

    if (const auto withholdings = report.find("Withholding Tax"); withholdings != report.end()) {
        for (const auto& row : withholdings->second.rows) {
            statement.withholdings.push_back(money_event_from_row(row, taxlots::MoneyCategory::Withholding));
        }
    }
}

void finalize_statement(Statement& statement) {
    std::stable_sort(statement.trades.begin(), statement.trades.end(),
                     [](const taxlots::Trade& a, const taxlots::Trade& b) {
                         if (a.timestamp != b.timestamp) {
                             return a.timestamp < b.timestamp;
                         }
                         return a.symbol < b.symbol;
                     });

    const auto by_date = [](const taxlots::MoneyEvent& a, const taxlots::MoneyEvent& b) {
        if (a.date != b.date) {
            return a.date < b.date;
        }
        return a.symbol < b.symbol;
    };
    std::stable_sort(statement.dividends.begin(), statement.dividends.end(), by_date);
    std::stable_sort(statement.withholdings.begin(), statement.withholdings.end(), by_date);

    long long next_id = 1;
    for (auto& trade : statement.trades) {
        trade.id = next_id++;
    }
}

Statement load_statement(std::istream& input, const std::vector<SplitAdjustment>& splits) {
    Statement statement;
    append_statement(read_activity_report(input), splits, statement);
    finalize_statement(statement);
    return statement;
}

Statement load_statement_directory(const std::filesystem::path& directory,
                                   const std::vector<SplitAdjustment>& splits) {
    if (!std::filesystem::is_directory(directory)) {
        throw std::runtime_error("Statement directory not found: " + directory.string());
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (entry.is_regular_file() && to_lower_copy(entry.path().extension().string()) == ".csv") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    Statement statement;
    for (const auto& path : files) {
        std::ifstream input(path);
        if (!input.good()) {
            throw std::runtime_error("Failed to open statement " + path.string());
        }
        std::cout << "[Statement] Reading " << path.filename().string() << std::endl;
        try {
            append_statement(read_activity_report(input), splits, statement);
        } catch (const taxlots::InvalidRecord& ex) {
            throw taxlots::InvalidRecord(ex.what(), path.filename().string());
        }
    }

    finalize_statement(statement);
    std::cout << "[Statement] Loaded " << statement.trades.size() << " trades, "
              << statement.dividends.size() << " dividends, "
              << statement.withholdings.size() << " withholdings from "
              << files.size() << " file(s)" << std::endl;
    return statement;
}

} // namespace ibkr
