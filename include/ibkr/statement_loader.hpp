#pragma once

#include "ibkr/activity_report.hpp"
#include "taxlots/records.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ibkr {

// Forward stock split: trades of `symbol` dated before `before` are restated
// in post-split shares (quantity * ratio, price / ratio).
struct SplitAdjustment {
    std::string symbol;
    taxlots::CalendarDate before;
    int64_t ratio = 1;
};

// Normalized records of one or more activity statements.
struct Statement {
    std::vector<taxlots::Trade> trades;
    std::vector<taxlots::MoneyEvent> dividends;
    std::vector<taxlots::MoneyEvent> withholdings;
};

// Builds a trade from a "Trades" data row. Negative Quantity is a sale.
// Returns nullopt for non-equity rows (forex, options, ...) and for rows whose
// DataDiscriminator is not Order or Trade (ClosedLot, ...).
// Throws taxlots::InvalidRecord.
std::optional<taxlots::Trade> trade_from_row(const ReportRow& row,
                                             const std::vector<SplitAdjustment>& splits = {});

// Builds a dividend or withholding from its data row; the symbol is the part
// of Description before the first '('. Throws taxlots::InvalidRecord.
taxlots::MoneyEvent money_event_from_row(const ReportRow& row, taxlots::MoneyCategory category);

// Appends the records of one statement to `statement`.
void append_statement(const ActivityReport& report,
                      const std::vector<SplitAdjustment>& splits,
                      Statement& statement);

Statement load_statement(std::istream& input, const std::vector<SplitAdjustment>& splits = {});

// Loads every *.csv in `directory` (in file-name order), then sorts each
// record list by (time, symbol) and numbers trades in that order.
Statement load_statement_directory(const std::filesystem::path& directory,
                                   const std::vector<SplitAdjustment>& splits = {});

// Sorts records chronologically (stable) and assigns trade ids 1..n.
void finalize_statement(Statement& statement);

} // namespace ibkr
