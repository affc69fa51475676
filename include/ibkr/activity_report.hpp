#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace ibkr {

// One data row keyed by the column names of its section header.
using ReportRow = std::map<std::string, std::string>;

struct ReportSection {
    std::vector<std::string> header;
    std::vector<ReportRow> rows;
};

// Sections of an activity statement by name ("Trades", "Dividends", ...).
using ActivityReport = std::map<std::string, ReportSection>;

// Reads a sectioned activity statement CSV:
//   Trades,Header,DataDiscriminator,...,Symbol,Date/Time,Quantity,T. Price,...
//   Trades,Data,Order,...,VOO,"2018-11-08, 09:33:38",5,257.72,...
// A repeated header for a section starts a new column layout for the rows
// that follow it; rows other than Header/Data are ignored. Per-currency
// "Total" rows of Dividends and Withholding Tax are dropped.
ActivityReport read_activity_report(std::istream& input);

// Field of a row, or an empty string when the column is absent.
const std::string& field(const ReportRow& row, const std::string& column);

} // namespace ibkr
