#include "ibkr/activity_report.hpp"
#include "ibkr/util.hpp"

#include <istream>
#include <utility>

namespace ibkr {

namespace {

bool drops_total_rows(const std::string& section) {
    return section == "Dividends" || section == "Withholding Tax";
}

} // namespace

ActivityReport read_activity_report(std::istream& input) {
    ActivityReport report;

    std::string line;
    while (std::getline(input, line)) {
        // UTF-8 byte order mark
        if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (trim(line).empty()) {
            continue;
        }

        const auto fields = split_csv_line(line);
        if (fields.size() < 2) {
            continue;
        }

        const std::string& name = fields[0];
        const std::string& kind = fields[1];

        if (kind == "Header") {
            report[name].header = fields;
            continue;
        }
        if (kind != "Data") {
            continue;
        }

        auto section = report.find(name);
        if (section == report.end()) {
            // Data before any header for this section.
            continue;
        }

        ReportRow row;
        const auto& header = section->second.header;
        for (std::size_t i = 0; i < header.size() && i < fields.size(); ++i) {
            row[header[i]] = fields[i];
        }

        if (drops_total_rows(name) && field(row, "Currency") == "Total") {
            continue;
        }
        section->second.rows.push_back(std::move(row));
    }

    return report;
}

const std::string& field(const ReportRow& row, const std::string& column) {
    static const std::string kEmpty;
    const auto it = row.find(column);
    return it == row.end() ? kEmpty : it->second;
}

} // namespace ibkr
