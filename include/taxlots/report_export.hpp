#pragma once

#include "taxlots/gains_report.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace taxlots {

// Monetary values are exported as exact decimal strings.
nlohmann::json report_to_json(const TaxReport& report,
                              const std::string& trade_currency,
                              const std::string& reporting_currency);

void export_report_json(const TaxReport& report,
                        const std::string& trade_currency,
                        const std::string& reporting_currency,
                        const std::filesystem::path& path);

} // namespace taxlots
