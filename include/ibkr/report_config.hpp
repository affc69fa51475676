#pragma once

#include "ibkr/statement_loader.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ibkr {

struct ReportConfig {
    std::string reports_dir = "ib_reports";
    std::string rates_path = "data/usd_rub.dat";
    std::string trade_currency = "USD";
    std::string reporting_currency = "RUB";
    std::optional<int> tax_year;
    std::string export_path;       // JSON export, disabled when empty
    std::vector<SplitAdjustment> split_adjustments;
};

// Reads fields present in `json` on top of the defaults. Throws
// std::runtime_error naming the key whose value has the wrong type.
ReportConfig config_from_json(const nlohmann::json& json);

// Loads a JSON config file; a missing file yields the defaults.
ReportConfig load_report_config(const std::filesystem::path& path);

// TAXLOTS_REPORTS_DIR, TAXLOTS_RATES_PATH, TAXLOTS_TAX_YEAR, TAXLOTS_EXPORT_PATH
void apply_env_overrides(ReportConfig& config);

// KEY=VALUE lines into the process environment; '#' comments, optional quotes.
void load_env_file(const std::filesystem::path& path);

} // namespace ibkr
