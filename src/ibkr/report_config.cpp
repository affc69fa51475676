#include "ibkr/report_config.hpp"
#include "ibkr/util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ibkr {

namespace {

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    try {
        target = j[key].get<T>();
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error(std::string("Config key '") + key + "' has wrong type: " + ex.what());
    }
}

SplitAdjustment split_from_json(const nlohmann::json& j) {
    SplitAdjustment split;
    std::string before;
    read_optional(j, "symbol", split.symbol);
    read_optional(j, "before", before);
    read_optional(j, "ratio", split.ratio);
    if (split.symbol.empty() || before.empty() || split.ratio <= 0) {
        throw std::runtime_error("Config split_adjustments entry needs symbol, before and a positive ratio");
    }
    split.before = taxlots::CalendarDate::parse_iso(before);
    return split;
}

} // namespace

ReportConfig config_from_json(const nlohmann::json& json) {
    ReportConfig config;
    if (!json.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    read_optional(json, "reports_dir", config.reports_dir);
    read_optional(json, "rates_path", config.rates_path);
    read_optional(json, "trade_currency", config.trade_currency);
    read_optional(json, "reporting_currency", config.reporting_currency);
    read_optional(json, "export_path", config.export_path);

    if (json.contains("tax_year") && !json["tax_year"].is_null()) {
        int year = 0;
        read_optional(json, "tax_year", year);
        config.tax_year = year;
    }

    if (json.contains("split_adjustments")) {
        const auto& splits = json["split_adjustments"];
        if (!splits.is_array()) {
            throw std::runtime_error("Config key 'split_adjustments' must be an array");
        }
        for (const auto& entry : splits) {
            config.split_adjustments.push_back(split_from_json(entry));
        }
    }

    return config;
}

ReportConfig load_report_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.good()) {
        std::cout << "[Config] " << path.string() << " not found, using defaults" << std::endl;
        return ReportConfig{};
    }

    try {
        return config_from_json(nlohmann::json::parse(input));
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Failed to parse config " + path.string() + ": " + ex.what());
    }
}

void apply_env_overrides(ReportConfig& config) {
    if (const char* value = std::getenv("TAXLOTS_REPORTS_DIR")) {
        config.reports_dir = value;
    }
    if (const char* value = std::getenv("TAXLOTS_RATES_PATH")) {
        config.rates_path = value;
    }
    if (const char* value = std::getenv("TAXLOTS_EXPORT_PATH")) {
        config.export_path = value;
    }
    if (const char* value = std::getenv("TAXLOTS_TAX_YEAR")) {
        const std::string year = trim(value);
        if (year.empty()) {
            config.tax_year.reset();
        } else {
            try {
                config.tax_year = std::stoi(year);
            } catch (const std::exception&) {
                throw std::runtime_error("TAXLOTS_TAX_YEAR is not a year: " + year);
            }
        }
    }
}

void load_env_file(const std::filesystem::path& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

} // namespace ibkr
