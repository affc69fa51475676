#include "ibkr/report_config.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

TEST_CASE("Empty config keeps the defaults", "[config]") {
    const auto config = ibkr::config_from_json(nlohmann::json::object());
    CHECK(config.reports_dir == "ib_reports");
    CHECK(config.rates_path == "data/usd_rub.dat");
    CHECK(config.trade_currency == "USD");
    CHECK(config.reporting_currency == "RUB");
    CHECK_FALSE(config.tax_year.has_value());
    CHECK(config.export_path.empty());
    CHECK(config.split_adjustments.empty());
}

TEST_CASE("Config fields override the defaults", "[config]") {
    const auto config = ibkr::config_from_json(nlohmann::json::parse(R"({
        "reports_dir": "statements",
        "rates_path": "rates/usd.dat",
        "reporting_currency": "EUR",
        "tax_year": 2019,
        "export_path": "out/report.json",
        "split_adjustments": [{"symbol": "AAPL", "before": "2020-08-31", "ratio": 4}]
    })"));

    CHECK(config.reports_dir == "statements");
    CHECK(config.rates_path == "rates/usd.dat");
    CHECK(config.trade_currency == "USD");
    CHECK(config.reporting_currency == "EUR");
    REQUIRE(config.tax_year.has_value());
    CHECK(*config.tax_year == 2019);
    CHECK(config.export_path == "out/report.json");
    REQUIRE(config.split_adjustments.size() == 1);
    CHECK(config.split_adjustments[0].symbol == "AAPL");
    CHECK(config.split_adjustments[0].before.to_iso() == "2020-08-31");
    CHECK(config.split_adjustments[0].ratio == 4);
}

TEST_CASE("Config with wrong types is rejected", "[config]") {
    CHECK_THROWS_AS(ibkr::config_from_json(nlohmann::json::array()), std::runtime_error);
    CHECK_THROWS_AS(ibkr::config_from_json(nlohmann::json::parse(R"({"tax_year": "last"})")),
                    std::runtime_error);
    CHECK_THROWS_AS(ibkr::config_from_json(nlohmann::json::parse(R"({"split_adjustments": {}})")),
                    std::runtime_error);
    CHECK_THROWS_AS(ibkr::config_from_json(nlohmann::json::parse(
                        R"({"split_adjustments": [{"symbol": "AAPL", "before": "2020-08-31", "ratio": 0}]})")),
                    std::runtime_error);
}

TEST_CASE("Config file loading", "[config]") {
    const auto missing = ibkr::load_report_config("/nonexistent/taxlots.json");
    CHECK(missing.reports_dir == "ib_reports");

    const auto dir = std::filesystem::temp_directory_path();
    const auto good = dir / "taxlots_config_test.json";
    {
        std::ofstream out(good);
        out << R"({"reports_dir": "from_file", "tax_year": null})";
    }
    const auto loaded = ibkr::load_report_config(good);
    CHECK(loaded.reports_dir == "from_file");
    CHECK_FALSE(loaded.tax_year.has_value());

    const auto bad = dir / "taxlots_config_bad.json";
    {
        std::ofstream out(bad);
        out << "{ not json";
    }
    CHECK_THROWS_AS(ibkr::load_report_config(bad), std::runtime_error);

    std::filesystem::remove(good);
    std::filesystem::remove(bad);
}

TEST_CASE("Environment overrides the config", "[config]") {
    const auto env_path = std::filesystem::temp_directory_path() / "taxlots_config_test.env";
    {
        std::ofstream out(env_path);
        out << "# local overrides\n"
            << "TAXLOTS_REPORTS_DIR = \"/data/ib\"\n"
            << "TAXLOTS_TAX_YEAR=2020\n"
            << "not a setting\n";
    }
    ibkr::load_env_file(env_path);

    ibkr::ReportConfig config;
    ibkr::apply_env_overrides(config);
    CHECK(config.reports_dir == "/data/ib");
    REQUIRE(config.tax_year.has_value());
    CHECK(*config.tax_year == 2020);

    setenv("TAXLOTS_TAX_YEAR", "", 1);
    ibkr::apply_env_overrides(config);
    CHECK_FALSE(config.tax_year.has_value());

    setenv("TAXLOTS_TAX_YEAR", "soon", 1);
    CHECK_THROWS_AS(ibkr::apply_env_overrides(config), std::runtime_error);

    unsetenv("TAXLOTS_TAX_YEAR");
    unsetenv("TAXLOTS_REPORTS_DIR");
    std::filesystem::remove(env_path);
}
