#include "ibkr/rate_feed.hpp"
#include "ibkr/util.hpp"
#include "taxlots/errors.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace ibkr {

std::vector<taxlots::RateSample> read_rate_feed(std::istream& input) {
    std::vector<taxlots::RateSample> samples;

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) {
            continue;
        }

        const std::string context = "line " + std::to_string(line_number) + ": '" + trim(line) + "'";
        const auto tab = line.find('\t');
        if (tab == std::string::npos) {
            throw taxlots::InvalidRecord("Rate line without tab separator", context);
        }

        taxlots::RateSample sample;
        try {
            sample.date = taxlots::CalendarDate::parse_dmy(trim(line.substr(0, tab)));
            sample.rate = taxlots::Decimal::parse(normalize_decimal(line.substr(tab + 1)));
        } catch (const taxlots::InvalidRecord&) {
            throw taxlots::InvalidRecord("Unparseable rate date", context);
        } catch (const std::invalid_argument&) {
            throw taxlots::InvalidRecord("Unparseable rate value", context);
        }

        if (sample.rate.sign() <= 0) {
            throw taxlots::InvalidRecord("Exchange rate must be positive", context);
        }
        samples.push_back(std::move(sample));
    }

    return samples;
}

std::vector<taxlots::RateSample> load_rate_feed(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.good()) {
        throw std::runtime_error("Failed to open rate feed " + path.string());
    }

    auto samples = read_rate_feed(input);
    if (!samples.empty()) {
        std::cout << "[Rates] Loaded " << samples.size() << " samples from " << path.string()
                  << " (" << samples.front().date.to_iso() << " .. " << samples.back().date.to_iso() << ")"
                  << std::endl;
    } else {
        std::cerr << "[Rates] WARNING: rate feed " << path.string() << " is empty" << std::endl;
    }
    return samples;
}

} // namespace ibkr
