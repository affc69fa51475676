#pragma once

#include "taxlots/exchange_rate_table.hpp"

#include <filesystem>
#include <iosfwd>
#include <vector>

namespace ibkr {

// Daily rate feed, one "DD.MM.YYYY<TAB>rate" per line. The rate may use a
// decimal comma and digit-group spaces ("1 062,9471"). Blank lines are skipped.
// Throws taxlots::InvalidRecord naming the offending line.
std::vector<taxlots::RateSample> read_rate_feed(std::istream& input);

std::vector<taxlots::RateSample> load_rate_feed(const std::filesystem::path& path);

} // namespace ibkr
