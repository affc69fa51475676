#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ibkr {

std::string trim(std::string value);

// Splits one CSV line; double-quoted fields may contain commas and "" escapes.
std::vector<std::string> split_csv_line(const std::string& line);

// "62,9471" -> "62.9471", "1 234,5" -> "1234.5"
std::string normalize_decimal(const std::string& value);

// Signed whole-share quantity, thousands separators allowed ("-1,000").
// Throws taxlots::InvalidRecord.
int64_t parse_quantity(const std::string& value);

std::string to_lower_copy(std::string value);

} // namespace ibkr
