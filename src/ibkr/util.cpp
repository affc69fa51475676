#include "ibkr/util.hpp"
#include "taxlots/errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

namespace ibkr {

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else if (c != '\r' && c != '\n') {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::string normalize_decimal(const std::string& value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isspace(c)) {
            continue;
        }
        normalized.push_back(c == ',' ? '.' : static_cast<char>(c));
    }
    return normalized;
}

int64_t parse_quantity(const std::string& value) {
    const std::string text = trim(value);
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t result = 0;
    bool any_digit = false;
    for (; pos < text.size(); ++pos) {
        const unsigned char c = static_cast<unsigned char>(text[pos]);
        if (c == ',') {
            continue;
        }
        if (!std::isdigit(c)) {
            throw taxlots::InvalidRecord("Quantity is not a whole number", value);
        }
        if (result > (std::numeric_limits<int64_t>::max() - (c - '0')) / 10) {
            throw taxlots::InvalidRecord("Quantity out of range", value);
        }
        result = result * 10 + (c - '0');
        any_digit = true;
    }

    if (!any_digit) {
        throw taxlots::InvalidRecord("Missing quantity", value);
    }
    return negative ? -result : result;
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

} // namespace ibkr
