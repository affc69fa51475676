#include "taxlots/decimal.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace taxlots {

namespace {

mpz_class power_of_ten(unsigned exponent) {
    mpz_class result;
    mpz_ui_pow_ui(result.get_mpz_t(), 10, exponent);
    return result;
}

// Integer division of value by divisor, rounding half to even.
mpz_class rounded_quotient(const mpz_class& value, const mpz_class& divisor) {
    mpz_class quotient;
    mpz_class remainder;
    mpz_tdiv_qr(quotient.get_mpz_t(), remainder.get_mpz_t(), value.get_mpz_t(), divisor.get_mpz_t());

    const mpz_class twice = abs(remainder) * 2;
    const mpz_class magnitude = abs(divisor);
    const int half = cmp(twice, magnitude);
    if (half > 0 || (half == 0 && mpz_odd_p(quotient.get_mpz_t()))) {
        quotient += (sgn(value) * sgn(divisor) < 0) ? -1 : 1;
    }
    return quotient;
}

} // namespace

Decimal::Decimal(int64_t value)
    : units_(static_cast<long>(value)),
      scale_(0) {
}

Decimal::Decimal(mpz_class units, unsigned scale)
    : units_(std::move(units)),
      scale_(scale) {
}

Decimal Decimal::parse(const std::string& text) {
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    unsigned scale = 0;
    bool seen_point = false;
    for (; pos < text.size(); ++pos) {
        const unsigned char ch = static_cast<unsigned char>(text[pos]);
        if (std::isdigit(ch)) {
            digits.push_back(static_cast<char>(ch));
            if (seen_point) {
                ++scale;
            }
        } else if (ch == '.' && !seen_point) {
            seen_point = true;
        } else {
            throw std::invalid_argument("Invalid decimal literal: '" + text + "'");
        }
    }

    if (digits.empty()) {
        throw std::invalid_argument("Invalid decimal literal: '" + text + "'");
    }

    mpz_class units(digits, 10);
    if (negative) {
        units = -units;
    }
    return Decimal(std::move(units), scale);
}

mpz_class Decimal::rescaled(unsigned scale) const {
    if (scale <= scale_) {
        return units_;
    }
    return units_ * power_of_ten(scale - scale_);
}

Decimal Decimal::operator+(const Decimal& other) const {
    const unsigned scale = std::max(scale_, other.scale_);
    return Decimal(rescaled(scale) + other.rescaled(scale), scale);
}

Decimal Decimal::operator-(const Decimal& other) const {
    const unsigned scale = std::max(scale_, other.scale_);
    return Decimal(rescaled(scale) - other.rescaled(scale), scale);
}

Decimal Decimal::operator*(const Decimal& other) const {
    return Decimal(units_ * other.units_, scale_ + other.scale_);
}

Decimal Decimal::operator-() const {
    return Decimal(-units_, scale_);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

int Decimal::compare(const Decimal& other) const {
    const unsigned scale = std::max(scale_, other.scale_);
    const int result = cmp(rescaled(scale), other.rescaled(scale));
    return (result > 0) - (result < 0);
}

int Decimal::sign() const {
    return sgn(units_);
}

Decimal Decimal::abs() const {
    return Decimal(::abs(units_), scale_);
}

Decimal Decimal::divide(int64_t divisor, unsigned digits) const {
    if (divisor == 0) {
        throw std::invalid_argument("Decimal division by zero");
    }
    // units / 10^scale / divisor, expressed with `digits` fractional digits.
    mpz_class numerator = units_ * power_of_ten(digits);
    const mpz_class denominator = mpz_class(static_cast<long>(divisor)) * power_of_ten(scale_);
    return Decimal(rounded_quotient(numerator, denominator), digits);
}

Decimal Decimal::round_to(const Decimal& value, unsigned digits) {
    if (value.scale_ <= digits) {
        return Decimal(value.rescaled(digits), digits);
    }
    return Decimal(rounded_quotient(value.units_, power_of_ten(value.scale_ - digits)), digits);
}

std::string Decimal::to_fixed(unsigned digits) const {
    const Decimal rounded = round_to(*this, digits);
    const mpz_class absolute = ::abs(rounded.units_);
    std::string magnitude = absolute.get_str(10);
    if (magnitude.size() <= digits) {
        magnitude.insert(0, digits + 1 - magnitude.size(), '0');
    }

    std::string result = rounded.units_ < 0 ? "-" : "";
    if (digits == 0) {
        return result + magnitude;
    }
    result += magnitude.substr(0, magnitude.size() - digits);
    result += '.';
    result += magnitude.substr(magnitude.size() - digits);
    return result;
}

std::string Decimal::to_string() const {
    std::string text = to_fixed(scale_);
    if (scale_ == 0) {
        return text;
    }
    while (text.back() == '0') {
        text.pop_back();
    }
    if (text.back() == '.') {
        text.pop_back();
    }
    return text == "-0" ? "0" : text;
}

Decimal min(const Decimal& lhs, const Decimal& rhs) {
    return rhs < lhs ? rhs : lhs;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

} // namespace taxlots
