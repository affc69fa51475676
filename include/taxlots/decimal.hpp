#pragma once

#include <gmpxx.h>

#include <cstdint>
#include <iosfwd>
#include <string>

namespace taxlots {

// Exact decimal number: units / 10^scale, with arbitrary-precision units.
// Arithmetic never rounds; rounding only happens in to_fixed() and divide().
class Decimal {
public:
    Decimal() = default;
    Decimal(int64_t value);

    // Accepts "[+-]digits[.digits]". Throws std::invalid_argument.
    static Decimal parse(const std::string& text);

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;
    Decimal operator-() const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }
    bool operator<(const Decimal& other) const { return compare(other) < 0; }
    bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
    bool operator>(const Decimal& other) const { return compare(other) > 0; }
    bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

    [[nodiscard]] int compare(const Decimal& other) const;
    [[nodiscard]] int sign() const;
    [[nodiscard]] bool is_zero() const { return sign() == 0; }
    [[nodiscard]] Decimal abs() const;
    [[nodiscard]] unsigned scale() const { return scale_; }

    // Rounded quotient with `digits` fractional digits (half to even).
    // Only used at the ingestion boundary, never while computing gains.
    [[nodiscard]] Decimal divide(int64_t divisor, unsigned digits) const;

    // Exact representation with trailing fractional zeros removed.
    std::string to_string() const;

    // Rounded to `digits` fractional digits, half to even (banker's rounding).
    std::string to_fixed(unsigned digits) const;

private:
    Decimal(mpz_class units, unsigned scale);

    mpz_class rescaled(unsigned scale) const;
    static Decimal round_to(const Decimal& value, unsigned digits);

    mpz_class units_{0};
    unsigned scale_ = 0;
};

Decimal min(const Decimal& lhs, const Decimal& rhs);

std::ostream& operator<<(std::ostream& os, const Decimal& value);

} // namespace taxlots
