#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

// Exact base-10 number for prices, shares, weights and cash: coefficient / 10^scale.
// + - * never round; divide() names its precision and rounds half-even.
class Decimal {
public:
    using Coefficient = boost::multiprecision::cpp_int;

    Decimal() : coefficient_(0), scale_(0) {}
    Decimal(int64_t value) : coefficient_(value), scale_(0) {}

    // Parses [+-]digits[.digits][(e|E)[+-]digits]. Throws InvalidNumberError.
    static Decimal from_string(const std::string& text);

    Decimal operator+(const Decimal& other) const;
    Decimal operator-(const Decimal& other) const;
    Decimal operator*(const Decimal& other) const;
    Decimal operator-() const;

    Decimal& operator+=(const Decimal& other);
    Decimal& operator-=(const Decimal& other);

    // Quotient rounded half-even to `decimals` fractional digits.
    // Throws InvalidNumberError on a zero divisor or an unreasonable precision.
    Decimal divide(const Decimal& divisor, unsigned decimals) const;

    // Rounds half-even to `decimals` fractional digits.
    Decimal round(unsigned decimals) const;

    // Same value with trailing fractional zeros removed.
    Decimal normalized() const;

    Decimal abs() const;
    int sign() const;
    bool is_zero() const { return coefficient_ == 0; }
    bool is_negative() const { return coefficient_ < 0; }
    bool is_positive() const { return coefficient_ > 0; }

    unsigned scale() const { return scale_; }

    // Plain notation with exactly scale() fractional digits.
    std::string to_string() const;

    bool operator==(const Decimal& other) const { return compare(other) == 0; }
    bool operator!=(const Decimal& other) const { return compare(other) != 0; }
    bool operator<(const Decimal& other) const { return compare(other) < 0; }
    bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
    bool operator>(const Decimal& other) const { return compare(other) > 0; }
    bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

private:
    Decimal(Coefficient coefficient, unsigned scale)
        : coefficient_(std::move(coefficient)), scale_(scale) {}

    int compare(const Decimal& other) const;
    Coefficient rescaled(unsigned scale) const;

    Coefficient coefficient_;
    unsigned scale_;
};

std::ostream& operator<<(std::ostream& os, const Decimal& value);

// Boundary conversions: every external number enters through one of these.
Decimal to_decimal(const Decimal& value);
Decimal to_decimal(const std::string& text);
Decimal to_decimal(const char* text);
Decimal to_decimal(int64_t value);
Decimal to_decimal(int value);
// Goes through the shortest round-trip string, so 0.1 becomes exactly 0.1.
Decimal to_decimal(double value);
