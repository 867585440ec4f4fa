#include "decimal.hpp"
#include "errors.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <system_error>

namespace {

using Coefficient = Decimal::Coefficient;

// Exponents beyond this are treated as malformed input rather than prices.
constexpr int kMaxExponent = 1000;

// Largest result precision divide() and round() accept
constexpr unsigned kMaxDecimals = 1000;

Coefficient pow10(unsigned exponent) {
    return boost::multiprecision::pow(Coefficient(10), exponent);
}

// numerator / denominator rounded half-even, denominator != 0
Coefficient divide_half_even(const Coefficient& numerator, const Coefficient& denominator) {
    bool negative = (numerator < 0) != (denominator < 0);
    Coefficient n = numerator < 0 ? Coefficient(-numerator) : numerator;
    Coefficient d = denominator < 0 ? Coefficient(-denominator) : denominator;

    Coefficient quotient = n / d;
    Coefficient twice_remainder = (n % d) * 2;

    if (twice_remainder > d || (twice_remainder == d && quotient % 2 != 0)) {
        quotient += 1;
    }
    if (negative) {
        quotient = -quotient;
    }
    return quotient;
}

} // namespace

Decimal Decimal::from_string(const std::string& text) {
    std::size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    std::string digits;
    unsigned fraction_digits = 0;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c >= '0' && c <= '9') {
            digits.push_back(c);
            if (seen_point) {
                ++fraction_digits;
            }
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }

    if (digits.empty()) {
        throw InvalidNumberError("Cannot convert '" + text + "' to a decimal");
    }

    int exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        const char* begin = text.data() + pos;
        const char* end = text.data() + text.size();
        if (begin != end && *begin == '+') {
            ++begin;
        }
        auto [ptr, ec] = std::from_chars(begin, end, exponent);
        if (ec != std::errc() || ptr == begin) {
            throw InvalidNumberError("Cannot convert '" + text + "' to a decimal");
        }
        pos = static_cast<std::size_t>(ptr - text.data());
    }

    if (pos != text.size() || exponent > kMaxExponent || exponent < -kMaxExponent) {
        throw InvalidNumberError("Cannot convert '" + text + "' to a decimal");
    }

    // cpp_int would read a leading zero as an octal prefix
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
    Coefficient coefficient(digits.c_str());
    if (negative) {
        coefficient = -coefficient;
    }

    int scale = static_cast<int>(fraction_digits) - exponent;
    if (scale < 0) {
        return Decimal(Coefficient(coefficient * pow10(static_cast<unsigned>(-scale))), 0);
    }
    return Decimal(coefficient, static_cast<unsigned>(scale));
}

Decimal::Coefficient Decimal::rescaled(unsigned scale) const {
    if (scale <= scale_) {
        return coefficient_;
    }
    return Coefficient(coefficient_ * pow10(scale - scale_));
}

int Decimal::compare(const Decimal& other) const {
    unsigned common = std::max(scale_, other.scale_);
    Coefficient lhs = rescaled(common);
    Coefficient rhs = other.rescaled(common);
    if (lhs < rhs) return -1;
    if (lhs > rhs) return 1;
    return 0;
}

Decimal Decimal::operator+(const Decimal& other) const {
    unsigned common = std::max(scale_, other.scale_);
    return Decimal(Coefficient(rescaled(common) + other.rescaled(common)), common);
}

Decimal Decimal::operator-(const Decimal& other) const {
    unsigned common = std::max(scale_, other.scale_);
    return Decimal(Coefficient(rescaled(common) - other.rescaled(common)), common);
}

Decimal Decimal::operator*(const Decimal& other) const {
    return Decimal(Coefficient(coefficient_ * other.coefficient_), scale_ + other.scale_);
}

Decimal Decimal::operator-() const {
    return Decimal(Coefficient(-coefficient_), scale_);
}

Decimal& Decimal::operator+=(const Decimal& other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
    *this = *this - other;
    return *this;
}

Decimal Decimal::divide(const Decimal& divisor, unsigned decimals) const {
    if (divisor.is_zero()) {
        throw InvalidNumberError("Division by zero: " + to_string() + " / " + divisor.to_string());
    }
    if (decimals > kMaxDecimals) {
        throw InvalidNumberError("Division precision too large: " + std::to_string(decimals));
    }
    // (a / 10^sa) / (b / 10^sb) * 10^d == a * 10^(sb + d) / (b * 10^sa)
    Coefficient numerator = coefficient_ * pow10(divisor.scale_ + decimals);
    Coefficient denominator = divisor.coefficient_ * pow10(scale_);
    return Decimal(divide_half_even(numerator, denominator), decimals);
}

Decimal Decimal::round(unsigned decimals) const {
    if (decimals > kMaxDecimals) {
        throw InvalidNumberError("Rounding precision too large: " + std::to_string(decimals));
    }
    if (decimals >= scale_) {
        return *this;
    }
    return Decimal(divide_half_even(coefficient_, pow10(scale_ - decimals)), decimals);
}

Decimal Decimal::normalized() const {
    Coefficient coefficient = coefficient_;
    unsigned scale = scale_;
    while (scale > 0 && coefficient % 10 == 0) {
        coefficient /= 10;
        --scale;
    }
    return Decimal(coefficient, scale);
}

Decimal Decimal::abs() const {
    return Decimal(is_negative() ? Coefficient(-coefficient_) : coefficient_, scale_);
}

int Decimal::sign() const {
    return coefficient_.sign();
}

std::string Decimal::to_string() const {
    std::string digits = abs().coefficient_.str();
    if (digits.size() <= scale_) {
        digits.insert(0, scale_ - digits.size() + 1, '0');
    }
    if (scale_ > 0) {
        digits.insert(digits.size() - scale_, 1, '.');
    }
    if (coefficient_ < 0) {
        digits.insert(0, 1, '-');
    }
    return digits;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
    return os << value.to_string();
}

Decimal to_decimal(const Decimal& value) {
    return value;
}

Decimal to_decimal(const std::string& text) {
    return Decimal::from_string(text);
}

Decimal to_decimal(const char* text) {
    return Decimal::from_string(text);
}

Decimal to_decimal(int64_t value) {
    return Decimal(value);
}

Decimal to_decimal(int value) {
    return Decimal(static_cast<int64_t>(value));
}

Decimal to_decimal(double value) {
    if (!std::isfinite(value)) {
        throw InvalidNumberError("Cannot convert non-finite value to a decimal");
    }
    // Shortest representation that round-trips, never the binary expansion
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        throw InvalidNumberError("Cannot format floating-point value");
    }
    return Decimal::from_string(std::string(buffer, ptr));
}
