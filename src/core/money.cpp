/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.cpp
 * ============================================================================
 */

#include "money.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace amori {

namespace {

const int64_t INT64_MAX_VALUE = std::numeric_limits<int64_t>::max();

int64_t checked_pow10(int exponent) {
    int64_t value = 1;
    for (int i = 0; i < exponent; ++i) {
        if (value > INT64_MAX_VALUE / 10) {
            throw std::invalid_argument("decimal value out of range");
        }
        value *= 10;
    }
    return value;
}

int64_t checked_mul(int64_t value, int64_t factor) {
    if (value != 0 && (value > INT64_MAX_VALUE / factor || value < -INT64_MAX_VALUE / factor)) {
        throw std::invalid_argument("decimal value out of range");
    }
    return value * factor;
}

// Magnitude as unsigned so INT64_MIN formats correctly.
std::string magnitude_digits(int64_t value) {
    uint64_t magnitude = value < 0 ? uint64_t(0) - uint64_t(value) : uint64_t(value);
    return std::to_string(magnitude);
}

} // namespace

std::string DecimalRate::to_string() const {
    std::string digits = magnitude_digits(units);
    if (scale > 0) {
        if (static_cast<int>(digits.size()) <= scale) {
            digits.insert(0, scale + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - scale, ".");
    }
    return (units < 0 ? "-" : "") + digits;
}

bool DecimalRate::operator==(const DecimalRate& other) const {
    // Compare by value: "6" == "6.00". Trailing zeros are dropped rather
    // than digits added, so the comparison cannot overflow.
    DecimalRate a = *this;
    DecimalRate b = other;
    while (a.scale > 0 && a.units % 10 == 0) { a.units /= 10; --a.scale; }
    while (b.scale > 0 && b.units % 10 == 0) { b.units /= 10; --b.scale; }
    return a.units == b.units && a.scale == b.scale;
}

DecimalRate parse_decimal(const std::string& text) {
    size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t units = 0;
    int fraction_digits = 0;
    int digit_count = 0;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) throw std::invalid_argument("malformed decimal: " + text);
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) break;

        int digit = c - '0';
        if (units > (INT64_MAX_VALUE - digit) / 10) {
            throw std::invalid_argument("decimal value out of range: " + text);
        }
        units = units * 10 + digit;
        ++digit_count;
        if (seen_point) ++fraction_digits;
    }

    if (digit_count == 0) {
        throw std::invalid_argument("malformed decimal: " + text);
    }

    int exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool exponent_negative = false;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            exponent_negative = text[pos] == '-';
            ++pos;
        }
        int exponent_digits = 0;
        for (; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
            exponent = exponent * 10 + (text[pos] - '0');
            if (exponent > 100) throw std::invalid_argument("decimal exponent out of range: " + text);
            ++exponent_digits;
        }
        if (exponent_digits == 0) throw std::invalid_argument("malformed decimal: " + text);
        if (exponent_negative) exponent = -exponent;
    }

    if (pos != text.size()) {
        throw std::invalid_argument("malformed decimal: " + text);
    }

    DecimalRate result;
    result.units = units;
    result.scale = fraction_digits - exponent;

    if (result.scale < 0) {
        result.units = checked_mul(result.units, checked_pow10(-result.scale));
        result.scale = 0;
    }
    while (result.scale > MAX_DECIMAL_SCALE && result.units % 10 == 0) {
        result.units /= 10;
        --result.scale;
    }
    if (result.scale > MAX_DECIMAL_SCALE) {
        throw std::invalid_argument("too many decimal places: " + text);
    }

    if (negative) result.units = -result.units;
    return result;
}

money_cents parse_money(const std::string& text) {
    DecimalRate value = parse_decimal(text);
    if (value.scale <= 2) {
        return checked_mul(value.units, checked_pow10(2 - value.scale));
    }
    return div_round_half_up(value.units, checked_pow10(value.scale - 2));
}

std::string format_money(money_cents cents) {
    DecimalRate value;
    value.units = cents;
    value.scale = 2;
    return value.to_string();
}

int64_t div_round_half_up(int64_t num, int64_t den) {
    if (den <= 0) {
        throw std::invalid_argument("div_round_half_up: denominator must be positive");
    }
    int64_t quotient = num / den;
    int64_t remainder = num % den;
    int64_t abs_remainder = remainder < 0 ? -remainder : remainder;

    if (abs_remainder >= den - abs_remainder) {
        quotient += (num < 0) ? -1 : 1;
    }
    return quotient;
}

} // namespace amori
