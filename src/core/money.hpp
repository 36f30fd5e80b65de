/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: money.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Fixed-point currency and exact decimal rates. Nothing in Amori touches a
 * binary floating point value once a request has been parsed.
 * ============================================================================
 */

#ifndef AMORI_MONEY_HPP
#define AMORI_MONEY_HPP

#include <cstdint>
#include <string>

namespace amori {

    // money_cents: $1.00 = 100.
    // int64_t keeps every balance exact down to the cent.
    typedef int64_t money_cents;

    /**
     * @brief An exact decimal value stored as units / 10^scale.
     * "5.5" is {55, 1}, "0.99" is {99, 2}, "6" is {6, 0}.
     */
    struct DecimalRate {
        int64_t units = 0;
        int scale = 0;

        bool is_zero() const { return units == 0; }
        bool is_negative() const { return units < 0; }

        // Canonical text form, keeps the scale ("6.0" stays "6.0").
        std::string to_string() const;

        bool operator==(const DecimalRate& other) const;
        bool operator!=(const DecimalRate& other) const { return !(*this == other); }
    };

    // Largest number of fractional digits accepted in a rate.
    const int MAX_DECIMAL_SCALE = 12;

    /**
     * @brief Parses decimal text ("5.5", "-0.25", "1e-05") into an exact value.
     * @throws std::invalid_argument on malformed text or overflow.
     */
    DecimalRate parse_decimal(const std::string& text);

    /**
     * @brief Parses a currency amount into cents.
     * Extra fractional digits are rounded half-up to the cent
     * ("12345.675" -> 1234568).
     * @throws std::invalid_argument on malformed text or overflow.
     */
    money_cents parse_money(const std::string& text);

    // 1234567 -> "12345.67", -5 -> "-0.05"
    std::string format_money(money_cents cents);

    /**
     * @brief num / den rounded to the nearest integer, halves away from zero.
     * den must be positive.
     */
    int64_t div_round_half_up(int64_t num, int64_t den);

} // namespace amori

#endif // AMORI_MONEY_HPP
