/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: amortization.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The Amortization Engine. Given a loan's principal, annual rate and term it
 * produces the month-by-month schedule and the point-in-time summary.
 * * RULES:
 * - Every monetary value is whole cents. Each per-period value is rounded
 *   half-up to the cent before it is carried into the next period.
 * - The monthly rate is an exact fraction; the fixed payment is evaluated
 *   with arbitrary-precision integers and rounded exactly once.
 * - The final month pays off whatever balance remains, so the schedule
 *   always closes at exactly 0.00.
 * * The engine holds no state. Every call recomputes from the parameters and
 * is safe to run from any number of threads.
 * ============================================================================
 */

#ifndef AMORI_AMORTIZATION_HPP
#define AMORI_AMORTIZATION_HPP

#include <string>
#include <utility>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>
#include "money.hpp"

namespace amori {

    typedef boost::multiprecision::cpp_int big_int;

    // Longest loan the engine will amortize (100 years of monthly periods).
    const int MAX_TERM_MONTHS = 1200;

    /**
     * @brief Loan terms supplied by the caller.
     */
    struct LoanParameters {
        money_cents principal = 0;
        DecimalRate annual_rate_percent;    // 5.5 means 5.5% per year
        int term_months = 0;
    };

    /**
     * @brief annual_rate_percent / (100 * 12) kept as numerator / denominator.
     */
    struct MonthlyRate {
        big_int numerator = 0;
        big_int denominator = 1;

        static MonthlyRate from_annual_percent(const DecimalRate& annual_rate_percent);
        bool is_zero() const { return numerator == 0; }
    };

    struct ScheduleEntry {
        int month = 0;
        money_cents remaining_balance = 0;
        money_cents monthly_payment = 0;
        money_cents interest = 0;      // interest component of this month's payment
        money_cents principal = 0;     // principal component of this month's payment
    };

    /**
     * @brief A full amortization table, one entry per month, month-ascending.
     */
    struct Schedule {
        money_cents principal = 0;
        money_cents nominal_payment = 0;
        std::vector<ScheduleEntry> entries;

        int term_months() const { return static_cast<int>(entries.size()); }
    };

    struct Summary {
        money_cents current_principal_balance = 0;
        money_cents total_principal_paid = 0;
        money_cents total_interest_paid = 0;
    };

    enum class EngineError {
        None,
        InvalidMonth,
        InvalidLoanParameters
    };

    const char* to_string(EngineError error);

    /**
     * @brief Tagged result of an engine call: either a value or a named failure.
     */
    template <typename T>
    struct EngineResult {
        EngineError error = EngineError::None;
        std::string message;
        T value{};

        bool ok() const { return error == EngineError::None; }

        static EngineResult success(T v) {
            EngineResult r;
            r.value = std::move(v);
            return r;
        }

        static EngineResult failure(EngineError e, std::string why) {
            EngineResult r;
            r.error = e;
            r.message = std::move(why);
            return r;
        }
    };

    class AmortizationEngine {
    public:
        /**
         * @brief The fixed payment used for every month except the last.
         * principal / n when the rate is zero, otherwise
         * principal * r * (1+r)^n / ((1+r)^n - 1), rounded half-up to cents.
         * @throws std::invalid_argument when term_months is not in [1, MAX_TERM_MONTHS].
         * @throws std::overflow_error when the payment does not fit in money_cents.
         */
        static money_cents compute_monthly_payment(money_cents principal,
                                                   const MonthlyRate& rate,
                                                   int term_months);

        /**
         * @brief Builds the month-by-month schedule.
         * Fails with InvalidLoanParameters for a non-positive principal or
         * term, a term above MAX_TERM_MONTHS, or a negative rate.
         */
        static EngineResult<Schedule> build_schedule(const LoanParameters& params);

        /**
         * @brief Balance and cumulative totals after `month` payments.
         * Fails with InvalidMonth unless 0 <= month <= term.
         */
        static EngineResult<Summary> summarize(const Schedule& schedule, int month);

        // Request-level entry points: validate, build, and (for the summary) truncate.
        static EngineResult<Schedule> get_schedule(const LoanParameters& params);
        static EngineResult<Summary> get_summary(const LoanParameters& params, int month);

        // Empty string when the parameters are usable, otherwise the reason.
        static std::string validate(const LoanParameters& params);

        // remaining * rate, rounded half-up to the cent.
        static money_cents period_interest(money_cents remaining, const MonthlyRate& rate);
    };

} // namespace amori

#endif // AMORI_AMORTIZATION_HPP
