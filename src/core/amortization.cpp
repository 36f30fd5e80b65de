/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: amortization.cpp
 * ============================================================================
 */

#include "amortization.hpp"
#include <limits>
#include <stdexcept>

namespace amori {

namespace {

const big_int MONEY_CENTS_MAX = big_int(std::numeric_limits<money_cents>::max());

// num / den to the nearest integer, halves away from zero. den > 0.
big_int round_half_up(const big_int& num, const big_int& den) {
    big_int quotient = num / den;
    big_int remainder = num % den;
    if (remainder < 0) remainder = -remainder;

    if (remainder * 2 >= den) {
        quotient += (num < 0) ? -1 : 1;
    }
    return quotient;
}

big_int nominal_payment(money_cents principal, const MonthlyRate& rate, int term_months) {
    if (rate.is_zero()) {
        return round_half_up(big_int(principal), big_int(term_months));
    }

    // r = a / b, so (1+r)^n = (a+b)^n / b^n and the closed form reduces to
    // P * a * (a+b)^n / (b * ((a+b)^n - b^n)).
    const big_int& a = rate.numerator;
    const big_int& b = rate.denominator;
    const unsigned n = static_cast<unsigned>(term_months);

    big_int growth = boost::multiprecision::pow(big_int(a + b), n);
    big_int base = boost::multiprecision::pow(b, n);

    big_int numerator = big_int(principal) * a * growth;
    big_int denominator = b * (growth - base);
    return round_half_up(numerator, denominator);
}

} // namespace

const char* to_string(EngineError error) {
    switch (error) {
        case EngineError::None: return "None";
        case EngineError::InvalidMonth: return "InvalidMonth";
        case EngineError::InvalidLoanParameters: return "InvalidLoanParameters";
    }
    return "Unknown";
}

MonthlyRate MonthlyRate::from_annual_percent(const DecimalRate& annual_rate_percent) {
    MonthlyRate rate;
    rate.numerator = annual_rate_percent.units;
    rate.denominator = boost::multiprecision::pow(big_int(10), static_cast<unsigned>(annual_rate_percent.scale)) * 1200;
    return rate;
}

std::string AmortizationEngine::validate(const LoanParameters& params) {
    if (params.principal <= 0) {
        return "Loan principal must be positive";
    }
    if (params.term_months <= 0) {
        return "Loan term must be positive";
    }
    if (params.term_months > MAX_TERM_MONTHS) {
        return "Loan term must not exceed " + std::to_string(MAX_TERM_MONTHS) + " months";
    }
    if (params.annual_rate_percent.is_negative()) {
        return "Annual interest rate must not be negative";
    }
    return "";
}

money_cents AmortizationEngine::period_interest(money_cents remaining, const MonthlyRate& rate) {
    if (rate.is_zero()) {
        return 0;
    }
    return round_half_up(big_int(remaining) * rate.numerator, rate.denominator).convert_to<money_cents>();
}

money_cents AmortizationEngine::compute_monthly_payment(money_cents principal,
                                                        const MonthlyRate& rate,
                                                        int term_months) {
    if (term_months <= 0) {
        throw std::invalid_argument("compute_monthly_payment: term must be positive");
    }
    if (term_months > MAX_TERM_MONTHS) {
        throw std::invalid_argument("compute_monthly_payment: term exceeds maximum");
    }
    big_int payment = nominal_payment(principal, rate, term_months);
    if (payment > MONEY_CENTS_MAX) {
        throw std::overflow_error("compute_monthly_payment: payment exceeds currency range");
    }
    return payment.convert_to<money_cents>();
}

EngineResult<Schedule> AmortizationEngine::build_schedule(const LoanParameters& params) {
    std::string problem = validate(params);
    if (!problem.empty()) {
        return EngineResult<Schedule>::failure(EngineError::InvalidLoanParameters, problem);
    }

    MonthlyRate rate = MonthlyRate::from_annual_percent(params.annual_rate_percent);

    // The final month may charge principal + interest on top of a full balance,
    // so both must fit side by side in a money_cents.
    big_int nominal = nominal_payment(params.principal, rate, params.term_months);
    if (nominal + params.principal > MONEY_CENTS_MAX) {
        return EngineResult<Schedule>::failure(EngineError::InvalidLoanParameters,
                                               "Loan amounts exceed the supported currency range");
    }

    Schedule schedule;
    schedule.principal = params.principal;
    schedule.nominal_payment = nominal.convert_to<money_cents>();
    schedule.entries.reserve(params.term_months);

    money_cents remaining = params.principal;

    for (int month = 1; month <= params.term_months; ++month) {
        ScheduleEntry entry;
        entry.month = month;
        entry.interest = period_interest(remaining, rate);
        entry.monthly_payment = schedule.nominal_payment;
        entry.principal = entry.monthly_payment - entry.interest;

        // Final-month correction: clear the balance outright and charge
        // whatever that takes. A nominal payment that would overshoot the
        // balance earlier is capped the same way.
        if (month == params.term_months || entry.principal > remaining) {
            entry.principal = remaining;
            entry.monthly_payment = entry.principal + entry.interest;
        }

        remaining -= entry.principal;
        entry.remaining_balance = remaining;
        schedule.entries.push_back(entry);
    }

    return EngineResult<Schedule>::success(std::move(schedule));
}

EngineResult<Summary> AmortizationEngine::summarize(const Schedule& schedule, int month) {
    const int term = schedule.term_months();
    if (month < 0 || month > term) {
        return EngineResult<Summary>::failure(EngineError::InvalidMonth,
                                              "month must be between 0 and " + std::to_string(term));
    }

    Summary summary;
    summary.current_principal_balance = schedule.principal;

    for (int i = 0; i < month; ++i) {
        const ScheduleEntry& entry = schedule.entries[i];
        summary.total_principal_paid += entry.principal;
        summary.total_interest_paid += entry.interest;
    }
    if (month > 0) {
        summary.current_principal_balance = schedule.entries[month - 1].remaining_balance;
    }

    return EngineResult<Summary>::success(summary);
}

EngineResult<Schedule> AmortizationEngine::get_schedule(const LoanParameters& params) {
    return build_schedule(params);
}

EngineResult<Summary> AmortizationEngine::get_summary(const LoanParameters& params, int month) {
    std::string problem = validate(params);
    if (!problem.empty()) {
        return EngineResult<Summary>::failure(EngineError::InvalidLoanParameters, problem);
    }
    if (month < 0 || month > params.term_months) {
        return EngineResult<Summary>::failure(EngineError::InvalidMonth,
                                              "month must be between 0 and " + std::to_string(params.term_months));
    }

    EngineResult<Schedule> schedule = build_schedule(params);
    if (!schedule.ok()) {
        return EngineResult<Summary>::failure(schedule.error, schedule.message);
    }
    return summarize(schedule.value, month);
}

} // namespace amori
