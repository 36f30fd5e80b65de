#include "core/amortization.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace amori;

namespace {

LoanParameters loan(const std::string& principal, const std::string& rate, int term) {
    LoanParameters params;
    params.principal = parse_money(principal);
    params.annual_rate_percent = parse_decimal(rate);
    params.term_months = term;
    return params;
}

Schedule schedule_for(const LoanParameters& params) {
    EngineResult<Schedule> result = AmortizationEngine::build_schedule(params);
    EXPECT_TRUE(result.ok()) << result.message;
    return result.value;
}

Summary summary_for(const LoanParameters& params, int month) {
    EngineResult<Summary> result = AmortizationEngine::get_summary(params, month);
    EXPECT_TRUE(result.ok()) << result.message;
    return result.value;
}

} // namespace

TEST(MonthlyRateTest, ConvertsAnnualPercentToExactFraction) {
    MonthlyRate rate = MonthlyRate::from_annual_percent(parse_decimal("5.5"));
    EXPECT_EQ(rate.numerator, 55);
    EXPECT_EQ(rate.denominator, 12000);
    EXPECT_FALSE(rate.is_zero());
    EXPECT_TRUE(MonthlyRate::from_annual_percent(parse_decimal("0")).is_zero());
}

TEST(AmortizationTest, MonthlyPaymentMatchesClosedForm) {
    MonthlyRate rate = MonthlyRate::from_annual_percent(parse_decimal("5.5"));
    EXPECT_EQ(AmortizationEngine::compute_monthly_payment(1000000, rate, 36), 30196);

    MonthlyRate six = MonthlyRate::from_annual_percent(parse_decimal("6"));
    EXPECT_EQ(AmortizationEngine::compute_monthly_payment(1000000, six, 12), 86066);
    EXPECT_EQ(AmortizationEngine::compute_monthly_payment(1000000, six, 24), 44321);
}

TEST(AmortizationTest, ZeroRatePaymentIsPrincipalOverTerm) {
    MonthlyRate zero = MonthlyRate::from_annual_percent(parse_decimal("0"));
    EXPECT_EQ(AmortizationEngine::compute_monthly_payment(120000, zero, 12), 10000);
    EXPECT_EQ(AmortizationEngine::compute_monthly_payment(100, zero, 3), 33);
    EXPECT_EQ(AmortizationEngine::compute_monthly_payment(200, zero, 3), 67);
}

TEST(AmortizationTest, MonthlyPaymentRejectsNonPositiveTerm) {
    MonthlyRate rate = MonthlyRate::from_annual_percent(parse_decimal("5"));
    EXPECT_THROW(AmortizationEngine::compute_monthly_payment(100000, rate, 0), std::invalid_argument);
    EXPECT_THROW(AmortizationEngine::compute_monthly_payment(100000, rate, MAX_TERM_MONTHS + 1),
                 std::invalid_argument);
}

TEST(AmortizationTest, PeriodInterestRoundsHalfUp) {
    // 1000.00 at 6% -> 5.00 exactly; 50.00 at 1.2% -> 0.05; 0.50 at 12% -> 0.005 -> 0.01
    EXPECT_EQ(AmortizationEngine::period_interest(100000, MonthlyRate::from_annual_percent(parse_decimal("6"))), 500);
    EXPECT_EQ(AmortizationEngine::period_interest(5000, MonthlyRate::from_annual_percent(parse_decimal("1.2"))), 5);
    EXPECT_EQ(AmortizationEngine::period_interest(50, MonthlyRate::from_annual_percent(parse_decimal("12"))), 1);
    EXPECT_EQ(AmortizationEngine::period_interest(12345, MonthlyRate::from_annual_percent(parse_decimal("0"))), 0);
}

TEST(AmortizationTest, TenThousandAtFivePointFivePercentOverThreeYears) {
    Schedule schedule = schedule_for(loan("10000.00", "5.5", 36));
    ASSERT_EQ(schedule.term_months(), 36);
    EXPECT_EQ(schedule.nominal_payment, 30196);

    const ScheduleEntry& first = schedule.entries.front();
    EXPECT_EQ(first.month, 1);
    EXPECT_EQ(first.interest, 4583);
    EXPECT_EQ(first.principal, 25613);
    EXPECT_EQ(first.remaining_balance, 974387);

    for (int i = 0; i < 35; ++i) {
        EXPECT_EQ(schedule.entries[i].monthly_payment, 30196) << "month " << i + 1;
    }

    EXPECT_EQ(schedule.entries[17].remaining_balance, 520566);

    const ScheduleEntry& last = schedule.entries.back();
    EXPECT_EQ(last.month, 36);
    EXPECT_EQ(last.remaining_balance, 0);
    EXPECT_EQ(last.interest, 138);
    EXPECT_EQ(last.principal, 30056);
    EXPECT_EQ(last.monthly_payment, 30194);
}

TEST(AmortizationTest, ZeroRateLoanDescendsInEqualSteps) {
    Schedule schedule = schedule_for(loan("1200.00", "0", 12));
    ASSERT_EQ(schedule.term_months(), 12);

    for (int i = 0; i < 12; ++i) {
        const ScheduleEntry& entry = schedule.entries[i];
        EXPECT_EQ(entry.month, i + 1);
        EXPECT_EQ(entry.monthly_payment, 10000);
        EXPECT_EQ(entry.interest, 0);
        EXPECT_EQ(entry.principal, 10000);
        EXPECT_EQ(entry.remaining_balance, 110000 - 10000 * i);
    }
}

TEST(AmortizationTest, FinalMonthAbsorbsRoundingDrift) {
    // 1.00 over three months: 0.33, 0.33, then 0.34 to clear the balance.
    Schedule up = schedule_for(loan("1.00", "0", 3));
    EXPECT_EQ(up.entries[0].monthly_payment, 33);
    EXPECT_EQ(up.entries[1].monthly_payment, 33);
    EXPECT_EQ(up.entries[2].monthly_payment, 34);
    EXPECT_EQ(up.entries[2].remaining_balance, 0);

    // 2.00 over three months rounds the other way: 0.67, 0.67, 0.66.
    Schedule down = schedule_for(loan("2.00", "0", 3));
    EXPECT_EQ(down.entries[0].remaining_balance, 133);
    EXPECT_EQ(down.entries[2].monthly_payment, 66);
    EXPECT_EQ(down.entries[2].remaining_balance, 0);
}

TEST(AmortizationTest, OvershootingPaymentIsCappedAtBalance) {
    // 0.15 over ten months rounds the payment up to 0.02, so the balance is
    // cleared in month eight and nothing further is charged.
    Schedule schedule = schedule_for(loan("0.15", "0", 10));
    std::vector<money_cents> balances;
    std::vector<money_cents> payments;
    for (const auto& entry : schedule.entries) {
        balances.push_back(entry.remaining_balance);
        payments.push_back(entry.monthly_payment);
    }
    EXPECT_EQ(balances, (std::vector<money_cents>{13, 11, 9, 7, 5, 3, 1, 0, 0, 0}));
    EXPECT_EQ(payments, (std::vector<money_cents>{2, 2, 2, 2, 2, 2, 2, 1, 0, 0}));
}

TEST(AmortizationTest, TinyLoanPaysEverythingInFinalMonth) {
    Schedule schedule = schedule_for(loan("0.01", "5", 12));
    EXPECT_EQ(schedule.nominal_payment, 0);
    for (int i = 0; i < 11; ++i) {
        EXPECT_EQ(schedule.entries[i].remaining_balance, 1);
        EXPECT_EQ(schedule.entries[i].monthly_payment, 0);
    }
    EXPECT_EQ(schedule.entries[11].monthly_payment, 1);
    EXPECT_EQ(schedule.entries[11].remaining_balance, 0);
}

TEST(AmortizationTest, SingleMonthLoanPaysPrincipalPlusInterest) {
    Schedule schedule = schedule_for(loan("1000.00", "12", 1));
    ASSERT_EQ(schedule.term_months(), 1);
    EXPECT_EQ(schedule.entries[0].interest, 1000);
    EXPECT_EQ(schedule.entries[0].monthly_payment, 101000);
    EXPECT_EQ(schedule.entries[0].remaining_balance, 0);
}

TEST(AmortizationTest, RejectsInvalidLoanParameters) {
    EngineResult<Schedule> zero_principal = AmortizationEngine::build_schedule(loan("0", "5", 12));
    EXPECT_EQ(zero_principal.error, EngineError::InvalidLoanParameters);

    EngineResult<Schedule> negative_principal = AmortizationEngine::build_schedule(loan("-100", "5", 12));
    EXPECT_EQ(negative_principal.error, EngineError::InvalidLoanParameters);

    EngineResult<Schedule> zero_term = AmortizationEngine::build_schedule(loan("1000", "5", 0));
    EXPECT_EQ(zero_term.error, EngineError::InvalidLoanParameters);
    EXPECT_EQ(zero_term.message, "Loan term must be positive");

    EngineResult<Schedule> negative_rate = AmortizationEngine::get_schedule(loan("1000", "-1", 12));
    EXPECT_EQ(negative_rate.error, EngineError::InvalidLoanParameters);
    EXPECT_TRUE(negative_rate.value.entries.empty());

    EngineResult<Summary> summary = AmortizationEngine::get_summary(loan("1000", "5", 0), 0);
    EXPECT_EQ(summary.error, EngineError::InvalidLoanParameters);
}

TEST(AmortizationTest, TermIsBoundedAtMaximum) {
    Schedule longest = schedule_for(loan("10000.00", "5.123456789012", MAX_TERM_MONTHS));
    ASSERT_EQ(longest.term_months(), MAX_TERM_MONTHS);
    EXPECT_EQ(longest.entries.back().remaining_balance, 0);

    EngineResult<Schedule> too_long = AmortizationEngine::build_schedule(loan("10000.00", "5.123456789012", MAX_TERM_MONTHS + 1));
    EXPECT_EQ(too_long.error, EngineError::InvalidLoanParameters);
    EXPECT_EQ(too_long.message, "Loan term must not exceed 1200 months");

    EngineResult<Summary> huge = AmortizationEngine::get_summary(loan("10000.00", "5.123456789012", 4000000), 1);
    EXPECT_EQ(huge.error, EngineError::InvalidLoanParameters);
}

TEST(AmortizationTest, RejectsPaymentsBeyondCurrencyRange) {
    EngineResult<Schedule> result = AmortizationEngine::build_schedule(loan("90000000000000000", "1000", 12));
    EXPECT_EQ(result.error, EngineError::InvalidLoanParameters);
}

TEST(SummaryTest, MonthZeroIsUntouchedPrincipal) {
    Summary summary = summary_for(loan("1000.00", "12", 10), 0);
    EXPECT_EQ(summary.current_principal_balance, 100000);
    EXPECT_EQ(summary.total_principal_paid, 0);
    EXPECT_EQ(summary.total_interest_paid, 0);
}

TEST(SummaryTest, MidTermAndFinalTotals) {
    LoanParameters params = loan("1000.00", "12", 10);

    Summary mid = summary_for(params, 5);
    EXPECT_EQ(mid.current_principal_balance, 51244);
    EXPECT_EQ(mid.total_principal_paid, 48756);
    EXPECT_EQ(mid.total_interest_paid, 4034);

    Summary end = summary_for(params, 10);
    EXPECT_EQ(end.current_principal_balance, 0);
    EXPECT_EQ(end.total_principal_paid, 100000);
    EXPECT_EQ(end.total_interest_paid, 5582);
}

TEST(SummaryTest, RejectsMonthsOutsideTerm) {
    LoanParameters params = loan("5000.00", "5", 24);
    EXPECT_EQ(AmortizationEngine::get_summary(params, -1).error, EngineError::InvalidMonth);
    EXPECT_EQ(AmortizationEngine::get_summary(params, 25).error, EngineError::InvalidMonth);
    EXPECT_EQ(AmortizationEngine::get_summary(params, 999).message, "month must be between 0 and 24");

    Schedule schedule = schedule_for(params);
    EXPECT_EQ(AmortizationEngine::summarize(schedule, 25).error, EngineError::InvalidMonth);
    EXPECT_EQ(AmortizationEngine::summarize(schedule, -1).error, EngineError::InvalidMonth);
    EXPECT_TRUE(AmortizationEngine::summarize(schedule, 24).ok());
}

TEST(SummaryTest, MatchesScheduleAtEveryMonth) {
    LoanParameters params = loan("12345.67", "4.25", 24);
    Schedule schedule = schedule_for(params);

    money_cents interest = 0;
    money_cents principal = 0;
    for (int month = 1; month <= 24; ++month) {
        interest += schedule.entries[month - 1].interest;
        principal += schedule.entries[month - 1].principal;

        EngineResult<Summary> summary = AmortizationEngine::summarize(schedule, month);
        ASSERT_TRUE(summary.ok());
        EXPECT_EQ(summary.value.current_principal_balance, schedule.entries[month - 1].remaining_balance);
        EXPECT_EQ(summary.value.total_principal_paid, principal);
        EXPECT_EQ(summary.value.total_interest_paid, interest);
    }

    Summary mid = summary_for(params, 12);
    EXPECT_EQ(mid.current_principal_balance, 630381);
    EXPECT_EQ(mid.total_interest_paid, 40790);
    EXPECT_EQ(summary_for(params, 24).total_interest_paid, 55397);
}

struct ReferenceLoan {
    const char* principal;
    const char* rate;
    int term;
    money_cents payment;
    money_cents total_interest;
};

class ReferenceLoanTest : public ::testing::TestWithParam<ReferenceLoan> {};

TEST_P(ReferenceLoanTest, FinalTotalsMatchReferenceSchedule) {
    const ReferenceLoan& ref = GetParam();
    LoanParameters params = loan(ref.principal, ref.rate, ref.term);

    Schedule schedule = schedule_for(params);
    EXPECT_EQ(schedule.nominal_payment, ref.payment);

    Summary end = summary_for(params, ref.term);
    EXPECT_EQ(end.current_principal_balance, 0);
    EXPECT_EQ(end.total_principal_paid, params.principal);
    EXPECT_EQ(end.total_interest_paid, ref.total_interest);
}

INSTANTIATE_TEST_SUITE_P(OriginationBook, ReferenceLoanTest, ::testing::Values(
    ReferenceLoan{"10000.00", "6.0", 12, 86066, 32796},
    ReferenceLoan{"250000.00", "5.5", 360, 141947, 26101150},
    ReferenceLoan{"5000.00", "0.99", 24, 21049, 5171},
    ReferenceLoan{"9999.99", "9.99", 48, 25358, 217170},
    ReferenceLoan{"15000.00", "7.5", 36, 46659, 179736},
    ReferenceLoan{"8000.00", "3.2", 60, 14446, 66770},
    ReferenceLoan{"54321.00", "7.25", 36, 168349, 628468}
));

class ScheduleInvariantTest : public ::testing::TestWithParam<LoanParameters> {};

TEST_P(ScheduleInvariantTest, BalancesCloseAndConserve) {
    const LoanParameters& params = GetParam();
    Schedule schedule = schedule_for(params);
    ASSERT_EQ(schedule.term_months(), params.term_months);

    money_cents previous = params.principal;
    money_cents principal_sum = 0;
    money_cents interest_sum = 0;
    money_cents payment_sum = 0;

    for (int i = 0; i < schedule.term_months(); ++i) {
        const ScheduleEntry& entry = schedule.entries[i];
        EXPECT_EQ(entry.month, i + 1);
        EXPECT_GE(entry.remaining_balance, 0);
        EXPECT_LE(entry.remaining_balance, previous);
        EXPECT_GE(entry.principal, 0);
        EXPECT_EQ(entry.monthly_payment, entry.principal + entry.interest);
        if (params.annual_rate_percent.is_zero()) {
            EXPECT_EQ(entry.interest, 0);
        }

        previous = entry.remaining_balance;
        principal_sum += entry.principal;
        interest_sum += entry.interest;
        payment_sum += entry.monthly_payment;

        EngineResult<Summary> summary = AmortizationEngine::summarize(schedule, i + 1);
        ASSERT_TRUE(summary.ok());
        EXPECT_EQ(params.principal - summary.value.current_principal_balance, summary.value.total_principal_paid);
    }

    EXPECT_EQ(schedule.entries.back().remaining_balance, 0);
    EXPECT_EQ(principal_sum, params.principal);
    EXPECT_EQ(payment_sum, params.principal + interest_sum);
}

INSTANTIATE_TEST_SUITE_P(AssortedLoans, ScheduleInvariantTest, ::testing::Values(
    loan("10000.00", "5.5", 36),
    loan("1200.00", "0", 12),
    loan("999.99", "0", 7),
    loan("1.00", "0", 3),
    loan("0.15", "0", 10),
    loan("0.01", "5", 12),
    loan("500000.00", "3.875", 360),
    loan("750.50", "29.99", 18),
    loan("123456.78", "0.001", 120),
    loan("42.00", "100", 6)
));
