/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MemoryLoanRepository.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-local storage. Selected with AMORI_STORE=memory and used by the
 * test suite. Everything is lost when the process exits.
 * ============================================================================
 */

#ifndef AMORI_MEMORY_LOAN_REPOSITORY_HPP
#define AMORI_MEMORY_LOAN_REPOSITORY_HPP

#include <map>
#include <mutex>
#include "LoanRepository.hpp"

namespace amori {
namespace store {

    class MemoryLoanRepository : public ILoanRepository {
    public:
        User create_user(const std::string& username, const std::string& email) override;
        std::vector<User> list_users() override;
        std::optional<User> find_user(int user_id) override;
        std::optional<User> find_user_by_username_or_email(const std::string& username,
                                                          const std::string& email) override;

        Loan create_loan(int user_id,
                         money_cents amount,
                         const DecimalRate& annual_interest_rate,
                         int loan_term_in_months) override;
        std::vector<Loan> list_loans() override;
        std::vector<Loan> list_loans_for_user(int user_id) override;
        std::optional<Loan> find_loan(int loan_id) override;
        Loan add_share(int loan_id, int user_id) override;

    private:
        std::mutex mutex_;
        std::map<int, User> users_;
        std::map<int, Loan> loans_;
        int next_user_id_ = 1;
        int next_loan_id_ = 1;
    };

} // namespace store
} // namespace amori

#endif // AMORI_MEMORY_LOAN_REPOSITORY_HPP
