/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: LoanRepository.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The data-access contract for users, loans and loan sharing. The API layer
 * is handed an ILoanRepository and never knows which backend sits behind it
 * (MemoryLoanRepository for tests and dev, PgLoanRepository in production).
 * * Schedules and summaries are never stored; only the loan terms are.
 * ============================================================================
 */

#ifndef AMORI_LOAN_REPOSITORY_HPP
#define AMORI_LOAN_REPOSITORY_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/money.hpp"

namespace amori {
namespace store {

    struct User {
        int id = 0;
        std::string username;
        std::string email;
    };

    /**
     * @brief A registered loan and the users it has been shared with.
     */
    struct Loan {
        int id = 0;
        int user_id = 0;                    // owner
        money_cents amount = 0;
        DecimalRate annual_interest_rate;
        int loan_term_in_months = 0;
        std::vector<int> shared_user_ids;   // in the order access was granted
    };

    // Thrown by create_user when the username or email is already taken.
    class DuplicateUserError : public std::runtime_error {
    public:
        explicit DuplicateUserError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief Storage backend interface.
     * Implementations must be safe to call from the server's worker threads.
     * Backend failures are reported by throwing.
     */
    class ILoanRepository {
    public:
        virtual ~ILoanRepository() {}

        /**
         * @brief Registers a user. The uniqueness check and the insert are one step.
         * @throws DuplicateUserError when the username or email is taken.
         */
        virtual User create_user(const std::string& username, const std::string& email) = 0;
        virtual std::vector<User> list_users() = 0;
        virtual std::optional<User> find_user(int user_id) = 0;

        /**
         * @return A user holding either the username or the email, if any.
         */
        virtual std::optional<User> find_user_by_username_or_email(const std::string& username,
                                                                  const std::string& email) = 0;

        virtual Loan create_loan(int user_id,
                                 money_cents amount,
                                 const DecimalRate& annual_interest_rate,
                                 int loan_term_in_months) = 0;
        virtual std::vector<Loan> list_loans() = 0;
        virtual std::vector<Loan> list_loans_for_user(int user_id) = 0;
        virtual std::optional<Loan> find_loan(int loan_id) = 0;

        /**
         * @brief Grants `user_id` read access to the loan.
         * Callers check ownership and duplicates first.
         * @return The loan as stored after the grant.
         */
        virtual Loan add_share(int loan_id, int user_id) = 0;
    };

} // namespace store
} // namespace amori

#endif // AMORI_LOAN_REPOSITORY_HPP
