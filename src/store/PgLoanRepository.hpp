/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PgLoanRepository.hpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL storage through libpqxx. Each call opens its own connection and
 * transaction, so worker threads never share a pqxx::connection.
 * * Money is stored as BIGINT cents and rates as NUMERIC, so values come back
 * exactly as they went in.
 * ============================================================================
 */

#ifndef AMORI_PG_LOAN_REPOSITORY_HPP
#define AMORI_PG_LOAN_REPOSITORY_HPP

#include <pqxx/pqxx>
#include "LoanRepository.hpp"

namespace amori {
namespace store {

    class PgLoanRepository : public ILoanRepository {
    public:
        /**
         * @brief Connects once to verify the connection string and creates
         * the tables if they do not exist yet.
         * @throws pqxx::failure if the database is unreachable.
         */
        explicit PgLoanRepository(const std::string& conn_str);

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
        std::string conn_str_;

        void ensure_schema();
        static User user_from_row(const pqxx::row& row);
        static Loan loan_from_row(const pqxx::row& row);
        std::vector<Loan> query_loans(const std::string& where_clause);
    };

} // namespace store
} // namespace amori

#endif // AMORI_PG_LOAN_REPOSITORY_HPP
