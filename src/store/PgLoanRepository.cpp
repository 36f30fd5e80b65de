/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: PgLoanRepository.cpp
 * ============================================================================
 */

#include "PgLoanRepository.hpp"
#include "../core/log.hpp"
#include <sstream>
#include <stdexcept>

namespace amori {
namespace store {

namespace {

// Shared user ids ride along as a comma list, ordered by grant.
const std::string LOAN_SELECT =
    "SELECT l.id, l.user_id, l.amount_cents, l.annual_interest_rate::text, l.loan_term_in_months, "
    "COALESCE((SELECT string_agg(s.user_id::text, ',' ORDER BY s.id) FROM loan_shares s WHERE s.loan_id = l.id), '') "
    "FROM loans l";

std::vector<int> split_ids(const std::string& csv) {
    std::vector<int> ids;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) ids.push_back(std::stoi(item));
    }
    return ids;
}

} // namespace

PgLoanRepository::PgLoanRepository(const std::string& conn_str) : conn_str_(conn_str) {
    ensure_schema();
}

void PgLoanRepository::ensure_schema() {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);

    W.exec("CREATE TABLE IF NOT EXISTS users ("
           "id SERIAL PRIMARY KEY, "
           "username TEXT UNIQUE NOT NULL, "
           "email TEXT UNIQUE NOT NULL)");
    W.exec("CREATE TABLE IF NOT EXISTS loans ("
           "id SERIAL PRIMARY KEY, "
           "user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE, "
           "amount_cents BIGINT NOT NULL, "
           "annual_interest_rate NUMERIC NOT NULL, "
           "loan_term_in_months INTEGER NOT NULL)");
    W.exec("CREATE TABLE IF NOT EXISTS loan_shares ("
           "id BIGSERIAL PRIMARY KEY, "
           "loan_id INTEGER NOT NULL REFERENCES loans(id) ON DELETE CASCADE, "
           "user_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE, "
           "UNIQUE (loan_id, user_id))");

    W.commit();
    amori_log("INFO", "Database schema verified.");
}

User PgLoanRepository::user_from_row(const pqxx::row& row) {
    User user;
    user.id = row[0].as<int>();
    user.username = row[1].as<std::string>();
    user.email = row[2].as<std::string>();
    return user;
}

Loan PgLoanRepository::loan_from_row(const pqxx::row& row) {
    Loan loan;
    loan.id = row[0].as<int>();
    loan.user_id = row[1].as<int>();
    loan.amount = row[2].as<long long>();
    loan.annual_interest_rate = parse_decimal(row[3].as<std::string>());
    loan.loan_term_in_months = row[4].as<int>();
    loan.shared_user_ids = split_ids(row[5].as<std::string>());
    return loan;
}

User PgLoanRepository::create_user(const std::string& username, const std::string& email) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    try {
        pqxx::result R = W.exec("INSERT INTO users (username, email) VALUES (" +
                                W.quote(username) + ", " + W.quote(email) +
                                ") RETURNING id, username, email");
        W.commit();
        return user_from_row(R[0]);
    } catch (const pqxx::unique_violation&) {
        throw DuplicateUserError("Username or email already exists");
    }
}

std::vector<User> PgLoanRepository::list_users() {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result R = W.exec("SELECT id, username, email FROM users ORDER BY id ASC");

    std::vector<User> users;
    for (auto row : R) {
        users.push_back(user_from_row(row));
    }
    return users;
}

std::optional<User> PgLoanRepository::find_user(int user_id) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result R = W.exec("SELECT id, username, email FROM users WHERE id = " + std::to_string(user_id));
    if (R.empty()) {
        return std::nullopt;
    }
    return user_from_row(R[0]);
}

std::optional<User> PgLoanRepository::find_user_by_username_or_email(const std::string& username,
                                                                     const std::string& email) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result R = W.exec("SELECT id, username, email FROM users WHERE username = " + W.quote(username) +
                            " OR email = " + W.quote(email) + " ORDER BY id ASC LIMIT 1");
    if (R.empty()) {
        return std::nullopt;
    }
    return user_from_row(R[0]);
}

Loan PgLoanRepository::create_loan(int user_id,
                                   money_cents amount,
                                   const DecimalRate& annual_interest_rate,
                                   int loan_term_in_months) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result R = W.exec("INSERT INTO loans (user_id, amount_cents, annual_interest_rate, loan_term_in_months) VALUES (" +
                            std::to_string(user_id) + ", " +
                            std::to_string(amount) + ", " +
                            W.quote(annual_interest_rate.to_string()) + "::numeric, " +
                            std::to_string(loan_term_in_months) + ") RETURNING id");
    W.commit();

    Loan loan;
    loan.id = R[0][0].as<int>();
    loan.user_id = user_id;
    loan.amount = amount;
    loan.annual_interest_rate = annual_interest_rate;
    loan.loan_term_in_months = loan_term_in_months;
    return loan;
}

std::vector<Loan> PgLoanRepository::query_loans(const std::string& where_clause) {
    pqxx::connection C(conn_str_);
    pqxx::work W(C);
    pqxx::result R = W.exec(LOAN_SELECT + where_clause + " ORDER BY l.id ASC");

    std::vector<Loan> loans;
    for (auto row : R) {
        loans.push_back(loan_from_row(row));
    }
    return loans;
}

std::vector<Loan> PgLoanRepository::list_loans() {
    return query_loans("");
}

std::vector<Loan> PgLoanRepository::list_loans_for_user(int user_id) {
    return query_loans(" WHERE l.user_id = " + std::to_string(user_id));
}

std::optional<Loan> PgLoanRepository::find_loan(int loan_id) {
    std::vector<Loan> loans = query_loans(" WHERE l.id = " + std::to_string(loan_id));
    if (loans.empty()) {
        return std::nullopt;
    }
    return loans.front();
}

Loan PgLoanRepository::add_share(int loan_id, int user_id) {
    {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("INSERT INTO loan_shares (loan_id, user_id) VALUES (" +
               std::to_string(loan_id) + ", " + std::to_string(user_id) +
               ") ON CONFLICT (loan_id, user_id) DO NOTHING");
        W.commit();
    }

    std::optional<Loan> loan = find_loan(loan_id);
    if (!loan) {
        throw std::runtime_error("Loan " + std::to_string(loan_id) + " vanished after share");
    }
    return *loan;
}

} // namespace store
} // namespace amori
