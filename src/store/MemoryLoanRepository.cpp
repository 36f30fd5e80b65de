/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: MemoryLoanRepository.cpp
 * ============================================================================
 */

#include "MemoryLoanRepository.hpp"
#include <algorithm>
#include <stdexcept>

namespace amori {
namespace store {

User MemoryLoanRepository::create_user(const std::string& username, const std::string& email) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pair : users_) {
        if (pair.second.username == username || pair.second.email == email) {
            throw DuplicateUserError("Username or email already exists");
        }
    }
    User user;
    user.id = next_user_id_++;
    user.username = username;
    user.email = email;
    users_[user.id] = user;
    return user;
}

std::vector<User> MemoryLoanRepository::list_users() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<User> users;
    for (const auto& pair : users_) {
        users.push_back(pair.second);
    }
    return users;
}

std::optional<User> MemoryLoanRepository::find_user(int user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<User> MemoryLoanRepository::find_user_by_username_or_email(const std::string& username,
                                                                         const std::string& email) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& pair : users_) {
        if (pair.second.username == username || pair.second.email == email) {
            return pair.second;
        }
    }
    return std::nullopt;
}

Loan MemoryLoanRepository::create_loan(int user_id,
                                       money_cents amount,
                                       const DecimalRate& annual_interest_rate,
                                       int loan_term_in_months) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_.find(user_id) == users_.end()) {
        throw std::runtime_error("Loan owner " + std::to_string(user_id) + " does not exist");
    }
    Loan loan;
    loan.id = next_loan_id_++;
    loan.user_id = user_id;
    loan.amount = amount;
    loan.annual_interest_rate = annual_interest_rate;
    loan.loan_term_in_months = loan_term_in_months;
    loans_[loan.id] = loan;
    return loan;
}

std::vector<Loan> MemoryLoanRepository::list_loans() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Loan> loans;
    for (const auto& pair : loans_) {
        loans.push_back(pair.second);
    }
    return loans;
}

std::vector<Loan> MemoryLoanRepository::list_loans_for_user(int user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Loan> loans;
    for (const auto& pair : loans_) {
        if (pair.second.user_id == user_id) {
            loans.push_back(pair.second);
        }
    }
    return loans;
}

std::optional<Loan> MemoryLoanRepository::find_loan(int loan_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loans_.find(loan_id);
    if (it == loans_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Loan MemoryLoanRepository::add_share(int loan_id, int user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loan_it = loans_.find(loan_id);
    if (loan_it == loans_.end()) {
        throw std::runtime_error("Loan " + std::to_string(loan_id) + " does not exist");
    }
    if (users_.find(user_id) == users_.end()) {
        throw std::runtime_error("User " + std::to_string(user_id) + " does not exist");
    }

    std::vector<int>& shared = loan_it->second.shared_user_ids;
    if (std::find(shared.begin(), shared.end(), user_id) == shared.end()) {
        shared.push_back(user_id);
    }
    return loan_it->second;
}

} // namespace store
} // namespace amori
