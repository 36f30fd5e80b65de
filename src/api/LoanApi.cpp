/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: LoanApi.cpp
 * ============================================================================
 */

#include "LoanApi.hpp"
#include "../core/log.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <httplib.h>

namespace amori {
namespace api {

namespace {

ApiResponse respond(int status, json body) {
    ApiResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

ApiResponse error_response(int status, const std::string& detail) {
    return respond(status, {{"detail", detail}});
}

// Decimal text of a JSON amount. Floats go through their shortest
// round-trip form, so 5.5 arrives as "5.5" and never as 5.49999...
std::string decimal_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_unsigned()) return std::to_string(value.get<uint64_t>());
    if (value.is_number_integer()) return std::to_string(value.get<int64_t>());
    if (value.is_number_float()) return value.dump();
    throw std::invalid_argument("expected a decimal number");
}

int integer_field(const json& doc, const std::string& key) {
    const json& value = doc.at(key);
    if (!value.is_number_integer()) {
        throw std::invalid_argument(key + " must be an integer");
    }
    int64_t wide = value.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(key + " is out of range");
    }
    return static_cast<int>(wide);
}

std::optional<int> parse_int(const std::string& text) {
    // std::stoi alone would also take leading blanks and '+'.
    if (text.empty() || !(std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-')) {
        return std::nullopt;
    }
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (consumed != text.size()) {
        return std::nullopt;
    }
    return value;
}

// Path ids too large for an int cannot name a stored row.
int path_id(const httplib::Request& req) {
    std::optional<int> id = parse_int(req.matches[1]);
    return id ? *id : 0;
}

void send(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    res.set_content(LoanApi::to_wire(response), "application/json");
}

ApiResponse engine_failure(EngineError error, const std::string& message) {
    amori_log("DEBUG", std::string("Engine rejected request: ") + to_string(error) + " (" + message + ")");
    return error_response(400, message);
}

} // namespace

LoanApi::LoanApi(std::shared_ptr<store::ILoanRepository> repository)
    : repository_(std::move(repository)) {
    if (!repository_) {
        throw std::invalid_argument("LoanApi requires a repository");
    }
}

// ----------------------------------------------------------------------------
// Serialisation
// ----------------------------------------------------------------------------
std::string LoanApi::to_wire(const ApiResponse& response) {
    // Parser errors quote the offending bytes, which need not be valid UTF-8.
    return response.body.dump(-1, ' ', false, json::error_handler_t::replace);
}

json LoanApi::user_to_json(const store::User& user) {
    return {
        {"id", user.id},
        {"username", user.username},
        {"email", user.email}
    };
}

json LoanApi::loan_to_json(const store::Loan& loan) {
    return {
        {"id", loan.id},
        {"user_id", loan.user_id},
        {"amount", format_money(loan.amount)},
        {"annual_interest_rate", loan.annual_interest_rate.to_string()},
        {"loan_term_in_months", loan.loan_term_in_months},
        {"shared_user_ids", loan.shared_user_ids}
    };
}

json LoanApi::schedule_to_json(const Schedule& schedule) {
    json rows = json::array();
    for (const auto& entry : schedule.entries) {
        rows.push_back({
            {"month", entry.month},
            {"remaining_balance", format_money(entry.remaining_balance)},
            {"monthly_payment", format_money(entry.monthly_payment)}
        });
    }
    return rows;
}

json LoanApi::summary_to_json(const Summary& summary) {
    return {
        {"current_principal_balance", format_money(summary.current_principal_balance)},
        {"total_principal_paid", format_money(summary.total_principal_paid)},
        {"total_interest_paid", format_money(summary.total_interest_paid)}
    };
}

LoanParameters LoanApi::loan_parameters(const store::Loan& loan) {
    LoanParameters params;
    params.principal = loan.amount;
    params.annual_rate_percent = loan.annual_interest_rate;
    params.term_months = loan.loan_term_in_months;
    return params;
}

bool LoanApi::is_valid_email(const std::string& email) {
    size_t at = email.find('@');
    if (at == std::string::npos || at == 0 || email.find('@', at + 1) != std::string::npos) {
        return false;
    }
    std::string domain = email.substr(at + 1);
    size_t dot = domain.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot == domain.size() - 1) {
        return false;
    }
    return std::none_of(email.begin(), email.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

ApiResponse LoanApi::guarded(const std::string& operation, const std::function<ApiResponse()>& handler) {
    try {
        return handler();
    } catch (const std::exception& e) {
        amori_log("ERROR", operation + " failed: " + e.what());
        return error_response(500, "Internal server error");
    }
}

// ----------------------------------------------------------------------------
// Users
// ----------------------------------------------------------------------------
ApiResponse LoanApi::create_user(const std::string& body) {
    std::string username;
    std::string email;
    try {
        auto j = json::parse(body);
        username = j.at("username").get<std::string>();
        email = j.at("email").get<std::string>();
    } catch (const std::exception& e) {
        amori_log("DEBUG", std::string("Rejected user payload: ") + e.what());
        return error_response(422, "Invalid user payload");
    }
    if (username.empty()) {
        return error_response(422, "username must not be empty");
    }
    if (!is_valid_email(email)) {
        return error_response(422, "value is not a valid email address");
    }

    return guarded("create_user", [&]() {
        store::User user;
        try {
            user = repository_->create_user(username, email);
        } catch (const store::DuplicateUserError& e) {
            return error_response(400, e.what());
        }
        amori_log("INFO", "User " + std::to_string(user.id) + " registered: " + user.username);
        return respond(201, user_to_json(user));
    });
}

ApiResponse LoanApi::list_users() {
    return guarded("list_users", [&]() {
        json users = json::array();
        for (const auto& user : repository_->list_users()) {
            users.push_back(user_to_json(user));
        }
        return respond(200, users);
    });
}

ApiResponse LoanApi::list_loans_for_user(int user_id) {
    return guarded("list_loans_for_user", [&]() {
        if (!repository_->find_user(user_id)) {
            return error_response(404, "User not found");
        }
        json loans = json::array();
        for (const auto& loan : repository_->list_loans_for_user(user_id)) {
            loans.push_back(loan_to_json(loan));
        }
        return respond(200, loans);
    });
}

// ----------------------------------------------------------------------------
// Loans
// ----------------------------------------------------------------------------
ApiResponse LoanApi::create_loan(const std::string& body) {
    int user_id = 0;
    money_cents amount = 0;
    DecimalRate rate;
    int term = 0;
    try {
        auto j = json::parse(body);
        user_id = integer_field(j, "user_id");
        amount = parse_money(decimal_text(j.at("amount")));
        rate = parse_decimal(decimal_text(j.at("annual_interest_rate")));
        term = integer_field(j, "loan_term_in_months");
    } catch (const std::exception& e) {
        amori_log("DEBUG", std::string("Rejected loan payload: ") + e.what());
        return error_response(422, "Invalid loan payload");
    }

    return guarded("create_loan", [&]() {
        if (!repository_->find_user(user_id)) {
            return error_response(404, "User not found");
        }
        store::Loan loan = repository_->create_loan(user_id, amount, rate, term);
        amori_log("INFO", "Loan " + std::to_string(loan.id) + " registered for user " +
                  std::to_string(user_id) + ": " + format_money(amount) + " at " +
                  rate.to_string() + "% over " + std::to_string(term) + " months");
        return respond(201, loan_to_json(loan));
    });
}

ApiResponse LoanApi::list_loans() {
    return guarded("list_loans", [&]() {
        json loans = json::array();
        for (const auto& loan : repository_->list_loans()) {
            loans.push_back(loan_to_json(loan));
        }
        return respond(200, loans);
    });
}

ApiResponse LoanApi::get_loan(int loan_id) {
    return guarded("get_loan", [&]() {
        std::optional<store::Loan> loan = repository_->find_loan(loan_id);
        if (!loan) {
            return error_response(404, "Loan not found");
        }
        return respond(200, loan_to_json(*loan));
    });
}

ApiResponse LoanApi::share_loan(int loan_id, const std::string& body) {
    int target_id = 0;
    try {
        auto j = json::parse(body);
        target_id = integer_field(j, "user_id");
    } catch (const std::exception& e) {
        amori_log("DEBUG", std::string("Rejected share payload: ") + e.what());
        return error_response(422, "Invalid share payload");
    }

    return guarded("share_loan", [&]() {
        std::optional<store::Loan> loan = repository_->find_loan(loan_id);
        if (!loan) {
            return error_response(404, "Loan not found");
        }
        if (!repository_->find_user(target_id)) {
            return error_response(404, "User to share with not found");
        }
        if (target_id == loan->user_id) {
            return error_response(400, "Owner already has access to this loan");
        }
        const std::vector<int>& shared = loan->shared_user_ids;
        if (std::find(shared.begin(), shared.end(), target_id) != shared.end()) {
            return error_response(400, "Loan already shared with this user");
        }

        store::Loan updated = repository_->add_share(loan_id, target_id);
        amori_log("INFO", "Loan " + std::to_string(loan_id) + " shared with user " + std::to_string(target_id));
        return respond(200, loan_to_json(updated));
    });
}

// ----------------------------------------------------------------------------
// Schedule & Summary
// ----------------------------------------------------------------------------
ApiResponse LoanApi::get_loan_schedule(int loan_id) {
    return guarded("get_loan_schedule", [&]() {
        std::optional<store::Loan> loan = repository_->find_loan(loan_id);
        if (!loan) {
            return error_response(404, "Loan not found");
        }

        EngineResult<Schedule> schedule = AmortizationEngine::get_schedule(loan_parameters(*loan));
        if (!schedule.ok()) {
            return engine_failure(schedule.error, schedule.message);
        }
        return respond(200, schedule_to_json(schedule.value));
    });
}

ApiResponse LoanApi::get_loan_summary(int loan_id, const std::optional<std::string>& month) {
    if (!month) {
        return error_response(422, "month query parameter is required");
    }
    std::optional<int> month_value = parse_int(*month);
    if (!month_value) {
        return error_response(422, "month must be an integer");
    }

    return guarded("get_loan_summary", [&]() {
        std::optional<store::Loan> loan = repository_->find_loan(loan_id);
        if (!loan) {
            return error_response(404, "Loan not found");
        }

        EngineResult<Summary> summary = AmortizationEngine::get_summary(loan_parameters(*loan), *month_value);
        if (!summary.ok()) {
            return engine_failure(summary.error, summary.message);
        }
        return respond(200, summary_to_json(summary.value));
    });
}

ApiResponse LoanApi::system_logs() {
    json response;
    response["logs"] = recent_logs();
    return respond(200, response);
}

// ----------------------------------------------------------------------------
// Routing
// ----------------------------------------------------------------------------
void LoanApi::bind(httplib::Server& svr) {
    svr.Post("/users", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, create_user(req.body));
    });

    svr.Get("/users", [this](const httplib::Request&, httplib::Response& res) {
        send(res, list_users());
    });

    svr.Get(R"(/users/(\d+)/loans)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, list_loans_for_user(path_id(req)));
    });

    svr.Post("/loans", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, create_loan(req.body));
    });

    svr.Get("/loans", [this](const httplib::Request&, httplib::Response& res) {
        send(res, list_loans());
    });

    svr.Get(R"(/loans/(\d+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, get_loan(path_id(req)));
    });

    svr.Post(R"(/loans/(\d+)/share)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, share_loan(path_id(req), req.body));
    });

    svr.Get(R"(/loans/(\d+)/schedule)", [this](const httplib::Request& req, httplib::Response& res) {
        send(res, get_loan_schedule(path_id(req)));
    });

    svr.Get(R"(/loans/(\d+)/summary)", [this](const httplib::Request& req, httplib::Response& res) {
        std::optional<std::string> month;
        if (req.has_param("month")) {
            month = req.get_param_value("month");
        }
        send(res, get_loan_summary(path_id(req), month));
    });

    svr.Get("/system/logs", [this](const httplib::Request&, httplib::Response& res) {
        send(res, system_logs());
    });
}

} // namespace api
} // namespace amori
