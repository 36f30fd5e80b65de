/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: LoanApi.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The HTTP surface. Each route has a plain handler method that takes the raw
 * request pieces and returns an ApiResponse, and bind() wires those handlers
 * onto an httplib::Server. Keeping the two apart lets the handlers be driven
 * directly from tests without opening a socket.
 * * ROUTES:
 *   POST /users                    GET /users
 *   GET  /users/{id}/loans
 *   POST /loans                    GET /loans
 *   GET  /loans/{id}               POST /loans/{id}/share
 *   GET  /loans/{id}/schedule      GET  /loans/{id}/summary?month=N
 *   GET  /system/logs
 * * Currency always leaves as a decimal string ("1100.00").
 * Errors are {"detail": "..."} with 400, 404, 422 or 500.
 * ============================================================================
 */

#ifndef AMORI_LOAN_API_HPP
#define AMORI_LOAN_API_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../core/amortization.hpp"
#include "../store/LoanRepository.hpp"

using json = nlohmann::json;

namespace httplib {
class Server;
}

namespace amori {
namespace api {

    struct ApiResponse {
        int status = 200;
        json body;
    };

    class LoanApi {
    public:
        explicit LoanApi(std::shared_ptr<store::ILoanRepository> repository);

        // Users
        ApiResponse create_user(const std::string& body);
        ApiResponse list_users();
        ApiResponse list_loans_for_user(int user_id);

        // Loans
        ApiResponse create_loan(const std::string& body);
        ApiResponse list_loans();
        ApiResponse get_loan(int loan_id);
        ApiResponse share_loan(int loan_id, const std::string& body);

        // Derived views, recomputed on every call
        ApiResponse get_loan_schedule(int loan_id);
        ApiResponse get_loan_summary(int loan_id, const std::optional<std::string>& month);

        ApiResponse system_logs();

        /**
         * @brief Registers every route on the server.
         * The LoanApi must outlive the server's listen loop.
         */
        void bind(httplib::Server& svr);

        // Response body as sent on the wire; invalid UTF-8 is replaced, never thrown.
        static std::string to_wire(const ApiResponse& response);

        static json user_to_json(const store::User& user);
        static json loan_to_json(const store::Loan& loan);
        static json schedule_to_json(const Schedule& schedule);
        static json summary_to_json(const Summary& summary);

        static LoanParameters loan_parameters(const store::Loan& loan);
        static bool is_valid_email(const std::string& email);

    private:
        std::shared_ptr<store::ILoanRepository> repository_;

        // Runs a storage-touching handler; any exception becomes a logged 500.
        ApiResponse guarded(const std::string& operation, const std::function<ApiResponse()>& handler);
    };

} // namespace api
} // namespace amori

#endif // AMORI_LOAN_API_HPP
