/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service - Server
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 */

#include <memory>
#include <string>
#include <httplib.h>
#include "config.hpp"
#include "log.hpp"
#include "../api/LoanApi.hpp"
#include "../store/MemoryLoanRepository.hpp"
#include "../store/PgLoanRepository.hpp"

using amori::amori_log;

int main() {
    amori::ServiceConfig config;
    try {
        config = amori::ConfigLoader::load();
    } catch (const std::exception& e) {
        amori_log("FATAL", std::string("Configuration error: ") + e.what());
        return 1;
    }

    std::shared_ptr<amori::store::ILoanRepository> repository;
    if (config.store == "memory") {
        amori_log("WARN", "Using in-memory storage. Data will not survive a restart.");
        repository = std::make_shared<amori::store::MemoryLoanRepository>();
    } else {
        if (config.db_conn.empty()) {
            amori_log("FATAL", "Database connection variable missing. System halted.");
            return 1;
        }
        try {
            repository = std::make_shared<amori::store::PgLoanRepository>(config.db_conn);
        } catch (const std::exception& e) {
            amori_log("FATAL", std::string("Database unavailable: ") + e.what());
            return 1;
        }
    }

    amori::api::LoanApi api(repository);

    httplib::Server svr;
    amori_log("INFO", "Amori Loan Service: Engine Active.");

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        std::string log_msg = "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status);
        amori_log("INFO", log_msg);
    });

    api.bind(svr);

    amori_log("INFO", "Amori Server running on " + config.host + ":" + std::to_string(config.port));

    if (!svr.listen(config.host, config.port)) {
        amori_log("FATAL", "Unable to bind " + config.host + ":" + std::to_string(config.port));
        return 1;
    }

    return 0;
}
