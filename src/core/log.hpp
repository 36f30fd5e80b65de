/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: log.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Process-wide log. Every entry goes to stdout and into a ring buffer of the
 * most recent LOG_CAPACITY lines, which the API serves at /system/logs.
 * ============================================================================
 */

#ifndef AMORI_LOG_HPP
#define AMORI_LOG_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace amori {

    const size_t LOG_CAPACITY = 200;

    // Levels in use: DEBUG, INFO, WARN, ERROR, FATAL
    void amori_log(const std::string& level, const std::string& message);

    // Oldest first.
    std::vector<std::string> recent_logs();

    void clear_logs();

} // namespace amori

#endif // AMORI_LOG_HPP
