/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: log.cpp
 * ============================================================================
 */

#include "log.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace amori {

namespace {

std::deque<std::string> system_logs;
std::mutex log_mutex;

} // namespace

void amori_log(const std::string& level, const std::string& message) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_time{};
    localtime_r(&now, &local_time);

    std::stringstream ss;
    ss << std::put_time(&local_time, "%H:%M:%S");

    std::string log_entry = "[" + ss.str() + "] [" + level + "] " + message;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (system_logs.size() >= LOG_CAPACITY) {
        system_logs.pop_front();
    }
    system_logs.push_back(log_entry);

    std::cout << log_entry << std::endl;
}

std::vector<std::string> recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return std::vector<std::string>(system_logs.begin(), system_logs.end());
}

void clear_logs() {
    std::lock_guard<std::mutex> lock(log_mutex);
    system_logs.clear();
}

} // namespace amori
