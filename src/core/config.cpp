/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "log.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace amori {

std::optional<std::string> ConfigLoader::process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

ServiceConfig ConfigLoader::load() {
    return load(&ConfigLoader::process_env);
}

ServiceConfig ConfigLoader::load(const EnvLookup& env) {
    ServiceConfig config;

    if (auto path = env("AMORI_CONFIG")) {
        std::ifstream ifs(*path);
        if (!ifs.is_open()) {
            throw std::runtime_error("Config file not readable: " + *path);
        }
        try {
            apply_json(config, json::parse(ifs));
        } catch (const json::exception& e) {
            throw std::runtime_error("Config parse error in " + *path + ": " + e.what());
        }
        amori_log("INFO", "Loaded configuration file " + *path);
    }

    if (auto store = env("AMORI_STORE")) config.store = *store;
    if (auto db_conn = env("AMORI_DB_CONN")) config.db_conn = *db_conn;
    if (auto host = env("AMORI_HOST")) config.host = *host;
    if (auto port = env("AMORI_PORT")) config.port = parse_port(*port);

    validate(config);
    return config;
}

void ConfigLoader::apply_json(ServiceConfig& config, const json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config document must be a JSON object");
    }
    if (doc.contains("store")) config.store = doc.at("store").get<std::string>();
    if (doc.contains("db_conn")) config.db_conn = doc.at("db_conn").get<std::string>();
    if (doc.contains("host")) config.host = doc.at("host").get<std::string>();
    if (doc.contains("port")) {
        const json& port = doc.at("port");
        config.port = port.is_string() ? parse_port(port.get<std::string>()) : port.get<int>();
    }
}

int ConfigLoader::parse_port(const std::string& text) {
    size_t consumed = 0;
    int port = 0;
    try {
        port = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: " + text);
    }
    if (consumed != text.size()) {
        throw std::runtime_error("Invalid port: " + text);
    }
    return port;
}

void ConfigLoader::validate(const ServiceConfig& config) {
    if (config.store != "postgres" && config.store != "memory") {
        throw std::runtime_error("Unknown store '" + config.store + "' (expected postgres or memory)");
    }
    if (config.port < 1 || config.port > 65535) {
        throw std::runtime_error("Port out of range: " + std::to_string(config.port));
    }
    if (config.host.empty()) {
        throw std::runtime_error("Listen host must not be empty");
    }
}

} // namespace amori
