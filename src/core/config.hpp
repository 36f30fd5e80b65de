/**
 * ============================================================================
 * SOFTWARE: Amori: Loan Amortization Service
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Service settings. Values come from an optional JSON file named by
 * AMORI_CONFIG, then from the environment, which always wins:
 *
 *   AMORI_STORE    "postgres" (default) or "memory"
 *   AMORI_DB_CONN  libpqxx connection string, required for "postgres"
 *   AMORI_HOST     listen address, default 0.0.0.0
 *   AMORI_PORT     listen port, default 8080
 *
 * The JSON file uses the keys "store", "db_conn", "host" and "port".
 * ============================================================================
 */

#ifndef AMORI_CONFIG_HPP
#define AMORI_CONFIG_HPP

#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace amori {

    struct ServiceConfig {
        std::string store = "postgres";
        std::string db_conn;
        std::string host = "0.0.0.0";
        int port = 8080;
    };

    class ConfigLoader {
    public:
        typedef std::function<std::optional<std::string>(const std::string&)> EnvLookup;

        // Reads the real process environment.
        static ServiceConfig load();

        /**
         * @brief Builds the configuration from an arbitrary variable source.
         * @throws std::runtime_error on an unreadable config file or an
         * invalid value.
         */
        static ServiceConfig load(const EnvLookup& env);

        // Overlays the keys present in `doc` onto `config`.
        static void apply_json(ServiceConfig& config, const json& doc);

        static std::optional<std::string> process_env(const std::string& name);

    private:
        static int parse_port(const std::string& text);
        static void validate(const ServiceConfig& config);
    };

} // namespace amori

#endif // AMORI_CONFIG_HPP
