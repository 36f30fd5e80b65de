#include "core/config.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

using namespace amori;

namespace {

ConfigLoader::EnvLookup env_from(const std::map<std::string, std::string>& vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::string write_config(const std::string& name, const std::string& contents) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream ofs(path);
    ofs << contents;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsWithEmptyEnvironment) {
    ServiceConfig config = ConfigLoader::load(env_from({}));
    EXPECT_EQ(config.store, "postgres");
    EXPECT_EQ(config.db_conn, "");
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8080);
}

TEST(ConfigTest, EnvironmentOverridesDefaults) {
    ServiceConfig config = ConfigLoader::load(env_from({
        {"AMORI_STORE", "memory"},
        {"AMORI_DB_CONN", "postgresql://amori@db/amori"},
        {"AMORI_HOST", "127.0.0.1"},
        {"AMORI_PORT", "9090"}
    }));
    EXPECT_EQ(config.store, "memory");
    EXPECT_EQ(config.db_conn, "postgresql://amori@db/amori");
    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 9090);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_STORE", "sqlite"}})), std::runtime_error);
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_PORT", "eighty"}})), std::runtime_error);
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_PORT", "80x"}})), std::runtime_error);
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_PORT", "70000"}})), std::runtime_error);
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_HOST", ""}})), std::runtime_error);
}

TEST(ConfigTest, ReadsJsonFileAndLetsEnvironmentWin) {
    std::string path = write_config("amori_config_test.json",
        R"({"store": "memory", "host": "10.0.0.5", "port": 7000, "db_conn": "dbname=file"})");

    ServiceConfig from_file = ConfigLoader::load(env_from({{"AMORI_CONFIG", path}}));
    EXPECT_EQ(from_file.store, "memory");
    EXPECT_EQ(from_file.host, "10.0.0.5");
    EXPECT_EQ(from_file.port, 7000);
    EXPECT_EQ(from_file.db_conn, "dbname=file");

    ServiceConfig overridden = ConfigLoader::load(env_from({{"AMORI_CONFIG", path}, {"AMORI_PORT", "7100"}}));
    EXPECT_EQ(overridden.port, 7100);
    EXPECT_EQ(overridden.host, "10.0.0.5");
}

TEST(ConfigTest, BadConfigFileIsAnError) {
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_CONFIG", ::testing::TempDir() + "no_such_amori.json"}})),
                 std::runtime_error);

    std::string broken = write_config("amori_broken.json", "{ store: ");
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_CONFIG", broken}})), std::runtime_error);

    std::string wrong_type = write_config("amori_wrong_type.json", R"({"port": [1]})");
    EXPECT_THROW(ConfigLoader::load(env_from({{"AMORI_CONFIG", wrong_type}})), std::runtime_error);
}

TEST(ConfigTest, ApplyJsonAcceptsPortAsString) {
    ServiceConfig config;
    ConfigLoader::apply_json(config, json{{"port", "8181"}});
    EXPECT_EQ(config.port, 8181);
    EXPECT_EQ(config.store, "postgres");
    EXPECT_THROW(ConfigLoader::apply_json(config, json::array()), std::runtime_error);
}
