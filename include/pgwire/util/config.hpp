#ifndef PGWIRE_UTIL_CONFIG_HPP
#define PGWIRE_UTIL_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "pgwire/util/logger.hpp"

namespace pgwire::util {

// returns the value of a variable, nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

struct Config {
    // connection
    std::string host;
    uint16_t port = 5432;
    std::string user;
    std::string database;
    std::string password;
    int timeout_seconds = 0;  // 0 = block forever

    // session
    std::string query = "SELECT * FROM my_table LIMIT 3;";

    // tls
    bool ssl_verify = true;
    std::string ssl_ca_file;

    // logging
    LogLevel log_level = LogLevel::Info;

    // set by -c/--config, consumed by main
    std::filesystem::path config_file;

    // HOST, PORT, USER, DATABASE, PASSWORD are required; QUERY and LOG_LEVEL optional.
    // throws ConfigError on a missing variable or a bad port
    static Config load_env(const EnvLookup& lookup);
    static Config from_environment();

    // load from file (key = value lines), nullopt if it cannot be opened
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help. throws ConfigError on bad input
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides base wherever it differs from defaults
    static Config merge(const Config& base, const Config& cli_config, const Config& defaults);

    // throws ConfigError if a field needed to connect is empty
    void validate() const;
};

[[nodiscard]] uint16_t parse_port(const std::string& text);
[[nodiscard]] LogLevel parse_log_level(const std::string& text);

}  // namespace pgwire::util

#endif
