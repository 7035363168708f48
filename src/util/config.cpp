#include "pgwire/util/config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include "pgwire/error.hpp"

namespace pgwire::util {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

int parse_timeout(const std::string& text) {
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last || value < 0) {
        throw ConfigError("invalid timeout: '" + text + "'");
    }
    return value;
}

std::string require(const EnvLookup& lookup, const std::string& name) {
    auto value = lookup(name);
    if (!value) {
        throw ConfigError("environment variable " + name + " is not set");
    }
    return *value;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Connection settings come from HOST, PORT, USER, DATABASE and PASSWORD\n"
              << "unless a config file is given.\n"
              << "Options:\n"
              << "  -c, --config FILE        Config file path (replaces the environment)\n"
              << "  -H, --host HOST          Server host\n"
              << "  -p, --port PORT          Server port (default: 5432)\n"
              << "  -U, --user USER          User name\n"
              << "  -d, --database NAME      Database name\n"
              << "  -q, --query SQL          Query to run once the server is idle\n"
              << "  -t, --timeout SEC        Socket read/write timeout, 0 disables (default: 0)\n"
              << "      --ca-file FILE       PEM file with trusted CA certificates\n"
              << "      --no-verify          Do not verify the server certificate\n"
              << "  -l, --log-level LEVEL    Log level: debug, info, warn, error, none\n"
              << "  -h, --help               Show this help\n";
}

}  // namespace

uint16_t parse_port(const std::string& text) {
    unsigned int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last || value > 65535) {
        throw ConfigError("invalid port: '" + text + "'");
    }
    return static_cast<uint16_t>(value);
}

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "none") return LogLevel::None;
    return LogLevel::Info;
}

Config Config::load_env(const EnvLookup& lookup) {
    Config config;
    config.host = require(lookup, "HOST");
    config.port = parse_port(require(lookup, "PORT"));
    config.user = require(lookup, "USER");
    config.database = require(lookup, "DATABASE");
    config.password = require(lookup, "PASSWORD");

    if (auto query = lookup("QUERY")) {
        config.query = *query;
    }
    if (auto level = lookup("LOG_LEVEL")) {
        config.log_level = parse_log_level(*level);
    }
    return config;
}

Config Config::from_environment() {
    return load_env([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = parse_port(value);
        } else if (key == "user") {
            config.user = value;
        } else if (key == "database") {
            config.database = value;
        } else if (key == "password") {
            config.password = value;
        } else if (key == "query") {
            config.query = value;
        } else if (key == "timeout_seconds") {
            config.timeout_seconds = parse_timeout(value);
        } else if (key == "ssl_verify") {
            config.ssl_verify = (value == "true" || value == "1");
        } else if (key == "ssl_ca_file") {
            config.ssl_ca_file = value;
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return std::nullopt;
        }
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config.config_file = argv[++i];
        } else if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = parse_port(argv[++i]);
        } else if ((arg == "-U" || arg == "--user") && i + 1 < argc) {
            config.user = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            config.database = argv[++i];
        } else if ((arg == "-q" || arg == "--query") && i + 1 < argc) {
            config.query = argv[++i];
        } else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc) {
            config.timeout_seconds = parse_timeout(argv[++i]);
        } else if (arg == "--ca-file" && i + 1 < argc) {
            config.ssl_ca_file = argv[++i];
        } else if (arg == "--no-verify") {
            config.ssl_verify = false;
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = parse_log_level(argv[++i]);
        } else {
            throw ConfigError("unknown or incomplete option: " + arg);
        }
    }

    return config;
}

Config Config::merge(const Config& base, const Config& cli_config, const Config& defaults) {
    Config result = base;
    if (cli_config.host != defaults.host) result.host = cli_config.host;
    if (cli_config.port != defaults.port) result.port = cli_config.port;
    if (cli_config.user != defaults.user) result.user = cli_config.user;
    if (cli_config.database != defaults.database) result.database = cli_config.database;
    if (cli_config.password != defaults.password) result.password = cli_config.password;
    if (cli_config.timeout_seconds != defaults.timeout_seconds) result.timeout_seconds = cli_config.timeout_seconds;
    if (cli_config.query != defaults.query) result.query = cli_config.query;
    if (cli_config.ssl_verify != defaults.ssl_verify) result.ssl_verify = cli_config.ssl_verify;
    if (cli_config.ssl_ca_file != defaults.ssl_ca_file) result.ssl_ca_file = cli_config.ssl_ca_file;
    if (cli_config.log_level != defaults.log_level) result.log_level = cli_config.log_level;
    if (cli_config.config_file != defaults.config_file) result.config_file = cli_config.config_file;
    return result;
}

void Config::validate() const {
    if (host.empty()) {
        throw ConfigError("host is empty");
    }
    if (port == 0) {
        throw ConfigError("port must be non-zero");
    }
    if (user.empty()) {
        throw ConfigError("user is empty");
    }
    if (database.empty()) {
        throw ConfigError("database is empty");
    }
}

}  // namespace pgwire::util
