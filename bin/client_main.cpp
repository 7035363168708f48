#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include "pgwire/error.hpp"
#include "pgwire/net/client/connection.hpp"
#include "pgwire/util/config.hpp"
#include "pgwire/util/logger.hpp"

using pgwire::net::client::Connection;
using pgwire::net::client::ConnectionOptions;
using pgwire::util::Config;

namespace {

// nullopt when --help was shown
std::optional<Config> load_config(int argc, char* argv[]) {
    Config defaults;

    auto cli_result = Config::parse_args(argc, argv);
    if (!cli_result) {
        return std::nullopt;
    }
    Config cli_config = *cli_result;

    // base: config file if given, environment otherwise
    Config base;
    if (!cli_config.config_file.empty()) {
        auto loaded = Config::load_file(cli_config.config_file);
        if (!loaded) {
            throw pgwire::ConfigError("could not load config file: " +
                                      cli_config.config_file.string());
        }
        base = *loaded;
    } else {
        base = Config::from_environment();
    }

    // merge: CLI > base > defaults
    Config config = Config::merge(base, cli_config, defaults);
    config.validate();
    return config;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto loaded = load_config(argc, argv);
        if (!loaded) {
            return 0;
        }
        const Config& config = *loaded;

        pgwire::util::Logger::instance().set_level(config.log_level);

        Connection connection(ConnectionOptions::from_config(config));
        connection.run();
        return 0;

    } catch (const pgwire::Error& e) {
        std::string message = std::string(pgwire::to_string(e.kind())) + ": " + e.what();
        // config errors happen before the logger is configured
        if (e.kind() == pgwire::ErrorKind::Config) {
            std::cerr << "Error: " << message << std::endl;
        } else {
            LOG_ERROR("Error: " + message);
        }
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
