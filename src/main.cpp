#include <csignal>
#include <iostream>
#include <string>

#include "config/Config.hpp"
#include "server/RedisServer.hpp"
#include "utils/Logger.hpp"

int main(int argc, char **argv) {
    std::signal(SIGPIPE, SIG_IGN);

    ServerConfig config;
    std::string err;
    if (!parseCommandLine(argc, argv, config, err)) {
        std::cerr << err << "\n" << usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLevel(config.log_level, level)) {
        std::cerr << "invalid log level '" << config.log_level << "'\n";
        return 1;
    }
    Logger::setLevel(level);

    Logger::info("starting redlite-server");
    if (!config.config_file.empty())
        Logger::info("loaded configuration from " + config.config_file);

    RedisServer server(config);
    return server.start() ? 0 : 1;
}
