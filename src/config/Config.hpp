#pragma once
#include <string>

struct ServerConfig {
    int port = 6379;
    std::string bind = "0.0.0.0";
    std::string log_level = "info";
    std::string config_file;
    bool show_help = false;
};

/**
 * Reads a redis.conf-style file:
 *
 *   # comment
 *   port 6380
 *   bind 127.0.0.1
 *   loglevel debug
 *
 * Unknown directives are ignored. Returns false (with `err` set)
 * if the file cannot be opened or a known directive has a bad value.
 */
bool loadConfigFile(const std::string& path, ServerConfig& cfg, std::string& err);

/**
 * Parses --port, --bind, --loglevel, --config and --help.
 * A --config file is loaded first and the remaining flags override it.
 */
bool parseCommandLine(int argc, char** argv, ServerConfig& cfg, std::string& err);

std::string usage(const std::string& program);
