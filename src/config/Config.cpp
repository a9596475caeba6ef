#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

#include "../utils/Logger.hpp"
#include "../utils/parse.hpp"

namespace {

std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    if (first == s.end())
        return "";
    auto last = std::find_if_not(s.rbegin(), s.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return std::string(first, last);
}

bool applyPort(const std::string& value, ServerConfig& cfg, std::string& err) {
    long long port;
    if (!parseInteger(value, port) || port < 1 || port > 65535) {
        err = "invalid port '" + value + "'";
        return false;
    }
    cfg.port = static_cast<int>(port);
    return true;
}

bool applyLogLevel(const std::string& value, ServerConfig& cfg, std::string& err) {
    LogLevel level;
    if (!Logger::parseLevel(value, level)) {
        err = "invalid log level '" + value + "'";
        return false;
    }
    cfg.log_level = value;
    return true;
}

}  // namespace

bool loadConfigFile(const std::string& path, ServerConfig& cfg, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "cannot open config file '" + path + "'";
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string cleaned = trim(line.substr(0, line.find('#')));
        if (cleaned.empty())
            continue;

        std::istringstream iss(cleaned);
        std::string key;
        iss >> key;

        std::string value;
        std::getline(iss, value);
        value = trim(value);

        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        bool ok = true;
        if (key == "port") {
            ok = applyPort(value, cfg, err);
        } else if (key == "bind") {
            cfg.bind = value;
        } else if (key == "loglevel") {
            ok = applyLogLevel(value, cfg, err);
        }

        if (!ok) {
            err = path + ":" + std::to_string(line_no) + ": " + err;
            return false;
        }
    }

    return true;
}

bool parseCommandLine(int argc, char** argv, ServerConfig& cfg, std::string& err) {
    std::vector<std::string> args(argv + 1, argv + argc);

    // --config first so explicit flags win over file values
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                err = "--config requires a path";
                return false;
            }
            cfg.config_file = args[i + 1];
            if (!loadConfigFile(cfg.config_file, cfg, err))
                return false;
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
            continue;
        }

        if (arg != "--port" && arg != "--bind" && arg != "--loglevel" && arg != "--config") {
            err = "unknown option '" + arg + "'";
            return false;
        }

        if (i + 1 >= args.size()) {
            err = arg + " requires a value";
            return false;
        }

        const std::string& value = args[++i];
        if (arg == "--port") {
            if (!applyPort(value, cfg, err))
                return false;
        } else if (arg == "--bind") {
            cfg.bind = value;
        } else if (arg == "--loglevel") {
            if (!applyLogLevel(value, cfg, err))
                return false;
        }
    }

    return true;
}

std::string usage(const std::string& program) {
    return "Usage: " + program +
           " [--port <port>] [--bind <addr>] [--loglevel <error|warn|info|debug>]"
           " [--config <path>]\n";
}
