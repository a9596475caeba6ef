#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "../src/config/Config.hpp"

namespace {

// argv-style view over a list of strings
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage)
            ptrs.push_back(&s[0]);
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }
};

std::string writeConfig(const std::string& name, const std::string& body) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << body;
    return path;
}

}  // namespace

TEST(ConfigTest, DefaultsWithoutArguments) {
    Argv args({"redlite-server"});
    ServerConfig cfg;
    std::string err;

    ASSERT_TRUE(parseCommandLine(args.argc(), args.argv(), cfg, err)) << err;
    EXPECT_EQ(6379, cfg.port);
    EXPECT_EQ("0.0.0.0", cfg.bind);
    EXPECT_EQ("info", cfg.log_level);
    EXPECT_FALSE(cfg.show_help);
}

TEST(ConfigTest, CommandLineFlags) {
    Argv args({"redlite-server", "--port", "7000", "--bind", "127.0.0.1", "--loglevel", "debug"});
    ServerConfig cfg;
    std::string err;

    ASSERT_TRUE(parseCommandLine(args.argc(), args.argv(), cfg, err)) << err;
    EXPECT_EQ(7000, cfg.port);
    EXPECT_EQ("127.0.0.1", cfg.bind);
    EXPECT_EQ("debug", cfg.log_level);
}

TEST(ConfigTest, RejectsBadFlags) {
    ServerConfig cfg;
    std::string err;

    Argv bad_port({"redlite-server", "--port", "70000"});
    EXPECT_FALSE(parseCommandLine(bad_port.argc(), bad_port.argv(), cfg, err));

    Argv missing({"redlite-server", "--port"});
    EXPECT_FALSE(parseCommandLine(missing.argc(), missing.argv(), cfg, err));

    Argv unknown({"redlite-server", "--verbose"});
    EXPECT_FALSE(parseCommandLine(unknown.argc(), unknown.argv(), cfg, err));
    EXPECT_NE(std::string::npos, err.find("--verbose"));

    Argv level({"redlite-server", "--loglevel", "loud"});
    EXPECT_FALSE(parseCommandLine(level.argc(), level.argv(), cfg, err));
}

TEST(ConfigTest, HelpFlag) {
    Argv args({"redlite-server", "-h"});
    ServerConfig cfg;
    std::string err;

    ASSERT_TRUE(parseCommandLine(args.argc(), args.argv(), cfg, err));
    EXPECT_TRUE(cfg.show_help);
    EXPECT_NE(std::string::npos, usage("redlite-server").find("--port"));
}

TEST(ConfigTest, LoadsFileAndFlagsOverrideIt) {
    std::string path = writeConfig("redlite_cfg_ok.conf",
                                   "# test config\n"
                                   "port 6400\n"
                                   "\n"
                                   "bind 127.0.0.1   # loopback only\n"
                                   "loglevel warn\n"
                                   "maxmemory 100mb\n");

    Argv args({"redlite-server", "--port", "6500", "--config", path});
    ServerConfig cfg;
    std::string err;

    ASSERT_TRUE(parseCommandLine(args.argc(), args.argv(), cfg, err)) << err;
    EXPECT_EQ(6500, cfg.port);
    EXPECT_EQ("127.0.0.1", cfg.bind);
    EXPECT_EQ("warn", cfg.log_level);
    EXPECT_EQ(path, cfg.config_file);

    std::remove(path.c_str());
}

TEST(ConfigTest, FileErrorsNameTheLine) {
    std::string path = writeConfig("redlite_cfg_bad.conf", "bind ::1\nport zero\n");

    ServerConfig cfg;
    std::string err;
    EXPECT_FALSE(loadConfigFile(path, cfg, err));
    EXPECT_NE(std::string::npos, err.find(":2:"));

    std::remove(path.c_str());

    EXPECT_FALSE(loadConfigFile(path, cfg, err));
    EXPECT_NE(std::string::npos, err.find("cannot open"));
}
