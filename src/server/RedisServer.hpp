#pragma once

#include "../config/Config.hpp"

// Owns the listening socket and runs the event loop on it.
class RedisServer {
    ServerConfig config;

public:
    explicit RedisServer(const ServerConfig& cfg);

    // Blocks while serving. Returns false if the socket could not be
    // set up or the event loop failed.
    bool start();
};
