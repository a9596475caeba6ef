#include "RedisServer.hpp"
#include "EventLoop.hpp"
#include "../utils/Logger.hpp"

#include <sys/socket.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

RedisServer::RedisServer(const ServerConfig& cfg) : config(cfg) {}

bool RedisServer::start() {
    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        Logger::error(std::string("failed to create server socket: ") + std::strerror(errno));
        return false;
    }

    int reuse = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        Logger::error(std::string("setsockopt failed: ") + std::strerror(errno));
        close(server_fd);
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config.port));
    if (inet_pton(AF_INET, config.bind.c_str(), &addr.sin_addr) != 1) {
        Logger::error("invalid bind address '" + config.bind + "'");
        close(server_fd);
        return false;
    }

    if (bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        Logger::error("failed to bind to port " + std::to_string(config.port) + ": " +
                      std::strerror(errno));
        close(server_fd);
        return false;
    }

    if (listen(server_fd, 128) != 0) {
        Logger::error(std::string("listen failed: ") + std::strerror(errno));
        close(server_fd);
        return false;
    }

    int flags = fcntl(server_fd, F_GETFL, 0);
    if (flags < 0 || fcntl(server_fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        Logger::error(std::string("fcntl failed: ") + std::strerror(errno));
        close(server_fd);
        return false;
    }

    Logger::info("listening on " + config.bind + ":" + std::to_string(config.port));

    {
        EventLoop loop(server_fd);
        loop.run();
    }

    close(server_fd);
    return false;
}
