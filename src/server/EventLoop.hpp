#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "../db/RedisStore.hpp"
#include "../commands/CommandHandler.hpp"
#include "../types/ReplySink.hpp"

/**
 * Single-threaded poll(2) reactor.
 *
 * Every connection keeps an input buffer (frames may be split or
 * pipelined) and an output buffer. A connection whose command blocked
 * is parked: its bytes keep being read, but no further frame is
 * dispatched until the deferred reply arrives through deliver().
 *
 * Each iteration:
 *   1. poll with a timeout equal to the delay until the next timer
 *   2. accept / read / write ready sockets
 *   3. fire due timers (expiry, blocking timeouts)
 *   4. resume connections that received a deferred reply
 */
class EventLoop : public ReplySink {
    struct Connection {
        int fd;
        std::string in;
        std::string out;
        bool blocked = false;
        bool closing = false;
    };

    int server_fd;
    std::unordered_map<int, Connection> connections;
    std::vector<int> resumed;

    RedisStore str;
    CommandHandler handler;

    void acceptClients();
    void readFrom(Connection& conn);
    void processInput(Connection& conn);
    void flush(Connection& conn);
    void markClosing(Connection& conn);
    void resumeParked();
    void closeFinished();

public:
    // A negative serverFd runs the loop without a listening socket;
    // connections are then added with adopt().
    explicit EventLoop(int serverFd);
    ~EventLoop() override;

    // Returns only on a fatal poll() failure.
    void run();

    // A single iteration with an explicit poll timeout.
    bool pollOnce(int timeout_ms);

    // 0 if parked connections are waiting to resume, -1 if no timer is
    // pending, otherwise the delay until the next deadline.
    int pollTimeout() const;

    // Registers an already connected, non-blocking socket. The loop
    // closes it when the peer goes away or the loop is destroyed.
    void adopt(int fd);
    std::size_t connectionCount() const;

    void deliver(int client_fd, const std::string& payload) override;
};
