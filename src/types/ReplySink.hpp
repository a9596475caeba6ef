#pragma once
#include <string>

/**
 * Destination for replies that are produced outside the request that
 * caused them: a blocked BLPOP woken by another client's RPUSH, or a
 * blocking timeout fired by the timer loop.
 *
 * The event loop implements this by queueing `payload` on the
 * connection and resuming it; tests record the deliveries.
 */
class ReplySink {
public:
    virtual ~ReplySink() = default;
    virtual void deliver(int client_fd, const std::string& payload) = 0;
};
